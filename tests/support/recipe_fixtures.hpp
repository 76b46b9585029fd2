#pragma once

/** \file recipe_fixtures.hpp
 *  \brief Shared recipe corpus and DenseBackend test doubles.
 */

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "saffron/error.hpp"
#include "saffron/recipe.hpp"
#include "saffron/search/dense_retriever.hpp"

namespace recipe_fixtures {

using saffron::Difficulty;
using saffron::Document;
using saffron::RecipeMetadata;
using saffron::search::DenseBackend;
using saffron::search::DenseMatch;

inline Document make_doc(std::string id, std::string title, std::vector<std::string> ingredients,
                         std::vector<std::string> instructions = {},
                         std::optional<Difficulty> difficulty = Difficulty::Intermediate,
                         std::optional<std::int64_t> prep = 15,
                         std::optional<std::int64_t> cook = 30,
                         std::optional<std::int64_t> servings = 4) {
  Document d;
  d.id = std::move(id);
  d.metadata.title = std::move(title);
  d.metadata.ingredients = std::move(ingredients);
  d.metadata.instructions = std::move(instructions);
  d.metadata.difficulty = difficulty;
  d.metadata.prep_time_minutes = prep;
  d.metadata.cook_time_minutes = cook;
  d.metadata.servings = servings;
  return d;
}

// A: "Chicken Fried Rice" (only Beginner), B: "Vegetable Curry", C: "Chicken Curry".
// For the query "chicken curry" BM25 ranks C > A > B.
inline std::vector<Document> abc_corpus() {
  return {
    make_doc("A", "Chicken Fried Rice", {"chicken", "chicken"}, {"Fry"}, Difficulty::Beginner, 10, 15, 2),
    make_doc("B", "Vegetable Curry", {"potato", "curry paste"}, {"Simmer"}, Difficulty::Intermediate, 20, 40, 4),
    make_doc("C", "Chicken Curry", {"chicken", "curry powder"}, {"Simmer"}, Difficulty::Intermediate, 20, 45, 6),
  };
}

/** Returns the same matches for every query, best first. */
class FixedSimilarityBackend final : public DenseBackend {
public:
  explicit FixedSimilarityBackend(std::vector<DenseMatch> matches) : matches_(std::move(matches)) {}

  auto embed_and_search(std::string_view, std::uint32_t top_n, float min_similarity)
      -> std::expected<std::vector<DenseMatch>, saffron::core::error> override {
    calls.fetch_add(1);
    std::vector<DenseMatch> out;
    for (const auto& m : matches_) {
      if (m.similarity >= min_similarity) out.push_back(m);
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const DenseMatch& a, const DenseMatch& b) { return a.similarity > b.similarity; });
    if (out.size() > top_n) out.resize(top_n);
    return out;
  }

  auto name() const -> std::string override { return "fixed"; }

  std::atomic<int> calls{0};

private:
  std::vector<DenseMatch> matches_;
};

/** Similarities A=0.81, B=0.60, C=0.92, without metadata. */
inline std::shared_ptr<FixedSimilarityBackend> abc_dense_backend() {
  return std::make_shared<FixedSimilarityBackend>(std::vector<DenseMatch>{
      {"A", 0.81f, std::nullopt},
      {"B", 0.60f, std::nullopt},
      {"C", 0.92f, std::nullopt},
  });
}

class FailingBackend final : public DenseBackend {
public:
  auto embed_and_search(std::string_view, std::uint32_t, float)
      -> std::expected<std::vector<DenseMatch>, saffron::core::error> override {
    calls.fetch_add(1);
    return saffron::core::make_unexpected(saffron::core::error_code::unavailable,
                                          "embedding service unreachable", "test");
  }

  std::atomic<int> calls{0};
};

class ThrowingBackend final : public DenseBackend {
public:
  auto embed_and_search(std::string_view, std::uint32_t, float)
      -> std::expected<std::vector<DenseMatch>, saffron::core::error> override {
    throw std::runtime_error("connection reset by peer");
  }
};

/** Sleeps before answering; used to exercise the dense timeout. */
class SlowBackend final : public DenseBackend {
public:
  SlowBackend(std::chrono::milliseconds delay, std::vector<DenseMatch> matches)
      : delay_(delay), matches_(std::move(matches)) {}

  auto embed_and_search(std::string_view, std::uint32_t, float)
      -> std::expected<std::vector<DenseMatch>, saffron::core::error> override {
    calls.fetch_add(1);
    std::this_thread::sleep_for(delay_);
    return matches_;
  }

  std::atomic<int> calls{0};

private:
  std::chrono::milliseconds delay_;
  std::vector<DenseMatch> matches_;
};

} // namespace recipe_fixtures
