#pragma once

/** \file embedding_backend.hpp
 *  \brief In-process DenseBackend: an Embedder plus an in-memory cosine table.
 *
 * Production deployments talk to an external embedding service and vector
 * store through their own DenseBackend. This backend keeps the same contract
 * inside the process, which the demo tool and tests rely on.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "saffron/error.hpp"
#include "saffron/recipe.hpp"
#include "saffron/search/dense_retriever.hpp"

namespace saffron::search {

using Embedding = std::vector<float>;

/** \brief Abstract embedding provider. */
class Embedder {
public:
    virtual ~Embedder() = default;

    /** \brief Compute the embedding of a text. */
    virtual auto embed(std::string_view text) -> std::expected<Embedding, core::error> = 0;

    /** \brief Dimensionality of the embedding vectors. */
    virtual auto dimensions() const -> std::uint32_t = 0;

    /** \brief Human-readable name (e.g. "hashing"). */
    virtual auto name() const -> std::string = 0;
};

/** \brief Deterministic offline embedder using feature hashing of keywords.
 *
 * Each keyword (tokenized like the sparse index) increments one bucket chosen
 * by a stable FNV-1a hash; the result is L2-normalised. Texts sharing keywords
 * get a positive cosine similarity.
 */
class HashingEmbedder final : public Embedder {
public:
    explicit HashingEmbedder(std::uint32_t dimensions = 256);

    auto embed(std::string_view text) -> std::expected<Embedding, core::error> override;
    auto dimensions() const -> std::uint32_t override { return dimensions_; }
    auto name() const -> std::string override { return "hashing"; }

private:
    std::uint32_t dimensions_;
};

/** \brief Text used to embed a recipe: labelled title, difficulty, times, servings,
 *  ingredients and instructions, one per line.
 */
auto recipe_embedding_text(const Document& doc) -> std::string;

/** \brief DenseBackend over an Embedder and an in-memory vector table. */
class EmbeddingVectorBackend final : public DenseBackend {
public:
    explicit EmbeddingVectorBackend(std::shared_ptr<Embedder> embedder);

    auto embed_and_search(std::string_view query_text, std::uint32_t top_n, float min_similarity)
        -> std::expected<std::vector<DenseMatch>, core::error> override;

    auto name() const -> std::string override;

    /** \brief Embed and store a document (replaces an existing id). */
    auto upsert(const Document& doc) -> std::expected<void, core::error>;

    /** \brief Upsert every document, stopping at the first failure. */
    auto upsert_all(const std::vector<Document>& docs) -> std::expected<void, core::error>;

    auto remove(std::string_view id) -> bool;
    auto size() const -> std::size_t;
    auto clear() -> void;

private:
    struct Entry {
        std::string id;
        Embedding embedding;
        RecipeMetadata metadata;
    };

    std::shared_ptr<Embedder> embedder_;
    mutable std::shared_mutex mutex_;
    std::vector<Entry> entries_;
    std::unordered_map<std::string, std::size_t> positions_;
};

} // namespace saffron::search
