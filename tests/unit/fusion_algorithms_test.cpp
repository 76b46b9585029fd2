/** \file fusion_algorithms_test.cpp
 *  \brief Unit tests for weighted Reciprocal Rank Fusion.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "saffron/search/fusion_algorithms.hpp"
#include <algorithm>

using namespace saffron::search;
using namespace saffron::search::fusion;
using saffron::index::SparseMatch;
using Catch::Matchers::WithinRel;

namespace {

std::vector<SparseMatch> create_sparse_results() {
    return {{"C", 4.1f}, {"A", 2.7f}, {"B", 1.3f}};
}

std::vector<DenseMatch> create_dense_results() {
    return {{"C", 0.92f, std::nullopt}, {"A", 0.81f, std::nullopt}, {"B", 0.60f, std::nullopt}};
}

std::vector<std::string> ids_of(const std::vector<FusedResult>& results) {
    std::vector<std::string> ids;
    for (const auto& r : results) ids.push_back(r.id);
    return ids;
}

bool are_results_sorted(const std::vector<FusedResult>& results) {
    for (std::size_t i = 1; i < results.size(); ++i) {
        if (results[i-1].combined_score < results[i].combined_score) {
            return false;
        }
    }
    return true;
}

} // namespace

TEST_CASE("Reciprocal Rank Fusion (RRF)", "[fusion]") {
    ReciprocalRankFusion rrf;

    SECTION("Scores follow w / (k + rank)") {
        auto fused = rrf.fuse(create_sparse_results(), create_dense_results(), 0.5f, 0.5f, 10);
        REQUIRE(ids_of(fused) == std::vector<std::string>{"C", "A", "B"});
        REQUIRE(are_results_sorted(fused));

        const auto& c = fused[0];
        REQUIRE(c.sparse_rank == 1);
        REQUIRE(c.dense_rank == 1);
        REQUIRE_THAT(c.rrf_sparse, WithinRel(0.5f / 61.0f, 1e-6f));
        REQUIRE_THAT(c.rrf_dense, WithinRel(0.5f / 61.0f, 1e-6f));
        REQUIRE_THAT(c.combined_score, WithinRel(1.0f / 61.0f, 1e-6f));
        REQUIRE_THAT(c.sparse_score, WithinRel(4.1f, 1e-6f));
        REQUIRE_THAT(c.dense_score, WithinRel(0.92f, 1e-6f));
    }

    SECTION("Custom k parameter") {
        ReciprocalRankFusion rrf_k10(10.0f);
        REQUIRE_THAT(rrf_k10.contribution(1.0f, 1), WithinRel(1.0f / 11.0f, 1e-6f));
        REQUIRE(rrf_k10.contribution(1.0f, 0) == 0.0f);
        REQUIRE(rrf_k10.k() == 10.0f);
    }

    SECTION("Truncates to n_results") {
        auto fused = rrf.fuse(create_sparse_results(), create_dense_results(), 0.5f, 0.5f, 2);
        REQUIRE(ids_of(fused) == std::vector<std::string>{"C", "A"});
        REQUIRE(rrf.fuse(create_sparse_results(), create_dense_results(), 0.5f, 0.5f, 0).empty());
    }

    SECTION("Empty inputs") {
        REQUIRE(rrf.fuse({}, {}, 0.5f, 0.5f, 10).empty());

        auto only_sparse = rrf.fuse(create_sparse_results(), {}, 0.5f, 0.5f, 10);
        REQUIRE(ids_of(only_sparse) == std::vector<std::string>{"C", "A", "B"});
        REQUIRE(only_sparse[0].dense_rank == 0);
        REQUIRE(only_sparse[0].rrf_dense == 0.0f);
    }
}

TEST_CASE("RRF monotonicity", "[fusion]") {
    ReciprocalRankFusion rrf;
    std::vector<SparseMatch> sparse{{"x", 3.0f}, {"y", 2.0f}, {"z", 1.0f}};
    std::vector<DenseMatch> dense{{"z", 0.9f, std::nullopt}, {"y", 0.8f, std::nullopt}};

    auto fused = rrf.fuse(sparse, dense, 0.7f, 0.3f, 10);
    for (const auto& r : fused) {
        if (r.in_sparse() && r.in_dense()) {
            REQUIRE(r.combined_score >= std::max(r.rrf_sparse, r.rrf_dense));
            REQUIRE(r.combined_score > r.rrf_sparse);
            REQUIRE(r.combined_score > r.rrf_dense);
        }
    }
}

TEST_CASE("RRF weights shift the ranking", "[fusion]") {
    ReciprocalRankFusion rrf;
    std::vector<SparseMatch> sparse{{"lex", 5.0f}, {"sem", 1.0f}};
    std::vector<DenseMatch> dense{{"sem", 0.9f, std::nullopt}, {"lex", 0.4f, std::nullopt}};

    REQUIRE(rrf.fuse(sparse, dense, 0.9f, 0.1f, 2)[0].id == "lex");
    REQUIRE(rrf.fuse(sparse, dense, 0.1f, 0.9f, 2)[0].id == "sem");

    SECTION("zero weight removes a list's influence but keeps its documents") {
        auto fused = rrf.fuse(sparse, dense, 0.0f, 1.0f, 10);
        REQUIRE(ids_of(fused) == std::vector<std::string>{"sem", "lex"});
        REQUIRE(fused[0].rrf_sparse == 0.0f);
        REQUIRE(fused[0].sparse_rank == 2);
    }
}

TEST_CASE("RRF ties keep first-appearance order", "[fusion]") {
    ReciprocalRankFusion rrf;
    // p is rank 1 sparse, q is rank 1 dense: equal scores with equal weights
    std::vector<SparseMatch> sparse{{"p", 1.0f}};
    std::vector<DenseMatch> dense{{"q", 0.9f, std::nullopt}};
    REQUIRE(ids_of(rrf.fuse(sparse, dense, 0.5f, 0.5f, 10)) == std::vector<std::string>{"p", "q"});

    // Both dense-only, same weight and distinct ranks: plain rank order
    std::vector<DenseMatch> dense2{{"m", 0.9f, std::nullopt}, {"n", 0.9f, std::nullopt}};
    REQUIRE(ids_of(rrf.fuse({}, dense2, 0.5f, 0.5f, 10)) == std::vector<std::string>{"m", "n"});

    SECTION("deterministic across calls") {
        auto a = rrf.fuse(create_sparse_results(), create_dense_results(), 0.5f, 0.5f, 10);
        auto b = rrf.fuse(create_sparse_results(), create_dense_results(), 0.5f, 0.5f, 10);
        REQUIRE(ids_of(a) == ids_of(b));
    }
}

TEST_CASE("RRF duplicate ids keep their best position", "[fusion]") {
    ReciprocalRankFusion rrf;
    std::vector<SparseMatch> sparse{{"a", 3.0f}, {"b", 2.0f}, {"a", 1.0f}};
    auto fused = rrf.fuse(sparse, {}, 1.0f, 1.0f, 10);
    REQUIRE(fused.size() == 2);
    REQUIRE(fused[0].id == "a");
    REQUIRE(fused[0].sparse_rank == 1);
    REQUIRE_THAT(fused[0].sparse_score, WithinRel(3.0f, 1e-6f));
    REQUIRE(fused[1].sparse_rank == 2);
}

TEST_CASE("RRF carries dense metadata", "[fusion]") {
    ReciprocalRankFusion rrf;
    saffron::RecipeMetadata meta;
    meta.title = "Chicken Curry";
    std::vector<DenseMatch> dense{{"C", 0.9f, meta}};
    std::vector<SparseMatch> sparse{{"C", 2.0f}, {"A", 1.0f}};

    auto fused = rrf.fuse(sparse, dense, 0.5f, 0.5f, 10);
    REQUIRE(fused[0].id == "C");
    REQUIRE(fused[0].metadata.has_value());
    REQUIRE(fused[0].metadata->title == "Chicken Curry");
    REQUIRE_FALSE(fused[1].metadata.has_value());
}
