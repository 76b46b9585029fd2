/** \file bm25_test.cpp
 *  \brief Unit tests for the BM25 snapshot index.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <algorithm>
#include <cmath>

#include "saffron/index/bm25.hpp"
#include "saffron/index/tokenizer.hpp"
#include "tests/support/recipe_fixtures.hpp"

using namespace saffron::index;
using Catch::Matchers::WithinRel;

namespace {

std::vector<TokenizedDocument> tokenized(const std::vector<saffron::Document>& docs) {
    Tokenizer tok;
    std::vector<TokenizedDocument> out;
    for (const auto& d : docs) out.push_back({d.id, tok.document_keywords(d)});
    return out;
}

BM25Index build_abc() {
    auto idx = BM25Index::build(tokenized(recipe_fixtures::abc_corpus()));
    REQUIRE(idx.has_value());
    return std::move(*idx);
}

std::vector<std::string> ids_of(const std::vector<SparseMatch>& matches) {
    std::vector<std::string> ids;
    for (const auto& m : matches) ids.push_back(m.id);
    return ids;
}

} // namespace

TEST_CASE("BM25 parameters are validated", "[bm25]") {
    REQUIRE(BM25Index::validate({}).has_value());
    REQUIRE_FALSE(BM25Index::validate({0.0f, 0.75f}).has_value());
    REQUIRE_FALSE(BM25Index::validate({-1.0f, 0.75f}).has_value());
    REQUIRE_FALSE(BM25Index::validate({1.2f, 1.5f}).has_value());
    REQUIRE_FALSE(BM25Index::validate({1.2f, -0.1f}).has_value());
    REQUIRE(BM25Index::validate({1.2f, 0.0f}).has_value());
    REQUIRE(BM25Index::validate({1.2f, 1.0f}).has_value());

    auto bad = BM25Index::build(std::vector<TokenizedDocument>{}, BM25Params{0.0f, 0.5f});
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code == saffron::core::error_code::invalid_argument);
}

TEST_CASE("BM25 ranks by term overlap", "[bm25]") {
    auto idx = build_abc();
    Tokenizer tok;

    auto hits = idx.search(tok.keywords("chicken curry"), 10);
    REQUIRE(ids_of(hits) == std::vector<std::string>{"C", "A", "B"});
    for (std::size_t i = 1; i < hits.size(); ++i) {
        REQUIRE(hits[i - 1].score >= hits[i].score);
    }

    SECTION("top_n truncates") {
        REQUIRE(ids_of(idx.search(tok.keywords("chicken curry"), 1)) == std::vector<std::string>{"C"});
        REQUIRE(idx.search(tok.keywords("chicken curry"), 0).empty());
    }

    SECTION("documents without overlap are not returned") {
        auto rice = idx.search(tok.keywords("rice"), 10);
        REQUIRE(ids_of(rice) == std::vector<std::string>{"A"});
        REQUIRE(rice[0].score > 0.0f);
    }

    SECTION("unknown terms and empty queries return nothing") {
        REQUIRE(idx.search(tok.keywords("sushi"), 10).empty());
        REQUIRE(idx.search({}, 10).empty());
    }
}

TEST_CASE("BM25 score matches the reference formula", "[bm25]") {
    // Two documents, one term each; the query term occurs once in one document.
    std::vector<TokenizedDocument> docs{{"x", {"salt", "pepper"}}, {"y", {"sugar", "flour"}}};
    auto idx = BM25Index::build(docs, BM25Params{1.5f, 0.75f});
    REQUIRE(idx.has_value());

    const float N = 2.0f, df = 1.0f, tf = 1.0f, k1 = 1.5f;
    const float idf = std::log(1.0f + (N - df + 0.5f) / (df + 0.5f));
    // doc length equals the average, so the length norm is exactly 1
    const float expected = idf * tf * (k1 + 1.0f) / (tf + k1);

    auto hits = idx->search({"salt"}, 5);
    REQUIRE(hits.size() == 1);
    REQUIRE(hits[0].id == "x");
    REQUIRE_THAT(hits[0].score, WithinRel(expected, 1e-5f));
}

TEST_CASE("BM25 breaks ties by insertion order", "[bm25]") {
    std::vector<TokenizedDocument> docs{
        {"third", {"basil", "tomato"}},
        {"first", {"basil", "garlic"}},
        {"second", {"basil", "onion"}},
    };
    auto idx = BM25Index::build(docs);
    REQUIRE(idx.has_value());
    auto hits = idx->search({"basil"}, 10);
    REQUIRE(ids_of(hits) == std::vector<std::string>{"third", "first", "second"});
}

TEST_CASE("BM25 build handles edge cases", "[bm25]") {
    SECTION("empty corpus") {
        auto idx = BM25Index::build(std::vector<TokenizedDocument>{});
        REQUIRE(idx.has_value());
        REQUIRE(idx->size() == 0);
        REQUIRE(idx->search({"chicken"}, 5).empty());
    }

    SECTION("empty id is rejected") {
        std::vector<TokenizedDocument> docs{{"", {"chicken"}}};
        auto idx = BM25Index::build(docs);
        REQUIRE_FALSE(idx.has_value());
        REQUIRE(idx.error().code == saffron::core::error_code::invalid_argument);
    }

    SECTION("duplicate id keeps the last record in the first position") {
        std::vector<TokenizedDocument> docs{
            {"dup", {"chicken"}},
            {"other", {"beef"}},
            {"dup", {"beef"}},
        };
        auto idx = BM25Index::build(docs);
        REQUIRE(idx.has_value());
        REQUIRE(idx->size() == 2);
        REQUIRE(idx->search({"chicken"}, 5).empty());
        REQUIRE(ids_of(idx->search({"beef"}, 5)) == std::vector<std::string>{"dup", "other"});
    }
}

TEST_CASE("BM25 statistics", "[bm25]") {
    auto idx = build_abc();
    auto stats = idx.get_stats();
    REQUIRE(stats.num_documents == 3);
    REQUIRE(stats.vocabulary_size == idx.vocabulary_size());
    REQUIRE(stats.total_tokens == 25);
    REQUIRE_THAT(idx.avg_doc_length(), WithinRel(25.0f / 3.0f, 1e-5f));
    REQUIRE_THAT(stats.avg_doc_length, WithinRel(25.0f / 3.0f, 1e-5f));
}
