/** \file document_store_test.cpp
 *  \brief Unit tests for the in-memory document store.
 */

#include <catch2/catch_test_macros.hpp>

#include "saffron/store/document_store.hpp"
#include "tests/support/recipe_fixtures.hpp"

using namespace saffron;
using saffron::store::InMemoryDocumentStore;

TEST_CASE("in-memory store keeps insertion order", "[store]") {
    InMemoryDocumentStore store(recipe_fixtures::abc_corpus());
    REQUIRE(store.size() == 3);

    auto all = store.get_all_documents();
    REQUIRE(all.has_value());
    REQUIRE(all->size() == 3);
    REQUIRE((*all)[0].id == "A");
    REQUIRE((*all)[2].id == "C");
}

TEST_CASE("metadata lookup", "[store]") {
    InMemoryDocumentStore store(recipe_fixtures::abc_corpus());

    auto a = store.get_document_metadata("A");
    REQUIRE(a.has_value());
    REQUIRE(a->has_value());
    REQUIRE((*a)->title == "Chicken Fried Rice");
    REQUIRE((*a)->difficulty == Difficulty::Beginner);

    auto missing = store.get_document_metadata("Z");
    REQUIRE(missing.has_value());
    REQUIRE_FALSE(missing->has_value());
}

TEST_CASE("upsert replaces the whole record in place", "[store]") {
    InMemoryDocumentStore store(recipe_fixtures::abc_corpus());
    REQUIRE(store.upsert(recipe_fixtures::make_doc("B", "Pumpkin Curry", {"pumpkin"})).has_value());
    REQUIRE(store.size() == 3);

    auto all = store.get_all_documents();
    REQUIRE((*all)[1].id == "B");
    REQUIRE((*all)[1].metadata.title == "Pumpkin Curry");
    REQUIRE((*all)[1].metadata.ingredients == std::vector<std::string>{"pumpkin"});

    SECTION("empty ids are rejected") {
        auto bad = store.upsert(recipe_fixtures::make_doc("", "Ghost", {}));
        REQUIRE_FALSE(bad.has_value());
        REQUIRE(bad.error().code == core::error_code::invalid_argument);
        REQUIRE(store.size() == 3);
    }
}

TEST_CASE("remove and clear", "[store]") {
    InMemoryDocumentStore store(recipe_fixtures::abc_corpus());
    REQUIRE(store.remove("A"));
    REQUIRE_FALSE(store.remove("A"));
    REQUIRE(store.size() == 2);

    // Positions shift after removal
    auto c = store.get_document_metadata("C");
    REQUIRE(c->has_value());
    REQUIRE((*c)->title == "Chicken Curry");

    store.clear();
    REQUIRE(store.size() == 0);
    REQUIRE(store.get_all_documents()->empty());
}
