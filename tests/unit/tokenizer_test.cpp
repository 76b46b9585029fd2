/** \file tokenizer_test.cpp
 *  \brief Unit tests for the recipe keyword tokenizer.
 */

#include <catch2/catch_test_macros.hpp>

#include "saffron/index/tokenizer.hpp"
#include "tests/support/recipe_fixtures.hpp"

using saffron::index::Tokenizer;
using saffron::index::TokenizerOptions;
using Strings = std::vector<std::string>;

TEST_CASE("tokenize lowercases and splits on non-alphanumerics", "[tokenizer]") {
    REQUIRE(Tokenizer::tokenize("Chicken, Fried-Rice!") == Strings{"chicken", "fried", "rice"});
    REQUIRE(Tokenizer::tokenize("  2 cups  rice\t") == Strings{"2", "cups", "rice"});
    REQUIRE(Tokenizer::tokenize("").empty());
    REQUIRE(Tokenizer::tokenize("--- ...").empty());

    SECTION("non-ASCII bytes are separators") {
        REQUIRE(Tokenizer::tokenize("cr\xC3\xA8me br\xC3\xBBl\xC3\xA9") == Strings{"cr", "me", "br", "l"});
    }
}

TEST_CASE("filter_keywords drops short tokens and stopwords", "[tokenizer]") {
    const auto& stop = Tokenizer::cooking_stopwords();
    auto kept = Tokenizer::filter_keywords({"add", "a", "x", "the", "chicken", "to", "pan", "then", "stir"}, 2, stop);
    REQUIRE(kept == Strings{"chicken", "pan", "stir"});

    SECTION("min_length is configurable") {
        auto longer = Tokenizer::filter_keywords({"egg", "rice", "oil"}, 4, Tokenizer::stopword_set{});
        REQUIRE(longer == Strings{"rice"});
    }

    SECTION("duplicates are retained") {
        auto dup = Tokenizer::filter_keywords({"salt", "salt"}, 2, stop);
        REQUIRE(dup.size() == 2);
    }
}

TEST_CASE("stopword set covers cooking filler words", "[tokenizer]") {
    for (const char* w : {"a", "and", "with", "until", "about", "can", "or", "its"}) {
        REQUIRE(Tokenizer::is_stopword(w));
    }
    REQUIRE_FALSE(Tokenizer::is_stopword("chicken"));
    REQUIRE_FALSE(Tokenizer::is_stopword("curry"));
}

TEST_CASE("keywords honours tokenizer options", "[tokenizer]") {
    Tokenizer defaults;
    REQUIRE(defaults.keywords("Add the chicken to a pan") == Strings{"chicken", "pan"});

    TokenizerOptions no_stop;
    no_stop.stopwords_enabled = false;
    Tokenizer keep_all(no_stop);
    REQUIRE(keep_all.keywords("Add the chicken to a pan") == Strings{"add", "the", "chicken", "to", "pan"});

    REQUIRE(defaults.keywords("the and of").empty());
}

TEST_CASE("document keywords weight the title twice", "[tokenizer]") {
    auto doc = recipe_fixtures::make_doc("r1", "Chicken Curry", {"2 chicken thighs"}, {"Simmer until tender"});
    Tokenizer tok;
    auto kw = tok.document_keywords(doc);
    REQUIRE(kw == Strings{"chicken", "curry", "chicken", "curry", "chicken", "thighs", "simmer", "tender"});
}

TEST_CASE("tokenization is deterministic", "[tokenizer]") {
    Tokenizer tok;
    const std::string text = "Slow-Cooked BEEF stew with Root Vegetables";
    REQUIRE(tok.keywords(text) == tok.keywords(text));
}
