#include "saffron/index/tokenizer.hpp"

namespace saffron::index {

namespace {

// Common English stopwords plus recipe-instruction filler
const Tokenizer::stopword_set COOKING_STOPWORDS = {
    "a", "an", "and", "are", "as", "at", "be", "by", "for", "from", "has", "he",
    "in", "is", "it", "its", "of", "on", "that", "the", "to", "was", "will", "with",
    "add", "then", "into", "over", "until", "about", "all", "also", "can", "or"
};

const Tokenizer::stopword_set NO_STOPWORDS{};

constexpr auto is_ascii_alnum(char c) noexcept -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

constexpr auto ascii_lower(char c) noexcept -> char {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

} // anonymous namespace

auto Tokenizer::tokenize(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> tokens;
    std::string current_token;

    for (char c : text) {
        if (is_ascii_alnum(c)) {
            current_token.push_back(ascii_lower(c));
        } else if (!current_token.empty()) {
            tokens.push_back(std::move(current_token));
            current_token.clear();
        }
    }

    // Handle last token
    if (!current_token.empty()) {
        tokens.push_back(std::move(current_token));
    }

    return tokens;
}

auto Tokenizer::filter_keywords(std::vector<std::string> tokens,
                                std::uint32_t min_length,
                                const stopword_set& stopwords)
    -> std::vector<std::string> {
    std::erase_if(tokens, [&](const std::string& token) {
        return token.size() < min_length || stopwords.contains(token);
    });
    return tokens;
}

auto Tokenizer::cooking_stopwords() -> const stopword_set& {
    return COOKING_STOPWORDS;
}

auto Tokenizer::is_stopword(std::string_view word) -> bool {
    return COOKING_STOPWORDS.contains(word);
}

auto Tokenizer::keywords(std::string_view text) const -> std::vector<std::string> {
    return filter_keywords(tokenize(text), options_.min_length,
                           options_.stopwords_enabled ? COOKING_STOPWORDS : NO_STOPWORDS);
}

auto Tokenizer::document_keywords(const Document& doc) const -> std::vector<std::string> {
    // Title twice to up-weight title matches
    std::string text;
    text.reserve(doc.metadata.title.size() * 2 + 64);
    text += doc.metadata.title;
    text.push_back(' ');
    text += doc.metadata.title;
    for (const auto& ingredient : doc.metadata.ingredients) {
        text.push_back(' ');
        text += ingredient;
    }
    for (const auto& step : doc.metadata.instructions) {
        text.push_back(' ');
        text += step;
    }
    return keywords(text);
}

} // namespace saffron::index
