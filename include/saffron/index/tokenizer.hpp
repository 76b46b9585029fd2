#pragma once

/** \file tokenizer.hpp
 *  \brief Keyword tokenizer shared by index build and query encoding.
 *
 * Pipeline: lowercase ASCII, every byte that is not [a-z0-9] becomes a
 * separator, split, then drop short tokens and cooking-domain stopwords.
 * Pure and locale-independent: identical input always yields identical output.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "saffron/recipe.hpp"

namespace saffron::index {

/** \brief Tokenization options. */
struct TokenizerOptions {
    std::uint32_t min_length{2};  /**< Minimum keyword length kept */
    bool stopwords_enabled{true}; /**< Remove cooking stopwords */
};

/** \brief Recipe keyword tokenizer. */
class Tokenizer {
public:
    using stopword_set = std::unordered_set<std::string_view>;

    Tokenizer() = default;
    explicit Tokenizer(const TokenizerOptions& options) : options_(options) {}

    /** \brief Split text into lowercase alphanumeric tokens (no filtering). */
    static auto tokenize(std::string_view text) -> std::vector<std::string>;

    /** \brief Remove tokens shorter than min_length and tokens in stopwords. */
    static auto filter_keywords(std::vector<std::string> tokens,
                                std::uint32_t min_length,
                                const stopword_set& stopwords)
        -> std::vector<std::string>;

    /** \brief The fixed cooking-domain stopword set. */
    static auto cooking_stopwords() -> const stopword_set&;

    /** \brief Check membership in the cooking stopword set (expects lowercase). */
    static auto is_stopword(std::string_view word) -> bool;

    /** \brief tokenize + filter_keywords with this tokenizer's options.
     *
     * Used for queries.
     */
    auto keywords(std::string_view text) const -> std::vector<std::string>;

    /** \brief Keywords of a document: title twice, then ingredients, then instructions. */
    auto document_keywords(const Document& doc) const -> std::vector<std::string>;

    auto options() const noexcept -> const TokenizerOptions& { return options_; }

private:
    TokenizerOptions options_;
};

} // namespace saffron::index
