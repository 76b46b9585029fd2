#pragma once

/** \file config.hpp
 *  \brief Search engine configuration.
 *
 * All tunables live in one explicit struct passed to the components at
 * construction. `from_env()` overlays SAFFRON_* environment variables on the
 * defaults; nothing reads the environment after construction.
 */

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>

#include "saffron/error.hpp"
#include "saffron/filter/recipe_filter.hpp"
#include "saffron/index/bm25.hpp"
#include "saffron/index/tokenizer.hpp"

namespace saffron {

/** \brief Configuration for the hybrid search engine. */
struct SearchConfig {
    index::BM25Params bm25;                  /**< SAFFRON_BM25_K1, SAFFRON_BM25_B */
    index::TokenizerOptions tokenizer;       /**< SAFFRON_MIN_KEYWORD_LENGTH, SAFFRON_STOPWORDS_ENABLED */

    float rrf_k{60.0f};                      /**< RRF rank constant (SAFFRON_RRF_K) */
    float sparse_weight{0.5f};               /**< Default sparse weight (SAFFRON_SPARSE_WEIGHT) */
    float dense_weight{0.5f};                /**< Default dense weight (SAFFRON_DENSE_WEIGHT) */
    float min_similarity{0.3f};              /**< Dense threshold (SAFFRON_MIN_SIMILARITY) */
    std::uint32_t oversample_factor{3};      /**< Candidates per path = n * factor (SAFFRON_OVERSAMPLE) */
    std::chrono::milliseconds dense_timeout{2000}; /**< SAFFRON_DENSE_TIMEOUT_MS */
    std::uint32_t max_inflight_dense{16};    /**< Dense calls alive at once, abandoned ones included (SAFFRON_MAX_INFLIGHT_DENSE) */
    bool hybrid_enabled{true};               /**< SAFFRON_HYBRID_ENABLED */
    std::uint32_t default_search_limit{10};  /**< SAFFRON_SEARCH_LIMIT */

    filter::FilterLimits filter_limits;
    std::string log_level{"info"};           /**< SAFFRON_LOG_LEVEL */

    /** \brief Defaults overlaid with SAFFRON_* environment variables.
     *
     * \return Validated config, or config_invalid naming the offending variable
     */
    static auto from_env() -> std::expected<SearchConfig, core::error>;

    /** \brief Check every value is within its accepted range. */
    auto validate() const -> std::expected<void, core::error>;
};

} // namespace saffron
