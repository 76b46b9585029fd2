#pragma once

/** \file hybrid_searcher.hpp
 *  \brief Hybrid recipe search combining BM25 and dense retrieval.
 *
 * Request flow for hybrid_search():
 *  1. validate arguments; a blank query returns an empty result without
 *     touching either retrieval path
 *  2. dense retrieval on its own thread (bounded by dense_timeout) while the
 *     sparse query runs on the caller thread, each asking for
 *     n_results * oversample_factor candidates
 *  3. weighted RRF over the full candidate lists
 *  4. metadata attached and the filter applied in rank order
 *  5. truncation to n_results
 *
 * A failed or timed-out path is logged, counted and treated as empty; only
 * when both fail does the call return all_retrieval_failed. A sparse index
 * that was never built answers empty, unless dense fails too.
 *
 * Each dense call runs on its own detached thread. At most
 * max_inflight_dense of them are alive at once, counting calls that timed
 * out and are still finishing; past that the dense path fails fast with
 * retrieval_failed. The destructor waits up to dense_timeout for running
 * calls; stragglers hold only shared state and their results are dropped.
 *
 * Thread-safety: all search operations are thread-safe.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <string_view>
#include <vector>

#include "saffron/config.hpp"
#include "saffron/error.hpp"
#include "saffron/filter/recipe_filter.hpp"
#include "saffron/index/bm25.hpp"
#include "saffron/index/sparse_index.hpp"
#include "saffron/search/dense_retriever.hpp"
#include "saffron/search/fusion_algorithms.hpp"
#include "saffron/store/document_store.hpp"

namespace saffron::search {

using HybridResult = fusion::FusedResult;

/** \brief Snapshot of the searcher counters. */
struct HybridSearchStats {
    std::uint64_t total_queries{0};     /**< hybrid_search calls that ran retrieval */
    std::uint64_t sparse_failures{0};   /**< Sparse path errors */
    std::uint64_t dense_failures{0};    /**< Dense path errors (timeouts excluded) */
    std::uint64_t dense_timeouts{0};    /**< Dense calls abandoned after dense_timeout */
    std::uint64_t dense_rejected{0};    /**< Dense calls refused at max_inflight_dense (also counted as failures) */
    std::uint64_t dense_in_flight{0};   /**< Dense calls running now, abandoned ones included */
    std::uint64_t degraded_queries{0};  /**< Queries answered from a single path */
    std::uint64_t total_failures{0};    /**< Queries where both paths failed */
    std::uint64_t total_latency_us{0};  /**< Cumulative hybrid_search latency */
};

/** \brief Hybrid searcher over a sparse index, a dense retriever and a document store.
 *
 * Example usage:
 * ```cpp
 * auto sparse = std::make_shared<index::SparseIndex>(cfg.tokenizer, cfg.bm25);
 * sparse->rebuild_from(*store);
 * HybridSearcher searcher(cfg, sparse, std::make_shared<DenseRetriever>(backend), store);
 *
 * auto filter = filter::RecipeFilter::create({.difficulty = "beginner"});
 * auto results = searcher.hybrid_search("chicken curry", 5, &*filter);
 * ```
 */
class HybridSearcher {
public:
    HybridSearcher(SearchConfig config,
                   std::shared_ptr<index::SparseIndex> sparse_index,
                   std::shared_ptr<DenseRetriever> dense_retriever,
                   std::shared_ptr<store::DocumentStore> document_store);
    ~HybridSearcher();

    HybridSearcher(const HybridSearcher&) = delete;
    HybridSearcher& operator=(const HybridSearcher&) = delete;

    /** \brief Hybrid search with explicit fusion weights.
     *
     * \param query Free-text query
     * \param n_results Number of results wanted (must be > 0)
     * \param filter Optional metadata filter (nullptr = none)
     * \param sparse_weight Weight of the BM25 ranking (finite, >= 0)
     * \param dense_weight Weight of the dense ranking (finite, >= 0)
     * \return At most n_results fused results passing the filter, best first;
     *         invalid_argument or all_retrieval_failed on error
     */
    auto hybrid_search(std::string_view query, int n_results,
                       const filter::RecipeFilter* filter,
                       float sparse_weight, float dense_weight)
        -> std::expected<std::vector<HybridResult>, core::error>;

    /** \brief Hybrid search with the configured default weights. */
    auto hybrid_search(std::string_view query, int n_results,
                       const filter::RecipeFilter* filter = nullptr)
        -> std::expected<std::vector<HybridResult>, core::error>;

    /** \brief BM25-only search, filtered and truncated. */
    auto sparse_search(std::string_view query, int n_results,
                       const filter::RecipeFilter* filter = nullptr)
        -> std::expected<std::vector<index::SparseMatch>, core::error>;

    /** \brief Dense-only search, filtered and truncated.
     *
     * Retrieval failures (including timeouts) are returned to the caller.
     */
    auto dense_search(std::string_view query, int n_results,
                      const filter::RecipeFilter* filter = nullptr)
        -> std::expected<std::vector<DenseMatch>, core::error>;

    /** \brief Get search statistics. */
    auto get_stats() const noexcept -> HybridSearchStats;

    auto config() const noexcept -> const SearchConfig&;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace saffron::search
