#pragma once

/** \file sparse_index.hpp
 *  \brief Rebuildable lexical index with atomic snapshot publication.
 *
 * The sparse index is a derived cache of the document set. `rebuild()` builds a
 * complete BM25Index off to the side and publishes it with a single atomic
 * pointer swap, so in-flight queries keep reading the snapshot they started
 * with and never observe a half-built index. A failed rebuild leaves the
 * previous snapshot live.
 *
 * Thread-safety: search() is safe concurrently with rebuild() and never waits
 * for a build to finish.
 * Concurrent rebuild() calls are serialized.
 */

#include <atomic>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

#include "saffron/error.hpp"
#include "saffron/index/bm25.hpp"
#include "saffron/index/tokenizer.hpp"
#include "saffron/recipe.hpp"

namespace saffron::store {
class DocumentStore;
}

namespace saffron::index {

/** \brief Snapshot statistics of the published index. */
struct SparseIndexStats {
    bool built{false};                 /**< A build has succeeded at least once */
    std::uint64_t generation{0};       /**< Number of successful builds */
    BM25Stats bm25;                    /**< Statistics of the live snapshot */
};

class SparseIndex {
public:
    SparseIndex(const TokenizerOptions& tokenizer_options, const BM25Params& params);
    SparseIndex() : SparseIndex(TokenizerOptions{}, BM25Params{}) {}

    SparseIndex(const SparseIndex&) = delete;
    SparseIndex& operator=(const SparseIndex&) = delete;

    /** \brief Tokenize all documents and publish a fresh index.
     *
     * \return Success, or the build error (previous snapshot untouched)
     * Complexity: O(N * avg_doc_length)
     */
    auto rebuild(const std::vector<Document>& documents) -> std::expected<void, core::error>;

    /** \brief Rebuild from the document store's full document set. */
    auto rebuild_from(store::DocumentStore& store) -> std::expected<void, core::error>;

    /** \brief Rank documents against a free-text query.
     *
     * A never-built index yields an empty result, as does a query that
     * tokenizes to zero keywords.
     */
    auto search(std::string_view query, std::uint32_t top_n) const -> std::vector<SparseMatch>;

    /** \brief Current snapshot (nullptr before the first successful build). */
    auto snapshot() const -> std::shared_ptr<const BM25Index>;

    auto is_built() const -> bool { return snapshot() != nullptr; }

    auto stats() const -> SparseIndexStats;

    auto tokenizer() const noexcept -> const Tokenizer& { return tokenizer_; }

private:
    Tokenizer tokenizer_;
    BM25Params params_;
    std::atomic<std::shared_ptr<const BM25Index>> current_;
    std::atomic<std::uint64_t> generation_{0};
    std::mutex rebuild_mutex_;
};

} // namespace saffron::index
