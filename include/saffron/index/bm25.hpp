#pragma once

/** \file bm25.hpp
 *  \brief Immutable BM25 inverted index over tokenized recipe documents.
 *
 * BM25 (Best Matching 25) is a probabilistic relevance ranking function
 * used for information retrieval. This implementation provides:
 * - Inverted index with Roaring bitmap posting lists over document ordinals
 * - Configurable BM25 parameters (k1, b)
 * - Deterministic ranking: ties are broken by document insertion order
 *
 * An index is built once from a full document set and never mutated afterwards;
 * rebuilding produces a new index (see SparseIndex for atomic publication).
 *
 * Thread-safety: a built index is immutable; concurrent searches are safe.
 * Memory: O(V + D*L) where V is vocabulary size, D is documents, L is avg doc length.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <vector>

#include "saffron/error.hpp"

namespace saffron::index {

/** \brief BM25 scoring parameters. */
struct BM25Params {
    float k1{1.5f};              /**< Term frequency saturation parameter (typically 1.2-2.0) */
    float b{0.75f};              /**< Length normalization parameter (0.0-1.0) */
};

/** \brief A document reduced to its keyword sequence (duplicates retained). */
struct TokenizedDocument {
    std::string id;
    std::vector<std::string> tokens;
};

/** \brief One lexical match produced per query. */
struct SparseMatch {
    std::string id;
    float score{0.0f};           /**< BM25 score, >= 0 */

    auto operator==(const SparseMatch&) const -> bool = default;
};

/** \brief BM25 index statistics. */
struct BM25Stats {
    std::size_t num_documents{0};      /**< Total documents indexed */
    std::size_t vocabulary_size{0};    /**< Unique terms in vocabulary */
    std::size_t total_tokens{0};       /**< Total tokens processed */
    float avg_doc_length{0.0f};        /**< Average document length */
};

/** \brief BM25 inverted index for keyword search.
 *
 * Example usage:
 * ```cpp
 * Tokenizer tokenizer;
 * std::vector<TokenizedDocument> docs;
 * for (const auto& doc : recipes) {
 *     docs.push_back({doc.id, tokenizer.document_keywords(doc)});
 * }
 * auto index = BM25Index::build(docs, BM25Params{});
 * auto hits = index->search(tokenizer.keywords("chicken curry"), 10);
 * ```
 */
class BM25Index {
public:
    /** \brief An empty index: every search returns no matches. */
    BM25Index();
    ~BM25Index();
    BM25Index(BM25Index&&) noexcept;
    BM25Index& operator=(BM25Index&&) noexcept;
    BM25Index(const BM25Index&) = delete;
    BM25Index& operator=(const BM25Index&) = delete;

    /** \brief Build an index from a complete document set.
     *
     * \param documents Tokenized documents, in insertion order
     * \param params BM25 parameters
     * \return Built index or error
     *
     * Preconditions: k1 > 0; 0 <= b <= 1; ids non-empty
     * Duplicate ids: the later record replaces the earlier one but keeps its position.
     * Complexity: O(N * avg_doc_length)
     */
    static auto build(const std::vector<TokenizedDocument>& documents,
                      const BM25Params& params = {})
        -> std::expected<BM25Index, core::error>;

    /** \brief Validate BM25 parameters. */
    static auto validate(const BM25Params& params) -> std::expected<void, core::error>;

    /** \brief Rank documents against query keywords.
     *
     * \param query_tokens Query keywords (already tokenized and filtered)
     * \param top_n Maximum number of matches
     * \return Matches sorted by score descending, ties by insertion order
     *
     * Returns an empty vector when the index is empty, the query has no terms,
     * or no document shares a term with the query.
     * Complexity: O(M log top_n) where M is the number of candidate documents
     */
    auto search(const std::vector<std::string>& query_tokens, std::uint32_t top_n) const
        -> std::vector<SparseMatch>;

    /** \brief Get index statistics. */
    auto get_stats() const noexcept -> BM25Stats;

    /** \brief Get total number of indexed documents. */
    auto size() const noexcept -> std::size_t;

    /** \brief Get vocabulary size. */
    auto vocabulary_size() const noexcept -> std::size_t;

    /** \brief Get average document length. */
    auto avg_doc_length() const noexcept -> float;

    auto params() const noexcept -> const BM25Params&;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace saffron::index
