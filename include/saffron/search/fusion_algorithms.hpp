#pragma once

/** \file fusion_algorithms.hpp
 *  \brief Weighted Reciprocal Rank Fusion of sparse and dense result lists.
 *
 * RRF only looks at ranks, so BM25 scores (unbounded) and cosine
 * similarities ([0, 1]) combine without normalisation:
 *
 *   rrf(doc) = w_sparse / (k + rank_sparse) + w_dense / (k + rank_dense)
 *
 * where a term is omitted when the document is absent from that list.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "saffron/index/bm25.hpp"
#include "saffron/recipe.hpp"
#include "saffron/search/dense_retriever.hpp"

namespace saffron::search::fusion {

/** \brief Combined result from both retrieval paths. */
struct FusedResult {
    std::string id;
    float sparse_score{0.0f};     /**< Raw BM25 score (0 if absent) */
    float dense_score{0.0f};      /**< Raw similarity (0 if absent) */
    std::uint32_t sparse_rank{0}; /**< 1-based, 0 if absent */
    std::uint32_t dense_rank{0};  /**< 1-based, 0 if absent */
    float rrf_sparse{0.0f};
    float rrf_dense{0.0f};
    float combined_score{0.0f};
    std::optional<RecipeMetadata> metadata;

    auto in_sparse() const noexcept -> bool { return sparse_rank > 0; }
    auto in_dense() const noexcept -> bool { return dense_rank > 0; }
};

/** \brief Weighted Reciprocal Rank Fusion.
 *
 * Ordering: combined_score descending; ties keep first-appearance order,
 * scanning the sparse list first and then the dense list. The output is
 * therefore a pure function of its inputs.
 */
class ReciprocalRankFusion {
public:
    explicit ReciprocalRankFusion(float k = 60.0f) : k_(k) {}

    /** \brief Fuse two ranked lists.
     *
     * \param sparse_results BM25 matches, best first
     * \param dense_results Dense matches, best first (metadata is carried over)
     * \param sparse_weight Weight of the sparse contribution
     * \param dense_weight Weight of the dense contribution
     * \param n_results Maximum number of results to return
     *
     * A duplicate id inside one list keeps its first (best) position.
     */
    auto fuse(const std::vector<index::SparseMatch>& sparse_results,
              const std::vector<DenseMatch>& dense_results,
              float sparse_weight, float dense_weight,
              std::size_t n_results) const -> std::vector<FusedResult>;

    /** \brief weight / (k + rank) for a 1-based rank; 0 when rank is 0. */
    auto contribution(float weight, std::uint32_t rank) const noexcept -> float {
        if (rank == 0) {
            return 0.0f;
        }
        return weight / (k_ + static_cast<float>(rank));
    }

    auto k() const noexcept -> float { return k_; }

private:
    float k_;
};

} // namespace saffron::search::fusion
