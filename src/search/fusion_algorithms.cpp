#include "saffron/search/fusion_algorithms.hpp"

#include <algorithm>
#include <unordered_map>

namespace saffron::search::fusion {

auto ReciprocalRankFusion::fuse(const std::vector<index::SparseMatch>& sparse_results,
                                const std::vector<DenseMatch>& dense_results,
                                float sparse_weight, float dense_weight,
                                std::size_t n_results) const -> std::vector<FusedResult> {
    // Slots are allocated in first-appearance order, which doubles as the tie-break.
    std::vector<FusedResult> output;
    output.reserve(sparse_results.size() + dense_results.size());
    std::unordered_map<std::string, std::size_t> slot;
    slot.reserve(output.capacity());

    auto slot_for = [&](const std::string& id) -> FusedResult& {
        auto [it, inserted] = slot.try_emplace(id, output.size());
        if (inserted) {
            output.push_back(FusedResult{});
            output.back().id = id;
        }
        return output[it->second];
    };

    for (std::size_t i = 0; i < sparse_results.size(); ++i) {
        const auto& res = sparse_results[i];
        auto& fused = slot_for(res.id);
        if (fused.in_sparse()) {
            continue;
        }
        fused.sparse_score = res.score;
        fused.sparse_rank = static_cast<std::uint32_t>(i + 1);
        fused.rrf_sparse = contribution(sparse_weight, fused.sparse_rank);
    }

    for (std::size_t i = 0; i < dense_results.size(); ++i) {
        const auto& res = dense_results[i];
        auto& fused = slot_for(res.id);
        if (fused.in_dense()) {
            continue;
        }
        fused.dense_score = res.similarity;
        fused.dense_rank = static_cast<std::uint32_t>(i + 1);
        fused.rrf_dense = contribution(dense_weight, fused.dense_rank);
        if (res.metadata) {
            fused.metadata = res.metadata;
        }
    }

    for (auto& result : output) {
        result.combined_score = result.rrf_sparse + result.rrf_dense;
    }

    std::stable_sort(output.begin(), output.end(),
                     [](const FusedResult& a, const FusedResult& b) {
                         return a.combined_score > b.combined_score;
                     });

    if (output.size() > n_results) {
        output.resize(n_results);
    }
    return output;
}

} // namespace saffron::search::fusion
