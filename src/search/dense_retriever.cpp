#include "saffron/search/dense_retriever.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <unordered_set>

#include "saffron/log.hpp"

namespace saffron::search {

DenseRetriever::DenseRetriever(std::shared_ptr<DenseBackend> backend)
    : backend_(std::move(backend)) {}

auto DenseRetriever::search(std::string_view query, std::uint32_t top_n, float min_similarity) const
    -> std::expected<std::vector<DenseMatch>, core::error> {

    if (!backend_) {
        return core::make_unexpected(core::error_code::not_initialized,
                                     "No dense backend configured", "search.dense");
    }
    if (top_n == 0) {
        return std::vector<DenseMatch>{};
    }

    std::expected<std::vector<DenseMatch>, core::error> upstream = std::vector<DenseMatch>{};
    try {
        upstream = backend_->embed_and_search(query, top_n, min_similarity);
    } catch (const std::exception& e) {
        log::logger()->warn("Dense backend '{}' threw: {}", backend_->name(), e.what());
        return core::make_unexpected(core::error_code::retrieval_failed,
                                     "Dense retrieval failed", "search.dense");
    }

    if (!upstream) {
        log::logger()->warn("Dense backend '{}' failed: {} ({})", backend_->name(),
                            upstream.error().message, core::to_string(upstream.error().code));
        return core::make_unexpected(core::error_code::retrieval_failed,
                                     "Dense retrieval failed", "search.dense");
    }

    auto matches = std::move(*upstream);
    for (auto& m : matches) {
        if (std::isnan(m.similarity)) m.similarity = 0.0f;
        m.similarity = std::clamp(m.similarity, 0.0f, 1.0f);
    }
    std::erase_if(matches, [&](const DenseMatch& m) {
        return m.id.empty() || m.similarity < min_similarity;
    });
    std::stable_sort(matches.begin(), matches.end(),
                     [](const DenseMatch& a, const DenseMatch& b) { return a.similarity > b.similarity; });

    // Keep the best entry per id
    std::unordered_set<std::string> seen;
    std::erase_if(matches, [&](const DenseMatch& m) { return !seen.insert(m.id).second; });

    if (matches.size() > top_n) {
        matches.resize(top_n);
    }

    log::logger()->debug("Dense search for '{}' matched {} recipes", query, matches.size());
    return matches;
}

} // namespace saffron::search
