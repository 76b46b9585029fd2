#include "saffron/search/hybrid_searcher.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <future>
#include <limits>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>

#include "saffron/filter_eval.hpp"
#include "saffron/log.hpp"

namespace saffron::search {

namespace {

constexpr std::string_view COMPONENT = "search.hybrid";

using DenseOutcome = std::expected<std::vector<DenseMatch>, core::error>;

auto is_blank(std::string_view s) noexcept -> bool {
    return std::all_of(s.begin(), s.end(), [](char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    });
}

auto check_n_results(int n_results) -> std::expected<void, core::error> {
    if (n_results <= 0) {
        return core::make_unexpected(core::error_code::invalid_argument,
                                     "n_results must be positive, got " + std::to_string(n_results),
                                     std::string(COMPONENT));
    }
    return {};
}

auto valid_weight(float w) noexcept -> bool {
    return std::isfinite(w) && w >= 0.0f;
}

// n * factor, saturated to the uint32 range.
auto candidate_count(int n_results, std::uint32_t factor) noexcept -> std::uint32_t {
    const std::uint64_t want = static_cast<std::uint64_t>(n_results) * std::max<std::uint32_t>(factor, 1);
    return static_cast<std::uint32_t>(std::min<std::uint64_t>(want, std::numeric_limits<std::uint32_t>::max()));
}

// Dense calls alive at any moment, including ones a request has stopped
// waiting for. Shared with the tasks so it outlives the searcher.
class DenseSlots {
public:
    auto try_acquire(std::uint32_t cap) -> bool {
        std::lock_guard lock(mutex_);
        if (in_flight_.load() >= cap) {
            return false;
        }
        in_flight_.fetch_add(1);
        return true;
    }

    auto release() -> void {
        {
            std::lock_guard lock(mutex_);
            in_flight_.fetch_sub(1);
        }
        drained_.notify_all();
    }

    auto in_flight() const noexcept -> std::uint32_t { return in_flight_.load(); }

    /** Wait until no call is running; false when the deadline passes first. */
    auto wait_drained(std::chrono::milliseconds timeout) -> bool {
        std::unique_lock lock(mutex_);
        return drained_.wait_for(lock, timeout, [this] { return in_flight_.load() == 0; });
    }

private:
    std::mutex mutex_;
    std::condition_variable drained_;
    std::atomic<std::uint32_t> in_flight_{0};
};

// Returns a slot when the task body finishes, before the future becomes ready.
struct SlotRelease {
    std::shared_ptr<DenseSlots> slots;
    ~SlotRelease() { slots->release(); }
};

} // anonymous namespace

// HybridSearcher::Impl class definition
class HybridSearcher::Impl {
public:
    Impl(SearchConfig config,
         std::shared_ptr<index::SparseIndex> sparse_index,
         std::shared_ptr<DenseRetriever> dense_retriever,
         std::shared_ptr<store::DocumentStore> document_store)
        : config_(std::move(config))
        , sparse_(std::move(sparse_index))
        , dense_(std::move(dense_retriever))
        , store_(std::move(document_store))
        , rrf_(config_.rrf_k) {
    }

    // Abandoned dense calls get one more dense_timeout to finish; anything
    // still running after that keeps only shared ownership of the retriever
    // and slot counter.
    ~Impl() {
        if (!slots_->wait_drained(config_.dense_timeout)) {
            log::logger()->warn("{} dense retrieval call(s) still running at shutdown",
                                slots_->in_flight());
        }
    }

    auto hybrid_search(std::string_view query, int n_results,
                       const filter::RecipeFilter* filter,
                       float sparse_weight, float dense_weight)
        -> std::expected<std::vector<HybridResult>, core::error>;

    auto sparse_search(std::string_view query, int n_results, const filter::RecipeFilter* filter)
        -> std::expected<std::vector<index::SparseMatch>, core::error>;

    auto dense_search(std::string_view query, int n_results, const filter::RecipeFilter* filter)
        -> std::expected<std::vector<DenseMatch>, core::error>;

    auto get_stats() const noexcept -> HybridSearchStats;

    auto config() const noexcept -> const SearchConfig& { return config_; }

private:
    struct Counters {
        std::atomic<std::uint64_t> total_queries{0};
        std::atomic<std::uint64_t> sparse_failures{0};
        std::atomic<std::uint64_t> dense_failures{0};
        std::atomic<std::uint64_t> dense_timeouts{0};
        std::atomic<std::uint64_t> dense_rejected{0};
        std::atomic<std::uint64_t> degraded_queries{0};
        std::atomic<std::uint64_t> total_failures{0};
        std::atomic<std::uint64_t> total_latency_us{0};
    };

    SearchConfig config_;
    std::shared_ptr<index::SparseIndex> sparse_;
    std::shared_ptr<DenseRetriever> dense_;
    std::shared_ptr<store::DocumentStore> store_;
    fusion::ReciprocalRankFusion rrf_;
    std::shared_ptr<DenseSlots> slots_ = std::make_shared<DenseSlots>();
    mutable Counters stats_;

    // Helper functions
    auto execute_sparse_search(std::string_view query, std::uint32_t top_n)
        -> std::expected<std::vector<index::SparseMatch>, core::error>;

    auto launch_dense_search(std::string_view query, std::uint32_t top_n)
        -> std::expected<std::future<DenseOutcome>, core::error>;

    auto await_dense(std::future<DenseOutcome>& future) -> DenseOutcome;

    auto lookup_metadata(const std::string& id) -> std::optional<RecipeMetadata>;
};

// HybridSearcher implementation

HybridSearcher::HybridSearcher(SearchConfig config,
                               std::shared_ptr<index::SparseIndex> sparse_index,
                               std::shared_ptr<DenseRetriever> dense_retriever,
                               std::shared_ptr<store::DocumentStore> document_store)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(sparse_index),
                                   std::move(dense_retriever), std::move(document_store))) {
}

HybridSearcher::~HybridSearcher() = default;

auto HybridSearcher::hybrid_search(std::string_view query, int n_results,
                                   const filter::RecipeFilter* filter,
                                   float sparse_weight, float dense_weight)
    -> std::expected<std::vector<HybridResult>, core::error> {
    return impl_->hybrid_search(query, n_results, filter, sparse_weight, dense_weight);
}

auto HybridSearcher::hybrid_search(std::string_view query, int n_results,
                                   const filter::RecipeFilter* filter)
    -> std::expected<std::vector<HybridResult>, core::error> {
    const auto& cfg = impl_->config();
    return impl_->hybrid_search(query, n_results, filter, cfg.sparse_weight, cfg.dense_weight);
}

auto HybridSearcher::sparse_search(std::string_view query, int n_results,
                                   const filter::RecipeFilter* filter)
    -> std::expected<std::vector<index::SparseMatch>, core::error> {
    return impl_->sparse_search(query, n_results, filter);
}

auto HybridSearcher::dense_search(std::string_view query, int n_results,
                                  const filter::RecipeFilter* filter)
    -> std::expected<std::vector<DenseMatch>, core::error> {
    return impl_->dense_search(query, n_results, filter);
}

auto HybridSearcher::get_stats() const noexcept -> HybridSearchStats {
    return impl_->get_stats();
}

auto HybridSearcher::config() const noexcept -> const SearchConfig& {
    return impl_->config();
}

// HybridSearcher::Impl implementation

auto HybridSearcher::Impl::execute_sparse_search(std::string_view query, std::uint32_t top_n)
    -> std::expected<std::vector<index::SparseMatch>, core::error> {
    if (!sparse_) {
        return core::make_unexpected(core::error_code::not_initialized,
                                     "No sparse index configured", std::string(COMPONENT));
    }
    if (!sparse_->is_built()) {
        return core::make_unexpected(core::error_code::unavailable,
                                     "Sparse index has not been built", std::string(COMPONENT));
    }
    try {
        return sparse_->search(query, top_n);
    } catch (const std::exception& e) {
        log::logger()->warn("Sparse search failed: {}", e.what());
        return core::make_unexpected(core::error_code::retrieval_failed,
                                     "Sparse retrieval failed", std::string(COMPONENT));
    }
}

auto HybridSearcher::Impl::launch_dense_search(std::string_view query, std::uint32_t top_n)
    -> std::expected<std::future<DenseOutcome>, core::error> {
    if (!dense_) {
        return core::make_unexpected(core::error_code::not_initialized,
                                     "No dense retriever configured", std::string(COMPONENT));
    }

    if (!slots_->try_acquire(config_.max_inflight_dense)) {
        stats_.dense_rejected.fetch_add(1);
        log::logger()->warn("Dense retrieval skipped: {} calls already in flight",
                            config_.max_inflight_dense);
        return core::make_unexpected(core::error_code::retrieval_failed,
                                     "Too many dense retrieval calls in flight",
                                     std::string(COMPONENT));
    }

    // The task owns its inputs and a reference to the retriever, so an
    // abandoned call can finish after this request has returned.
    std::packaged_task<DenseOutcome()> task(
        [retriever = dense_, slots = slots_, text = std::string(query), top_n,
         min_similarity = config_.min_similarity]() {
            SlotRelease release{slots};
            return retriever->search(text, top_n, min_similarity);
        });
    auto future = task.get_future();
    try {
        std::thread(std::move(task)).detach();
    } catch (const std::system_error& e) {
        slots_->release();
        log::logger()->warn("Could not start dense retrieval thread: {}", e.what());
        return core::make_unexpected(core::error_code::retrieval_failed,
                                     "Dense retrieval could not be started", std::string(COMPONENT));
    }
    return future;
}

auto HybridSearcher::Impl::await_dense(std::future<DenseOutcome>& future) -> DenseOutcome {
    if (future.wait_for(config_.dense_timeout) != std::future_status::ready) {
        return core::make_unexpected(core::error_code::timed_out,
                                     "Dense retrieval exceeded " +
                                         std::to_string(config_.dense_timeout.count()) + " ms",
                                     std::string(COMPONENT));
    }
    return future.get();
}

auto HybridSearcher::Impl::lookup_metadata(const std::string& id) -> std::optional<RecipeMetadata> {
    if (!store_) {
        return std::nullopt;
    }
    auto metadata = store_->get_document_metadata(id);
    if (!metadata) {
        log::logger()->warn("Metadata lookup for '{}' failed: {}", id, metadata.error().message);
        return std::nullopt;
    }
    return std::move(*metadata);
}

auto HybridSearcher::Impl::hybrid_search(std::string_view query, int n_results,
                                         const filter::RecipeFilter* filter,
                                         float sparse_weight, float dense_weight)
    -> std::expected<std::vector<HybridResult>, core::error> {

    if (auto ok = check_n_results(n_results); !ok) {
        return std::unexpected(ok.error());
    }
    if (!valid_weight(sparse_weight) || !valid_weight(dense_weight)) {
        return core::make_unexpected(core::error_code::invalid_argument,
                                     "Fusion weights must be finite and non-negative",
                                     std::string(COMPONENT));
    }
    if (!(rrf_.k() > 0.0f)) {
        return core::make_unexpected(core::error_code::invalid_argument,
                                     "RRF k must be positive", std::string(COMPONENT));
    }
    if (is_blank(query)) {
        return std::vector<HybridResult>{};
    }
    if (!config_.hybrid_enabled) {
        log::logger()->info("Hybrid search disabled; returning no results for '{}'", query);
        return std::vector<HybridResult>{};
    }

    auto start_time = std::chrono::steady_clock::now();
    const std::uint32_t candidates = candidate_count(n_results, config_.oversample_factor);

    // Dense runs on its own thread while sparse runs here.
    auto dense_future = launch_dense_search(query, candidates);
    auto sparse_result = execute_sparse_search(query, candidates);

    DenseOutcome dense_result = dense_future
        ? await_dense(*dense_future)
        : DenseOutcome(std::unexpected(dense_future.error()));

    stats_.total_queries.fetch_add(1);

    // An unbuilt index answers empty; it only counts as a failed path when
    // dense has nothing either.
    const bool sparse_unbuilt =
        !sparse_result && sparse_result.error().code == core::error_code::unavailable;
    if (sparse_unbuilt && dense_result) {
        log::logger()->debug("Sparse index not built; answering '{}' from dense only", query);
        sparse_result = std::vector<index::SparseMatch>{};
    }

    if (!sparse_result) {
        stats_.sparse_failures.fetch_add(1);
        log::logger()->warn("Sparse retrieval failed ({}): {}",
                            core::to_string(sparse_result.error().code),
                            sparse_result.error().message);
    }
    if (!dense_result) {
        if (dense_result.error().code == core::error_code::timed_out) {
            stats_.dense_timeouts.fetch_add(1);
        } else {
            stats_.dense_failures.fetch_add(1);
        }
        log::logger()->warn("Dense retrieval failed ({}): {}",
                            core::to_string(dense_result.error().code),
                            dense_result.error().message);
    }

    if (!sparse_result && !dense_result) {
        stats_.total_failures.fetch_add(1);
        log::logger()->error("Both retrieval paths failed for query '{}'", query);
        return core::make_unexpected(core::error_code::all_retrieval_failed,
                                     "Both sparse and dense retrieval failed",
                                     std::string(COMPONENT));
    }
    if (!sparse_result || !dense_result) {
        stats_.degraded_queries.fetch_add(1);
    }

    const std::vector<index::SparseMatch> no_sparse;
    const std::vector<DenseMatch> no_dense;
    const auto& sparse_hits = sparse_result ? *sparse_result : no_sparse;
    const auto& dense_hits = dense_result ? *dense_result : no_dense;

    auto fused = rrf_.fuse(sparse_hits, dense_hits, sparse_weight, dense_weight,
                           sparse_hits.size() + dense_hits.size());

    const bool filtering = filter != nullptr && filter->has_filters();
    const auto limit = static_cast<std::size_t>(n_results);

    std::vector<HybridResult> results;
    results.reserve(std::min(limit, fused.size()));
    for (auto& candidate : fused) {
        if (results.size() >= limit) {
            break;
        }
        if (!candidate.metadata) {
            candidate.metadata = lookup_metadata(candidate.id);
        }
        if (filtering && !filter_eval::passes(candidate.metadata, *filter)) {
            continue;
        }
        results.push_back(std::move(candidate));
    }

    auto latency = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start_time);
    stats_.total_latency_us.fetch_add(static_cast<std::uint64_t>(latency.count()));

    log::logger()->debug("Hybrid search '{}': {} sparse, {} dense, {} fused, {} returned ({} us)",
                         query, sparse_hits.size(), dense_hits.size(), fused.size(),
                         results.size(), latency.count());
    return results;
}

auto HybridSearcher::Impl::sparse_search(std::string_view query, int n_results,
                                         const filter::RecipeFilter* filter)
    -> std::expected<std::vector<index::SparseMatch>, core::error> {

    if (auto ok = check_n_results(n_results); !ok) {
        return std::unexpected(ok.error());
    }
    if (is_blank(query)) {
        return std::vector<index::SparseMatch>{};
    }

    const bool filtering = filter != nullptr && filter->has_filters();
    const std::uint32_t candidates = filtering
        ? candidate_count(n_results, config_.oversample_factor)
        : static_cast<std::uint32_t>(n_results);

    auto hits = execute_sparse_search(query, candidates);
    if (!hits && hits.error().code == core::error_code::unavailable) {
        log::logger()->debug("Sparse index queried before first build; returning no matches");
        return std::vector<index::SparseMatch>{};
    }
    if (!hits) {
        return std::unexpected(hits.error());
    }
    if (filtering) {
        *hits = filter_eval::apply<index::SparseMatch>(
            std::move(*hits), *filter,
            [this](const index::SparseMatch& m) { return lookup_metadata(m.id); });
    }
    if (hits->size() > static_cast<std::size_t>(n_results)) {
        hits->resize(static_cast<std::size_t>(n_results));
    }
    return hits;
}

auto HybridSearcher::Impl::dense_search(std::string_view query, int n_results,
                                        const filter::RecipeFilter* filter)
    -> std::expected<std::vector<DenseMatch>, core::error> {

    if (auto ok = check_n_results(n_results); !ok) {
        return std::unexpected(ok.error());
    }
    if (is_blank(query)) {
        return std::vector<DenseMatch>{};
    }

    const bool filtering = filter != nullptr && filter->has_filters();
    const std::uint32_t candidates = filtering
        ? candidate_count(n_results, config_.oversample_factor)
        : static_cast<std::uint32_t>(n_results);

    auto future = launch_dense_search(query, candidates);
    if (!future) {
        stats_.dense_failures.fetch_add(1);
        return std::unexpected(future.error());
    }
    auto hits = await_dense(*future);
    if (!hits) {
        if (hits.error().code == core::error_code::timed_out) {
            stats_.dense_timeouts.fetch_add(1);
        } else {
            stats_.dense_failures.fetch_add(1);
        }
        return std::unexpected(hits.error());
    }
    if (filtering) {
        *hits = filter_eval::apply<DenseMatch>(
            std::move(*hits), *filter,
            [this](const DenseMatch& m) {
                return m.metadata ? m.metadata : lookup_metadata(m.id);
            });
    }
    if (hits->size() > static_cast<std::size_t>(n_results)) {
        hits->resize(static_cast<std::size_t>(n_results));
    }
    return hits;
}

auto HybridSearcher::Impl::get_stats() const noexcept -> HybridSearchStats {
    HybridSearchStats s;
    s.total_queries = stats_.total_queries.load();
    s.sparse_failures = stats_.sparse_failures.load();
    s.dense_failures = stats_.dense_failures.load();
    s.dense_timeouts = stats_.dense_timeouts.load();
    s.dense_rejected = stats_.dense_rejected.load();
    s.dense_in_flight = slots_->in_flight();
    s.degraded_queries = stats_.degraded_queries.load();
    s.total_failures = stats_.total_failures.load();
    s.total_latency_us = stats_.total_latency_us.load();
    return s;
}

} // namespace saffron::search
