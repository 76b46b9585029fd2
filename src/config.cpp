#include "saffron/config.hpp"

#include <charconv>
#include <cmath>
#include <optional>
#include <string_view>

#include "saffron/core/platform_utils.hpp"
#include "saffron/log.hpp"

namespace saffron {

namespace {

constexpr std::string_view COMPONENT = "config";

auto invalid(std::string message) -> std::unexpected<core::error> {
    return core::make_unexpected(core::error_code::config_invalid, std::move(message),
                                 std::string(COMPONENT));
}

auto malformed(const char* name, const std::string& value) -> std::unexpected<core::error> {
    return invalid(std::string(name) + ": malformed value '" + value + "'");
}

auto parse_float(const std::string& text) -> std::optional<float> {
    float v = 0.0f;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, v);
    if (ec != std::errc{} || ptr != last || !std::isfinite(v)) {
        return std::nullopt;
    }
    return v;
}

auto parse_bool(std::string_view text) -> std::optional<bool> {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) {
        lower.push_back(static_cast<char>(c >= 'A' && c <= 'Z' ? c - 'A' + 'a' : c));
    }
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;
    return std::nullopt;
}

// Apply one float variable if set.
auto overlay_float(const char* name, float& target) -> std::expected<void, core::error> {
    auto value = core::safe_getenv(name);
    if (!value) return {};
    auto parsed = parse_float(*value);
    if (!parsed) return malformed(name, *value);
    target = *parsed;
    return {};
}

auto overlay_uint(const char* name, std::uint32_t& target) -> std::expected<void, core::error> {
    auto value = core::safe_getenv(name);
    if (!value) return {};
    auto parsed = parse_metadata_int(*value);
    if (!parsed || *parsed < 0 || *parsed > static_cast<std::int64_t>(UINT32_MAX)) {
        return malformed(name, *value);
    }
    target = static_cast<std::uint32_t>(*parsed);
    return {};
}

auto overlay_bool(const char* name, bool& target) -> std::expected<void, core::error> {
    auto value = core::safe_getenv(name);
    if (!value) return {};
    auto parsed = parse_bool(*value);
    if (!parsed) return malformed(name, *value);
    target = *parsed;
    return {};
}

} // anonymous namespace

auto SearchConfig::from_env() -> std::expected<SearchConfig, core::error> {
    SearchConfig cfg;

    std::uint32_t timeout_ms = static_cast<std::uint32_t>(cfg.dense_timeout.count());

    for (auto step : {
             overlay_float("SAFFRON_BM25_K1", cfg.bm25.k1),
             overlay_float("SAFFRON_BM25_B", cfg.bm25.b),
             overlay_uint("SAFFRON_MIN_KEYWORD_LENGTH", cfg.tokenizer.min_length),
             overlay_bool("SAFFRON_STOPWORDS_ENABLED", cfg.tokenizer.stopwords_enabled),
             overlay_float("SAFFRON_RRF_K", cfg.rrf_k),
             overlay_float("SAFFRON_SPARSE_WEIGHT", cfg.sparse_weight),
             overlay_float("SAFFRON_DENSE_WEIGHT", cfg.dense_weight),
             overlay_float("SAFFRON_MIN_SIMILARITY", cfg.min_similarity),
             overlay_uint("SAFFRON_OVERSAMPLE", cfg.oversample_factor),
             overlay_uint("SAFFRON_DENSE_TIMEOUT_MS", timeout_ms),
             overlay_uint("SAFFRON_MAX_INFLIGHT_DENSE", cfg.max_inflight_dense),
             overlay_bool("SAFFRON_HYBRID_ENABLED", cfg.hybrid_enabled),
             overlay_uint("SAFFRON_SEARCH_LIMIT", cfg.default_search_limit),
         }) {
        if (!step) {
            return std::unexpected(step.error());
        }
    }
    cfg.dense_timeout = std::chrono::milliseconds(timeout_ms);

    if (auto level = core::safe_getenv("SAFFRON_LOG_LEVEL")) {
        cfg.log_level = *level;
    }

    if (auto ok = cfg.validate(); !ok) {
        return std::unexpected(ok.error());
    }
    return cfg;
}

auto SearchConfig::validate() const -> std::expected<void, core::error> {
    if (auto ok = index::BM25Index::validate(bm25); !ok) {
        return invalid(ok.error().message);
    }
    if (tokenizer.min_length == 0) {
        return invalid("min_keyword_length must be at least 1");
    }
    if (!(rrf_k > 0.0f) || !std::isfinite(rrf_k)) {
        return invalid("rrf_k must be positive");
    }
    if (!std::isfinite(sparse_weight) || sparse_weight < 0.0f ||
        !std::isfinite(dense_weight) || dense_weight < 0.0f) {
        return invalid("Fusion weights must be finite and non-negative");
    }
    if (!(min_similarity >= 0.0f && min_similarity <= 1.0f)) {
        return invalid("min_similarity must be in [0, 1]");
    }
    if (oversample_factor == 0) {
        return invalid("oversample_factor must be at least 1");
    }
    if (dense_timeout.count() <= 0) {
        return invalid("dense_timeout must be positive");
    }
    if (max_inflight_dense == 0) {
        return invalid("max_inflight_dense must be at least 1");
    }
    if (default_search_limit == 0) {
        return invalid("default_search_limit must be at least 1");
    }
    if (!log::is_valid_level(log_level)) {
        return invalid("Unknown log level '" + log_level + "'");
    }
    return {};
}

} // namespace saffron
