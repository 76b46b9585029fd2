#include "saffron/search/embedding_backend.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>
#include <sstream>

#include "saffron/index/tokenizer.hpp"
#include "saffron/kernels/distance.hpp"
#include "saffron/log.hpp"

namespace saffron::search {

namespace {

constexpr std::uint64_t FNV_OFFSET = 1469598103934665603ull;
constexpr std::uint64_t FNV_PRIME  = 1099511628211ull;

auto fnv1a(std::string_view s) noexcept -> std::uint64_t {
    std::uint64_t h = FNV_OFFSET;
    for (char c : s) {
        h ^= static_cast<std::uint8_t>(c);
        h *= FNV_PRIME;
    }
    return h;
}

template <typename T>
auto join(const std::vector<T>& items, std::string_view sep) -> std::string {
    std::ostringstream os;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i) os << sep;
        os << items[i];
    }
    return os.str();
}

} // anonymous namespace

// HashingEmbedder

HashingEmbedder::HashingEmbedder(std::uint32_t dimensions)
    : dimensions_(dimensions == 0 ? 1 : dimensions) {}

auto HashingEmbedder::embed(std::string_view text) -> std::expected<Embedding, core::error> {
    static const index::Tokenizer tokenizer;
    Embedding v(dimensions_, 0.0f);
    for (const auto& token : tokenizer.keywords(text)) {
        v[fnv1a(token) % dimensions_] += 1.0f;
    }

    float norm = 0.0f;
    for (float x : v) norm += x * x;
    if (norm > 0.0f) {
        norm = std::sqrt(norm);
        for (float& x : v) x /= norm;
    }
    return v;
}

auto recipe_embedding_text(const Document& doc) -> std::string {
    const auto& m = doc.metadata;
    auto minutes = [](const std::optional<std::int64_t>& v) {
        return v ? std::to_string(*v) : std::string("unknown");
    };

    std::ostringstream os;
    os << "Recipe: " << m.title << '\n';
    os << "Difficulty: " << (m.difficulty ? to_string(*m.difficulty) : std::string_view("unknown")) << '\n';
    os << "Cooking time: " << minutes(m.prep_time_minutes) << " minutes prep, "
       << minutes(m.cook_time_minutes) << " minutes cook\n";
    os << "Serves " << minutes(m.servings) << " people\n";
    os << "Ingredients: " << join(m.ingredients, " | ") << '\n';
    os << "Instructions: " << join(m.instructions, " ");
    return os.str();
}

// EmbeddingVectorBackend

EmbeddingVectorBackend::EmbeddingVectorBackend(std::shared_ptr<Embedder> embedder)
    : embedder_(std::move(embedder)) {}

auto EmbeddingVectorBackend::name() const -> std::string {
    return "in-memory(" + (embedder_ ? embedder_->name() : std::string("none")) + ")";
}

auto EmbeddingVectorBackend::upsert(const Document& doc) -> std::expected<void, core::error> {
    if (doc.id.empty()) {
        return core::make_unexpected(core::error_code::invalid_argument,
                                     "Document id must not be empty", "search.embedding");
    }
    if (!embedder_) {
        return core::make_unexpected(core::error_code::not_initialized,
                                     "No embedder configured", "search.embedding");
    }
    auto embedding = embedder_->embed(recipe_embedding_text(doc));
    if (!embedding) {
        return std::unexpected(embedding.error());
    }

    std::unique_lock lock(mutex_);
    Entry entry{doc.id, std::move(*embedding), doc.metadata};
    if (auto it = positions_.find(doc.id); it != positions_.end()) {
        entries_[it->second] = std::move(entry);
    } else {
        positions_.emplace(doc.id, entries_.size());
        entries_.push_back(std::move(entry));
    }
    return {};
}

auto EmbeddingVectorBackend::upsert_all(const std::vector<Document>& docs)
    -> std::expected<void, core::error> {
    for (const auto& doc : docs) {
        if (auto ok = upsert(doc); !ok) {
            return ok;
        }
    }
    log::logger()->info("Embedded {} recipes with {}", docs.size(), name());
    return {};
}

auto EmbeddingVectorBackend::embed_and_search(std::string_view query_text, std::uint32_t top_n,
                                              float min_similarity)
    -> std::expected<std::vector<DenseMatch>, core::error> {
    if (!embedder_) {
        return core::make_unexpected(core::error_code::not_initialized,
                                     "No embedder configured", "search.embedding");
    }
    auto query = embedder_->embed(query_text);
    if (!query) {
        return std::unexpected(query.error());
    }

    std::vector<DenseMatch> matches;
    {
        std::shared_lock lock(mutex_);
        matches.reserve(entries_.size());
        for (const auto& e : entries_) {
            const float distance = kernels::cosine_distance(*query, e.embedding);
            const float similarity = std::clamp(1.0f - distance, 0.0f, 1.0f);
            if (similarity >= min_similarity) {
                matches.push_back(DenseMatch{e.id, similarity, e.metadata});
            }
        }
    }

    std::stable_sort(matches.begin(), matches.end(),
                     [](const DenseMatch& a, const DenseMatch& b) { return a.similarity > b.similarity; });
    if (matches.size() > top_n) {
        matches.resize(top_n);
    }
    return matches;
}

auto EmbeddingVectorBackend::remove(std::string_view id) -> bool {
    std::unique_lock lock(mutex_);
    auto it = positions_.find(std::string(id));
    if (it == positions_.end()) {
        return false;
    }
    const std::size_t pos = it->second;
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(pos));
    positions_.erase(it);
    for (auto& [entry_id, p] : positions_) {
        if (p > pos) --p;
    }
    return true;
}

auto EmbeddingVectorBackend::size() const -> std::size_t {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

auto EmbeddingVectorBackend::clear() -> void {
    std::unique_lock lock(mutex_);
    entries_.clear();
    positions_.clear();
}

} // namespace saffron::search
