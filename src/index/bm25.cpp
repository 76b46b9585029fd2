#include "saffron/index/bm25.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <unordered_map>

#include <roaring/roaring.hh>

namespace saffron::index {

// BM25Index::Impl class definition

class BM25Index::Impl {
public:
    // Term frequencies keyed by term id, indices sorted for merge scoring.
    struct SparseVector {
        std::vector<std::uint32_t> indices;
        std::vector<float> values;

        auto empty() const noexcept -> bool { return indices.empty(); }
    };

    Impl() = default;

    auto add_document(const TokenizedDocument& doc) -> void;
    auto finalize() -> void;

    auto search(const std::vector<std::string>& query_tokens, std::uint32_t top_n) const
        -> std::vector<SparseMatch>;

    auto score_document(const SparseVector& query_terms, std::uint32_t ordinal) const -> float;
    auto encode_query(const std::vector<std::string>& query_tokens) const -> SparseVector;

    auto get_stats() const noexcept -> BM25Stats;
    auto size() const noexcept -> std::size_t { return ids_.size(); }
    auto vocabulary_size() const noexcept -> std::size_t { return term_to_id_.size(); }
    auto avg_doc_length() const noexcept -> float { return avg_doc_length_; }

    BM25Params params_;
    std::vector<SparseVector> term_freqs_;  // ordinal -> sorted term frequencies

private:
    // Term to term ID mapping
    std::unordered_map<std::string, std::uint32_t> term_to_id_;

    // Inverted index: term_id -> document ordinals
    std::vector<roaring::Roaring> inverted_index_;

    // Document frequency for each term
    std::vector<std::uint32_t> doc_freqs_;

    // Ordinal is the insertion position and doubles as the tie-break key
    std::vector<std::string> ids_;
    std::unordered_map<std::string, std::uint32_t> id_to_ordinal_;
    std::vector<std::uint32_t> doc_lengths_;

    // Global statistics
    float avg_doc_length_{0.0f};
    std::size_t total_tokens_{0};

    auto get_or_create_term_id(const std::string& term) -> std::uint32_t;
    auto compute_idf(std::uint32_t term_id) const -> float;
};

// BM25Index::Impl implementation

auto BM25Index::Impl::get_or_create_term_id(const std::string& term) -> std::uint32_t {
    auto it = term_to_id_.find(term);
    if (it != term_to_id_.end()) {
        return it->second;
    }

    std::uint32_t id = static_cast<std::uint32_t>(term_to_id_.size());
    term_to_id_.emplace(term, id);
    inverted_index_.emplace_back();
    doc_freqs_.push_back(0);

    return id;
}

auto BM25Index::Impl::add_document(const TokenizedDocument& doc) -> void {
    std::uint32_t ordinal = 0;
    if (auto it = id_to_ordinal_.find(doc.id); it != id_to_ordinal_.end()) {
        // Replace: remove prior contributions, keep the original position
        ordinal = it->second;
        for (std::uint32_t tid : term_freqs_[ordinal].indices) {
            inverted_index_[tid].remove(ordinal);
            if (doc_freqs_[tid] > 0) doc_freqs_[tid]--;
        }
        total_tokens_ -= doc_lengths_[ordinal];
    } else {
        ordinal = static_cast<std::uint32_t>(ids_.size());
        ids_.push_back(doc.id);
        id_to_ordinal_.emplace(doc.id, ordinal);
        doc_lengths_.push_back(0);
        term_freqs_.emplace_back();
    }

    // Count term frequencies
    std::unordered_map<std::uint32_t, std::uint32_t> term_counts;
    for (const auto& token : doc.tokens) {
        term_counts[get_or_create_term_id(token)]++;
    }

    SparseVector tf;
    tf.indices.reserve(term_counts.size());
    for (const auto& [term_id, count] : term_counts) {
        tf.indices.push_back(term_id);
        inverted_index_[term_id].add(ordinal);
        doc_freqs_[term_id]++;
    }
    // Sort indices for merge-based scoring
    std::sort(tf.indices.begin(), tf.indices.end());
    tf.values.reserve(tf.indices.size());
    for (std::uint32_t term_id : tf.indices) {
        tf.values.push_back(static_cast<float>(term_counts[term_id]));
    }

    doc_lengths_[ordinal] = static_cast<std::uint32_t>(doc.tokens.size());
    total_tokens_ += doc.tokens.size();
    term_freqs_[ordinal] = std::move(tf);
}

auto BM25Index::Impl::finalize() -> void {
    for (auto& bitmap : inverted_index_) {
        bitmap.runOptimize();
    }
    avg_doc_length_ = ids_.empty() ? 0.0f
                                   : static_cast<float>(total_tokens_) / static_cast<float>(ids_.size());
}

auto BM25Index::Impl::compute_idf(std::uint32_t term_id) const -> float {
    if (term_id >= doc_freqs_.size()) {
        return 0.0f;
    }

    const auto N = static_cast<float>(ids_.size());
    const auto df = static_cast<float>(doc_freqs_[term_id]);

    if (df == 0.0f) {
        return 0.0f;
    }

    // IDF = log(1 + (N - df + 0.5) / (df + 0.5)), never negative
    return std::log(1.0f + (N - df + 0.5f) / (df + 0.5f));
}

auto BM25Index::Impl::encode_query(const std::vector<std::string>& query_tokens) const -> SparseVector {
    std::unordered_map<std::uint32_t, std::uint32_t> counts;
    for (const auto& token : query_tokens) {
        auto it = term_to_id_.find(token);
        if (it != term_to_id_.end()) {
            counts[it->second]++;
        }
    }

    SparseVector query;
    query.indices.reserve(counts.size());
    for (const auto& [term_id, count] : counts) {
        query.indices.push_back(term_id);
    }
    std::sort(query.indices.begin(), query.indices.end());
    query.values.reserve(query.indices.size());
    for (std::uint32_t term_id : query.indices) {
        query.values.push_back(static_cast<float>(counts.at(term_id)));
    }
    return query;
}

auto BM25Index::Impl::score_document(const SparseVector& query_terms, std::uint32_t ordinal) const
    -> float {
    if (ordinal >= term_freqs_.size() || avg_doc_length_ <= 0.0f) {
        return 0.0f;
    }

    const auto& doc_terms = term_freqs_[ordinal];
    const float doc_len_norm = 1.0f - params_.b +
        params_.b * (static_cast<float>(doc_lengths_[ordinal]) / avg_doc_length_);

    float score = 0.0f;
    std::size_t qi = 0, di = 0;
    while (qi < query_terms.indices.size() && di < doc_terms.indices.size()) {
        if (query_terms.indices[qi] < doc_terms.indices[di]) {
            ++qi;
        } else if (query_terms.indices[qi] > doc_terms.indices[di]) {
            ++di;
        } else {
            const float query_tf = query_terms.values[qi];
            const float doc_tf = doc_terms.values[di];
            const float idf = compute_idf(query_terms.indices[qi]);

            const float numerator = doc_tf * (params_.k1 + 1.0f);
            const float denominator = doc_tf + params_.k1 * doc_len_norm;
            score += idf * query_tf * (numerator / denominator);

            ++qi;
            ++di;
        }
    }

    return score;
}

auto BM25Index::Impl::search(const std::vector<std::string>& query_tokens, std::uint32_t top_n) const
    -> std::vector<SparseMatch> {

    if (ids_.empty() || query_tokens.empty() || top_n == 0) {
        return {};
    }

    auto query = encode_query(query_tokens);
    if (query.empty()) {
        return {};
    }

    // Find candidate documents (union of posting lists)
    roaring::Roaring candidates;
    for (std::uint32_t term_id : query.indices) {
        candidates |= inverted_index_[term_id];
    }

    struct Scored {
        float score;
        std::uint32_t ordinal;
    };
    std::vector<Scored> scored;
    scored.reserve(candidates.cardinality());
    for (std::uint32_t ordinal : candidates) {
        float score = score_document(query, ordinal);
        if (score > 0.0f) {
            scored.push_back({score, ordinal});
        }
    }

    const auto by_score_then_ordinal = [](const Scored& a, const Scored& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.ordinal < b.ordinal;
    };
    const auto keep = std::min<std::size_t>(top_n, scored.size());
    std::partial_sort(scored.begin(), scored.begin() + static_cast<std::ptrdiff_t>(keep),
                      scored.end(), by_score_then_ordinal);

    std::vector<SparseMatch> results;
    results.reserve(keep);
    for (std::size_t i = 0; i < keep; ++i) {
        results.push_back(SparseMatch{ids_[scored[i].ordinal], scored[i].score});
    }
    return results;
}

auto BM25Index::Impl::get_stats() const noexcept -> BM25Stats {
    BM25Stats stats;
    stats.num_documents = ids_.size();
    stats.vocabulary_size = term_to_id_.size();
    stats.total_tokens = total_tokens_;
    stats.avg_doc_length = avg_doc_length_;
    return stats;
}

// BM25Index implementation (forwarding to Impl)

BM25Index::BM25Index() : impl_(std::make_unique<Impl>()) {}
BM25Index::~BM25Index() = default;
BM25Index::BM25Index(BM25Index&&) noexcept = default;
BM25Index& BM25Index::operator=(BM25Index&&) noexcept = default;

auto BM25Index::validate(const BM25Params& params) -> std::expected<void, core::error> {
    if (!(params.k1 > 0.0f) || !std::isfinite(params.k1)) {
        return core::make_unexpected(core::error_code::invalid_argument, "k1 must be positive", "bm25");
    }
    if (!(params.b >= 0.0f && params.b <= 1.0f)) {
        return core::make_unexpected(core::error_code::invalid_argument, "b must be between 0 and 1", "bm25");
    }
    return {};
}

auto BM25Index::build(const std::vector<TokenizedDocument>& documents, const BM25Params& params)
    -> std::expected<BM25Index, core::error> {

    if (auto ok = validate(params); !ok) {
        return std::unexpected(ok.error());
    }

    BM25Index index;
    index.impl_->params_ = params;
    index.impl_->term_freqs_.reserve(documents.size());

    for (const auto& doc : documents) {
        if (doc.id.empty()) {
            return core::make_unexpected(core::error_code::invalid_argument,
                                         "Document id must not be empty", "bm25");
        }
        index.impl_->add_document(doc);
    }
    index.impl_->finalize();

    return index;
}

auto BM25Index::search(const std::vector<std::string>& query_tokens, std::uint32_t top_n) const
    -> std::vector<SparseMatch> {
    return impl_->search(query_tokens, top_n);
}

auto BM25Index::get_stats() const noexcept -> BM25Stats {
    return impl_->get_stats();
}

auto BM25Index::size() const noexcept -> std::size_t {
    return impl_->size();
}

auto BM25Index::vocabulary_size() const noexcept -> std::size_t {
    return impl_->vocabulary_size();
}

auto BM25Index::avg_doc_length() const noexcept -> float {
    return impl_->avg_doc_length();
}

auto BM25Index::params() const noexcept -> const BM25Params& {
    return impl_->params_;
}

} // namespace saffron::index
