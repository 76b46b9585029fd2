#include "saffron/index/sparse_index.hpp"

#include <exception>

#include "saffron/log.hpp"
#include "saffron/store/document_store.hpp"

namespace saffron::index {

SparseIndex::SparseIndex(const TokenizerOptions& tokenizer_options, const BM25Params& params)
    : tokenizer_(tokenizer_options), params_(params) {}

auto SparseIndex::rebuild(const std::vector<Document>& documents) -> std::expected<void, core::error> {
    std::lock_guard lock(rebuild_mutex_);

    std::expected<BM25Index, core::error> built = core::make_unexpected(
        core::error_code::internal, "BM25 build did not run", "sparse_index");
    try {
        std::vector<TokenizedDocument> corpus;
        corpus.reserve(documents.size());
        for (const auto& doc : documents) {
            corpus.push_back(TokenizedDocument{doc.id, tokenizer_.document_keywords(doc)});
        }
        built = BM25Index::build(corpus, params_);
    } catch (const std::exception& e) {
        log::logger()->error("Sparse index build failed: {}", e.what());
        return core::make_unexpected(core::error_code::internal, "Sparse index build failed",
                                     "sparse_index");
    }

    if (!built) {
        log::logger()->error("Sparse index build rejected: {}", built.error().message);
        return std::unexpected(built.error());
    }

    auto fresh = std::make_shared<const BM25Index>(std::move(*built));
    const auto docs = fresh->size();
    const auto vocab = fresh->vocabulary_size();
    current_.store(std::move(fresh), std::memory_order_release);
    const auto gen = generation_.fetch_add(1, std::memory_order_relaxed) + 1;

    log::logger()->info("Built BM25 index from {} recipes ({} terms, generation {})",
                        docs, vocab, gen);
    return {};
}

auto SparseIndex::rebuild_from(store::DocumentStore& store) -> std::expected<void, core::error> {
    auto documents = store.get_all_documents();
    if (!documents) {
        log::logger()->error("Sparse index rebuild could not load documents: {}",
                             documents.error().message);
        return std::unexpected(documents.error());
    }
    return rebuild(*documents);
}

auto SparseIndex::search(std::string_view query, std::uint32_t top_n) const -> std::vector<SparseMatch> {
    auto index = snapshot();
    if (!index) {
        log::logger()->debug("Sparse index queried before first build; returning no matches");
        return {};
    }

    auto keywords = tokenizer_.keywords(query);
    if (keywords.empty()) {
        log::logger()->debug("Query '{}' has no searchable keywords", query);
        return {};
    }

    auto results = index->search(keywords, top_n);
    log::logger()->debug("Sparse search for '{}' matched {} recipes", query, results.size());
    return results;
}

auto SparseIndex::snapshot() const -> std::shared_ptr<const BM25Index> {
    return current_.load(std::memory_order_acquire);
}

auto SparseIndex::stats() const -> SparseIndexStats {
    SparseIndexStats stats;
    auto index = snapshot();
    stats.built = index != nullptr;
    stats.generation = generation_.load(std::memory_order_relaxed);
    if (index) {
        stats.bm25 = index->get_stats();
    }
    return stats;
}

} // namespace saffron::index
