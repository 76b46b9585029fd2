#include "saffron/store/document_store.hpp"

#include <mutex>

#include "saffron/log.hpp"

namespace saffron::store {

InMemoryDocumentStore::InMemoryDocumentStore(std::vector<Document> documents) {
    for (auto& doc : documents) {
        if (auto ok = upsert(std::move(doc)); !ok) {
            log::logger()->warn("Skipping document: {}", ok.error().message);
        }
    }
}

auto InMemoryDocumentStore::get_all_documents() -> std::expected<std::vector<Document>, core::error> {
    std::shared_lock lock(mutex_);
    return documents_;
}

auto InMemoryDocumentStore::get_document_metadata(std::string_view id)
    -> std::expected<std::optional<RecipeMetadata>, core::error> {
    std::shared_lock lock(mutex_);
    auto it = positions_.find(std::string(id));
    if (it == positions_.end()) {
        return std::optional<RecipeMetadata>{};
    }
    return std::optional<RecipeMetadata>{documents_[it->second].metadata};
}

auto InMemoryDocumentStore::upsert(Document doc) -> std::expected<void, core::error> {
    if (doc.id.empty()) {
        return core::make_unexpected(core::error_code::invalid_argument,
                                     "Document id must not be empty", "store");
    }
    std::unique_lock lock(mutex_);
    if (auto it = positions_.find(doc.id); it != positions_.end()) {
        documents_[it->second] = std::move(doc);
        return {};
    }
    positions_.emplace(doc.id, documents_.size());
    documents_.push_back(std::move(doc));
    return {};
}

auto InMemoryDocumentStore::remove(std::string_view id) -> bool {
    std::unique_lock lock(mutex_);
    auto it = positions_.find(std::string(id));
    if (it == positions_.end()) {
        return false;
    }
    const std::size_t pos = it->second;
    documents_.erase(documents_.begin() + static_cast<std::ptrdiff_t>(pos));
    positions_.erase(it);
    for (auto& [doc_id, p] : positions_) {
        if (p > pos) --p;
    }
    return true;
}

auto InMemoryDocumentStore::size() const -> std::size_t {
    std::shared_lock lock(mutex_);
    return documents_.size();
}

auto InMemoryDocumentStore::clear() -> void {
    std::unique_lock lock(mutex_);
    documents_.clear();
    positions_.clear();
}

} // namespace saffron::store
