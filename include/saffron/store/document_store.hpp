#pragma once

/** \file document_store.hpp
 *  \brief Document-store collaborator interface and an in-memory implementation.
 *
 * The store owns the recipe document set. The search core only reads from it:
 * the full set for sparse index (re)builds and single metadata records for
 * filter evaluation when a match does not carry its own metadata.
 */

#include <cstddef>
#include <expected>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "saffron/error.hpp"
#include "saffron/recipe.hpp"

namespace saffron::store {

/** \brief Read interface of the document store consumed by the search core. */
class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    /** \brief All documents, in insertion order. */
    virtual auto get_all_documents() -> std::expected<std::vector<Document>, core::error> = 0;

    /** \brief Metadata of one document.
     *
     * \return std::nullopt when the id is unknown; an error when the store is unreachable
     */
    virtual auto get_document_metadata(std::string_view id)
        -> std::expected<std::optional<RecipeMetadata>, core::error> = 0;
};

/** \brief Thread-safe in-memory store preserving insertion order.
 *
 * Upserting an existing id replaces the record in place.
 */
class InMemoryDocumentStore final : public DocumentStore {
public:
    InMemoryDocumentStore() = default;
    explicit InMemoryDocumentStore(std::vector<Document> documents);

    auto get_all_documents() -> std::expected<std::vector<Document>, core::error> override;
    auto get_document_metadata(std::string_view id)
        -> std::expected<std::optional<RecipeMetadata>, core::error> override;

    /** \brief Insert or replace a document. Empty ids are rejected. */
    auto upsert(Document doc) -> std::expected<void, core::error>;

    /** \brief Remove a document; returns false if it was not present. */
    auto remove(std::string_view id) -> bool;

    auto size() const -> std::size_t;
    auto clear() -> void;

private:
    mutable std::shared_mutex mutex_;
    std::vector<Document> documents_;
    std::unordered_map<std::string, std::size_t> positions_;
};

} // namespace saffron::store
