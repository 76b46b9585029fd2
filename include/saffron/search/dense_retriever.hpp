#pragma once

/** \file dense_retriever.hpp
 *  \brief Semantic retrieval over an external embedding + vector-store service.
 *
 * DenseBackend is the outbound contract to the embedding/storage subsystem: a
 * single call that embeds the query and runs a vector similarity search.
 * DenseRetriever wraps a backend and owns only input/output shaping: it
 * enforces the similarity threshold, ordering and result count, and turns
 * every upstream failure (error return or thrown exception) into a
 * retrieval_failed error rather than an empty success.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "saffron/error.hpp"
#include "saffron/recipe.hpp"

namespace saffron::search {

/** \brief One semantic match produced per query. */
struct DenseMatch {
    std::string id;
    float similarity{0.0f};                  /**< 1 - cosine distance, in [0, 1] */
    std::optional<RecipeMetadata> metadata;  /**< carried by the vector store when available */
};

/** \brief Outbound interface: query embedding + vector similarity search. */
class DenseBackend {
public:
    virtual ~DenseBackend() = default;

    /** \brief Embed the query and return the nearest documents.
     *
     * \param query_text Raw query text
     * \param top_n Maximum number of matches
     * \param min_similarity Similarity threshold in [0, 1]
     * \return Matches (any order), or the upstream error
     */
    virtual auto embed_and_search(std::string_view query_text, std::uint32_t top_n,
                                  float min_similarity)
        -> std::expected<std::vector<DenseMatch>, core::error> = 0;

    /** \brief Human-readable backend name for logs. */
    virtual auto name() const -> std::string { return "dense"; }
};

/** \brief Shapes backend output into a strict ranked list.
 *
 * Post-conditions on success: sorted by similarity descending (stable with
 * respect to backend order), every similarity in [min_similarity, 1], ids
 * unique, at most top_n entries.
 *
 * Thread-safety: safe for concurrent calls if the backend is.
 */
class DenseRetriever {
public:
    explicit DenseRetriever(std::shared_ptr<DenseBackend> backend);

    auto search(std::string_view query, std::uint32_t top_n, float min_similarity) const
        -> std::expected<std::vector<DenseMatch>, core::error>;

    auto backend() const noexcept -> const std::shared_ptr<DenseBackend>& { return backend_; }

private:
    std::shared_ptr<DenseBackend> backend_;
};

} // namespace saffron::search
