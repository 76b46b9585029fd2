#pragma once

/** \file recipe.hpp
 *  \brief Recipe document record and its metadata.
 *
 * Documents are immutable once indexed; an update replaces the whole record
 * under the same id. Numeric metadata is optional because records handed back
 * by a document store may be incomplete; consumers treat a missing value as
 * unknown rather than zero.
 */

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "saffron/error.hpp"

namespace saffron {

/** \brief Recipe difficulty level. */
enum class Difficulty : std::uint8_t {
    Beginner,
    Intermediate,
    Advanced
};

/** \brief Canonical display name ("Beginner", ...). */
auto to_string(Difficulty d) noexcept -> std::string_view;

/** \brief Parse a difficulty name, case-insensitive.
 *
 * \return Parsed value, or invalid_argument for unknown names
 */
auto parse_difficulty(std::string_view name) -> std::expected<Difficulty, core::error>;

/** \brief Metadata snapshot of a recipe as used for filtering and display. */
struct RecipeMetadata {
    std::string title;
    std::optional<Difficulty> difficulty;
    std::optional<std::int64_t> prep_time_minutes;
    std::optional<std::int64_t> cook_time_minutes;
    std::optional<std::int64_t> servings;
    std::vector<std::string> ingredients;
    std::vector<std::string> instructions;

    /** \brief prep + cook when both are known, non-negative and representable. */
    auto total_time_minutes() const noexcept -> std::optional<std::int64_t>;

    auto operator==(const RecipeMetadata&) const -> bool = default;
};

/** \brief A searchable recipe document. */
struct Document {
    std::string id;             /**< opaque identifier */
    RecipeMetadata metadata;

    /** \brief Title, ingredients and instructions joined by spaces. */
    auto searchable_text() const -> std::string;
};

/** \brief Parse an integer metadata field the way stores hand them over (as text).
 *
 * Leading/trailing whitespace is ignored. Minutes and servings are counts, so
 * only non-negative base-10 integers with an optional leading '+' are accepted;
 * anything else (including "-5" and "+-5") yields std::nullopt.
 */
auto parse_metadata_int(std::string_view text) noexcept -> std::optional<std::int64_t>;

} // namespace saffron
