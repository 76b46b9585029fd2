#pragma once

/** \file recipe_filter.hpp
 *  \brief Validated, immutable recipe metadata filter.
 *
 * A RecipeFilter can only be obtained through RecipeFilter::create(), which
 * checks every invariant eagerly: min <= max for each bound pair, every bound
 * inside its configured absolute range, difficulty and dietary tags drawn
 * from the supported sets. Bounds are never swapped or clamped. A filter
 * therefore never exists in an invalid state.
 */

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "saffron/error.hpp"
#include "saffron/recipe.hpp"

namespace saffron::filter {

/** \brief Inclusive absolute range accepted for a bound. */
struct BoundRange {
    std::int64_t min_value{0};
    std::int64_t max_value{0};
};

/** \brief Absolute ranges and vocabularies a filter is validated against. */
struct FilterLimits {
    BoundRange prep_time{0, 1440};     /**< minutes */
    BoundRange cook_time{0, 1440};     /**< minutes */
    BoundRange total_time{0, 2880};    /**< minutes */
    BoundRange servings{1, 50};
    std::vector<std::string> dietary_restrictions{
        "vegetarian", "vegan", "gluten-free", "dairy-free",
        "nut-free", "low-carb", "keto", "paleo"};
};

/** \brief Unvalidated filter request as it arrives at the API boundary. */
struct RecipeFilterSpec {
    std::optional<std::string> difficulty;
    std::optional<std::int64_t> prep_time_min;
    std::optional<std::int64_t> prep_time_max;
    std::optional<std::int64_t> cook_time_min;
    std::optional<std::int64_t> cook_time_max;
    std::optional<std::int64_t> servings_min;
    std::optional<std::int64_t> servings_max;
    std::optional<std::int64_t> max_total_time;
    std::vector<std::string> dietary_restrictions;
};

class RecipeFilter {
public:
    /** \brief The empty filter: has_filters() == false, everything passes. */
    RecipeFilter() = default;

    /** \brief Validate a request and build a filter.
     *
     * \return Filter, or invalid_argument describing the first violated invariant
     */
    static auto create(const RecipeFilterSpec& spec, const FilterLimits& limits = {})
        -> std::expected<RecipeFilter, core::error>;

    /** \brief True if any constraint is set. */
    auto has_filters() const noexcept -> bool;

    auto difficulty() const noexcept -> const std::optional<Difficulty>& { return difficulty_; }
    auto prep_time_min() const noexcept -> const std::optional<std::int64_t>& { return prep_time_min_; }
    auto prep_time_max() const noexcept -> const std::optional<std::int64_t>& { return prep_time_max_; }
    auto cook_time_min() const noexcept -> const std::optional<std::int64_t>& { return cook_time_min_; }
    auto cook_time_max() const noexcept -> const std::optional<std::int64_t>& { return cook_time_max_; }
    auto servings_min() const noexcept -> const std::optional<std::int64_t>& { return servings_min_; }
    auto servings_max() const noexcept -> const std::optional<std::int64_t>& { return servings_max_; }
    auto max_total_time() const noexcept -> const std::optional<std::int64_t>& { return max_total_time_; }

    /** \brief Requested dietary restrictions, lowercased, without duplicates. */
    auto dietary_restrictions() const noexcept -> const std::vector<std::string>& {
        return dietary_restrictions_;
    }

    /** \brief Compact human-readable description for logs. */
    auto describe() const -> std::string;

private:
    std::optional<Difficulty> difficulty_;
    std::optional<std::int64_t> prep_time_min_;
    std::optional<std::int64_t> prep_time_max_;
    std::optional<std::int64_t> cook_time_min_;
    std::optional<std::int64_t> cook_time_max_;
    std::optional<std::int64_t> servings_min_;
    std::optional<std::int64_t> servings_max_;
    std::optional<std::int64_t> max_total_time_;
    std::vector<std::string> dietary_restrictions_;
};

} // namespace saffron::filter
