#pragma once

/** \file filter_eval.hpp
 *  \brief In-memory evaluation of a RecipeFilter against recipe metadata.
 *
 * Evaluation is pure and does not depend on which retrieval path produced the
 * candidate. All present constraints must hold (AND), except that requested
 * dietary restrictions are alternatives (OR among themselves).
 * Missing numeric metadata fails any active check on that field (fail-closed).
 */

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "saffron/filter/recipe_filter.hpp"
#include "saffron/recipe.hpp"

namespace saffron::filter_eval {

// Evaluate whether a recipe with the given metadata satisfies the filter.
auto passes(const RecipeMetadata& metadata, const filter::RecipeFilter& filter) -> bool;

// Same, for a candidate whose metadata could not be resolved: passes only the empty filter.
auto passes(const std::optional<RecipeMetadata>& metadata, const filter::RecipeFilter& filter) -> bool;

// Whether a single dietary restriction matches the lower-cased title + ingredients text.
auto dietary_match(std::string_view restriction, std::string_view recipe_text) -> bool;

// Lower-cased title and ingredients joined by spaces.
auto dietary_text(const RecipeMetadata& metadata) -> std::string;

// Keep the items that pass, preserving their relative order.
template <typename T>
auto apply(std::vector<T> items, const filter::RecipeFilter& filter,
           const std::function<std::optional<RecipeMetadata>(const T&)>& metadata_of)
    -> std::vector<T> {
  if (!filter.has_filters()) return items;
  std::erase_if(items, [&](const T& item) { return !passes(metadata_of(item), filter); });
  return items;
}

} // namespace saffron::filter_eval
