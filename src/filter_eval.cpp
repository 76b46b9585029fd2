#include "saffron/filter_eval.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace saffron::filter_eval {

namespace {

constexpr std::array<std::string_view, 3> MEAT_KEYWORDS{"meat", "chicken", "beef"};
constexpr std::array<std::string_view, 6> ANIMAL_PRODUCT_KEYWORDS{"milk", "cheese", "butter",
                                                                  "cream", "yogurt", "egg"};

auto contains_any(std::string_view text, const auto& keywords) -> bool {
  return std::any_of(keywords.begin(), keywords.end(),
                     [&](std::string_view k) { return text.find(k) != std::string_view::npos; });
}

auto in_range(const std::optional<std::int64_t>& value, const std::optional<std::int64_t>& lo,
              const std::optional<std::int64_t>& hi) -> bool {
  if (!lo && !hi) return true;
  // Minutes and servings are never negative; such a value is corrupt.
  if (!value || *value < 0) return false;
  if (lo && *value < *lo) return false;
  if (hi && *value > *hi) return false;
  return true;
}

} // anonymous namespace

auto dietary_text(const RecipeMetadata& metadata) -> std::string {
  std::string text = metadata.title;
  for (const auto& ingredient : metadata.ingredients) {
    text.push_back(' ');
    text += ingredient;
  }
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

auto dietary_match(std::string_view restriction, std::string_view recipe_text) -> bool {
  if (recipe_text.find(restriction) != std::string_view::npos) return true;
  if (restriction == "vegetarian") return !contains_any(recipe_text, MEAT_KEYWORDS);
  if (restriction == "vegan") {
    return !contains_any(recipe_text, MEAT_KEYWORDS) &&
           !contains_any(recipe_text, ANIMAL_PRODUCT_KEYWORDS);
  }
  return false;
}

auto passes(const RecipeMetadata& m, const filter::RecipeFilter& f) -> bool {
  if (!f.has_filters()) return true;

  if (f.difficulty() && m.difficulty != f.difficulty()) return false;

  if (!in_range(m.prep_time_minutes, f.prep_time_min(), f.prep_time_max())) return false;
  if (!in_range(m.cook_time_minutes, f.cook_time_min(), f.cook_time_max())) return false;
  if (!in_range(m.servings, f.servings_min(), f.servings_max())) return false;

  if (f.max_total_time()) {
    const auto& prep = m.prep_time_minutes;
    const auto& cook = m.cook_time_minutes;
    if (!prep || !cook || *prep < 0 || *cook < 0) return false;
    const std::int64_t bound = *f.max_total_time();
    if (*prep > bound || *cook > bound - *prep) return false;
  }

  if (!f.dietary_restrictions().empty()) {
    const auto text = dietary_text(m);
    const auto& wanted = f.dietary_restrictions();
    if (std::none_of(wanted.begin(), wanted.end(),
                     [&](const std::string& r) { return dietary_match(r, text); })) {
      return false;
    }
  }

  return true;
}

auto passes(const std::optional<RecipeMetadata>& metadata, const filter::RecipeFilter& f) -> bool {
  if (!f.has_filters()) return true;
  return metadata.has_value() && passes(*metadata, f);
}

} // namespace saffron::filter_eval
