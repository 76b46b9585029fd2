#include "saffron/filter/recipe_filter.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace saffron::filter {

namespace {

auto lowercase(std::string s) -> std::string {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

auto invalid(std::string message) -> std::unexpected<core::error> {
    return core::make_unexpected(core::error_code::invalid_argument, std::move(message), "filter");
}

auto check_bound(const char* name, const std::optional<std::int64_t>& value, const BoundRange& range)
    -> std::expected<void, core::error> {
    if (value && (*value < range.min_value || *value > range.max_value)) {
        return invalid(std::string(name) + " must be between " + std::to_string(range.min_value) +
                       " and " + std::to_string(range.max_value));
    }
    return {};
}

auto check_pair(const char* min_name, const std::optional<std::int64_t>& min_value,
                const char* max_name, const std::optional<std::int64_t>& max_value)
    -> std::expected<void, core::error> {
    if (min_value && max_value && *min_value > *max_value) {
        return invalid(std::string(min_name) + " cannot be greater than " + max_name);
    }
    return {};
}

} // anonymous namespace

auto RecipeFilter::create(const RecipeFilterSpec& spec, const FilterLimits& limits)
    -> std::expected<RecipeFilter, core::error> {
    RecipeFilter f;

    if (spec.difficulty) {
        auto d = parse_difficulty(*spec.difficulty);
        if (!d) {
            return invalid(d.error().message);
        }
        f.difficulty_ = *d;
    }

    const struct {
        const char* name;
        const std::optional<std::int64_t>& value;
        const BoundRange& range;
    } bounds[] = {
        {"prep_time_min", spec.prep_time_min, limits.prep_time},
        {"prep_time_max", spec.prep_time_max, limits.prep_time},
        {"cook_time_min", spec.cook_time_min, limits.cook_time},
        {"cook_time_max", spec.cook_time_max, limits.cook_time},
        {"servings_min", spec.servings_min, limits.servings},
        {"servings_max", spec.servings_max, limits.servings},
        {"max_total_time", spec.max_total_time, limits.total_time},
    };
    for (const auto& bound : bounds) {
        if (auto ok = check_bound(bound.name, bound.value, bound.range); !ok) {
            return std::unexpected(ok.error());
        }
    }

    if (auto ok = check_pair("prep_time_min", spec.prep_time_min, "prep_time_max", spec.prep_time_max); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = check_pair("cook_time_min", spec.cook_time_min, "cook_time_max", spec.cook_time_max); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = check_pair("servings_min", spec.servings_min, "servings_max", spec.servings_max); !ok) {
        return std::unexpected(ok.error());
    }

    for (const auto& restriction : spec.dietary_restrictions) {
        auto lowered = lowercase(restriction);
        const bool supported = std::any_of(
            limits.dietary_restrictions.begin(), limits.dietary_restrictions.end(),
            [&](const std::string& s) { return lowercase(s) == lowered; });
        if (!supported) {
            return invalid("Invalid dietary restriction '" + restriction + "'");
        }
        if (std::find(f.dietary_restrictions_.begin(), f.dietary_restrictions_.end(), lowered) ==
            f.dietary_restrictions_.end()) {
            f.dietary_restrictions_.push_back(std::move(lowered));
        }
    }

    f.prep_time_min_ = spec.prep_time_min;
    f.prep_time_max_ = spec.prep_time_max;
    f.cook_time_min_ = spec.cook_time_min;
    f.cook_time_max_ = spec.cook_time_max;
    f.servings_min_ = spec.servings_min;
    f.servings_max_ = spec.servings_max;
    f.max_total_time_ = spec.max_total_time;
    return f;
}

auto RecipeFilter::has_filters() const noexcept -> bool {
    return difficulty_ || prep_time_min_ || prep_time_max_ || cook_time_min_ || cook_time_max_ ||
           servings_min_ || servings_max_ || max_total_time_ || !dietary_restrictions_.empty();
}

auto RecipeFilter::describe() const -> std::string {
    if (!has_filters()) {
        return "none";
    }
    std::ostringstream os;
    const char* sep = "";
    auto field = [&](const char* name, const auto& value) {
        os << sep << name << '=' << value;
        sep = " ";
    };
    if (difficulty_) field("difficulty", to_string(*difficulty_));
    if (prep_time_min_) field("prep_min", *prep_time_min_);
    if (prep_time_max_) field("prep_max", *prep_time_max_);
    if (cook_time_min_) field("cook_min", *cook_time_min_);
    if (cook_time_max_) field("cook_max", *cook_time_max_);
    if (servings_min_) field("servings_min", *servings_min_);
    if (servings_max_) field("servings_max", *servings_max_);
    if (max_total_time_) field("max_total", *max_total_time_);
    for (const auto& d : dietary_restrictions_) field("diet", d);
    return os.str();
}

} // namespace saffron::filter
