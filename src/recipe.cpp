#include "saffron/recipe.hpp"

#include <cctype>
#include <charconv>
#include <limits>

namespace saffron {

namespace {

auto iequals(std::string_view a, std::string_view b) noexcept -> bool {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        auto ca = static_cast<unsigned char>(a[i]);
        auto cb = static_cast<unsigned char>(b[i]);
        if (std::tolower(ca) != std::tolower(cb)) return false;
    }
    return true;
}

} // anonymous namespace

auto to_string(Difficulty d) noexcept -> std::string_view {
    switch (d) {
        case Difficulty::Beginner: return "Beginner";
        case Difficulty::Intermediate: return "Intermediate";
        case Difficulty::Advanced: return "Advanced";
    }
    return "Beginner";
}

auto parse_difficulty(std::string_view name) -> std::expected<Difficulty, core::error> {
    for (auto d : {Difficulty::Beginner, Difficulty::Intermediate, Difficulty::Advanced}) {
        if (iequals(name, to_string(d))) {
            return d;
        }
    }
    return core::make_unexpected(core::error_code::invalid_argument,
                                 "Invalid difficulty '" + std::string(name) + "'", "recipe");
}

auto RecipeMetadata::total_time_minutes() const noexcept -> std::optional<std::int64_t> {
    if (!prep_time_minutes || !cook_time_minutes) {
        return std::nullopt;
    }
    const auto prep = *prep_time_minutes;
    const auto cook = *cook_time_minutes;
    if (prep < 0 || cook < 0 || prep > std::numeric_limits<std::int64_t>::max() - cook) {
        return std::nullopt;
    }
    return prep + cook;
}

auto Document::searchable_text() const -> std::string {
    std::string text = metadata.title;
    for (const auto& ingredient : metadata.ingredients) {
        text.push_back(' ');
        text += ingredient;
    }
    for (const auto& step : metadata.instructions) {
        text.push_back(' ');
        text += step;
    }
    return text;
}

auto parse_metadata_int(std::string_view text) noexcept -> std::optional<std::int64_t> {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
    if (text.empty()) return std::nullopt;

    std::int64_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    if (*first == '+') ++first;
    if (first == last || !std::isdigit(static_cast<unsigned char>(*first))) {
        return std::nullopt;
    }
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

} // namespace saffron
