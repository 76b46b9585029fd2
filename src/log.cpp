#include "saffron/log.hpp"

#include <array>
#include <mutex>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace saffron::log {

namespace {

constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 7> LEVELS{{
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"warning", spdlog::level::warn},
    {"error", spdlog::level::err},
    {"off", spdlog::level::off},
}};

std::mutex g_init_mutex;

} // anonymous namespace

auto logger() -> std::shared_ptr<spdlog::logger> {
    if (auto existing = spdlog::get("saffron")) {
        return existing;
    }
    std::lock_guard lock(g_init_mutex);
    if (auto existing = spdlog::get("saffron")) {
        return existing;
    }
    auto created = spdlog::stderr_color_mt("saffron");
    created->set_level(spdlog::level::info);
    return created;
}

auto is_valid_level(std::string_view level) noexcept -> bool {
    for (const auto& [name, lvl] : LEVELS) {
        if (name == level) return true;
    }
    return false;
}

auto set_level(std::string_view level) -> bool {
    for (const auto& [name, lvl] : LEVELS) {
        if (name == level) {
            logger()->set_level(lvl);
            return true;
        }
    }
    return false;
}

} // namespace saffron::log
