#pragma once

/** \file log.hpp
 *  \brief Library-wide spdlog logger.
 *
 * All components log through the named logger "saffron". The logger is created
 * lazily with a stderr colour sink unless the host application registered a
 * logger of that name first.
 */

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace saffron::log {

/** \brief Shared library logger (thread-safe). */
auto logger() -> std::shared_ptr<spdlog::logger>;

/** \brief Set the level from a name: trace|debug|info|warn|error|off.
 *  \return false when the name is not recognised (level left unchanged).
 */
auto set_level(std::string_view level) -> bool;

/** \brief Check whether a level name is recognised. */
auto is_valid_level(std::string_view level) noexcept -> bool;

} // namespace saffron::log
