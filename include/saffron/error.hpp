#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling (API boundaries map them to responses).
 * - Human-readable message and originating component for diagnostics.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace saffron::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  config_invalid = 2001,
  unavailable = 7001,           /**< a dependency cannot serve yet (store offline, index unbuilt) */
  retrieval_failed = 7002,      /**< one retrieval path failed */
  all_retrieval_failed = 7003,  /**< every retrieval path failed */
  timed_out = 8002,
  internal = 9001,
  invalid_argument = 9002,
  not_initialized = 9003,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "search.dense" */
};

/** \brief Stable lowercase name of an error code. */
constexpr auto to_string(error_code ec) noexcept -> std::string_view {
  switch (ec) {
    case error_code::ok: return "ok";
    case error_code::config_invalid: return "config_invalid";
    case error_code::unavailable: return "unavailable";
    case error_code::retrieval_failed: return "retrieval_failed";
    case error_code::all_retrieval_failed: return "all_retrieval_failed";
    case error_code::timed_out: return "timed_out";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
    case error_code::not_initialized: return "not_initialized";
  }
  return "internal";
}

/** \brief Shorthand for building an unexpected error value. */
inline auto make_unexpected(error_code code, std::string message, std::string component)
    -> std::unexpected<error> {
  return std::unexpected(error{code, std::move(message), std::move(component)});
}

} // namespace saffron::core
