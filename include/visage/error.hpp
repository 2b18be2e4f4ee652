#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling; callers branch on the code,
 *   never on the message text.
 * - Human-readable message and originating component for diagnostics.
 * - Validation failures that concern specific records carry the offending ids.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace visage::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  store_failure = 1001,       /**< persistence collaborator unreachable or failed */
  config_invalid = 2001,
  data_integrity = 3001,      /**< stored data violates a record invariant */
  validation_failed = 4001,   /**< caller input rejected; nothing was applied */
  not_found = 6001,           /**< referenced person/face/photo id absent */
  index_unavailable = 7001,   /**< last rebuild failed; index serves a stale snapshot */
  cancelled = 8001,
  internal = 9001,
  invalid_argument = 9002,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "store.sqlite" */
  std::vector<std::uint64_t> ids;          /**< offending record ids, if any */
};

/** \brief Stable lowercase name of a code, for logs. */
constexpr std::string_view to_string(error_code ec) noexcept {
  switch (ec) {
    case error_code::ok: return "ok";
    case error_code::store_failure: return "store_failure";
    case error_code::config_invalid: return "config_invalid";
    case error_code::data_integrity: return "data_integrity";
    case error_code::validation_failed: return "validation_failed";
    case error_code::not_found: return "not_found";
    case error_code::index_unavailable: return "index_unavailable";
    case error_code::cancelled: return "cancelled";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
  }
  return "unknown";
}

/** \brief Shorthand for building an unexpected error value. */
inline auto make_error(error_code code, std::string message, std::string component,
                       std::vector<std::uint64_t> ids = {})
    -> std::unexpected<error> {
  return std::unexpected(error{code, std::move(message), std::move(component), std::move(ids)});
}

} // namespace visage::core
