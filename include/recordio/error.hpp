#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling.
 * - Human-readable message and originating component for diagnostics.
 * - Local corruption inside a record log is never an error; the reader
 *   recovers from it and reports it through its observer.
 */

#include <cstdint>
#include <expected>
#include <string>

namespace recordio::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,
  io_eof = 1002,
  data_integrity = 3001,
  precondition_failed = 4001,
  resource_exhausted = 5001,
  not_found = 6001,
  internal = 9001,
  invalid_argument = 9002,
  out_of_range = 9004,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "log.writer" */
};

/** \brief Short stable name for an error code ("io_failed", ...). */
auto to_string(error_code ec) noexcept -> const char*;

} // namespace recordio::core
