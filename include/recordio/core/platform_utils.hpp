#pragma once

/** \file platform_utils.hpp
 *  \brief Environment lookups used for runtime knobs (RECORDIO_*).
 */

#include <optional>
#include <string>
#include <string_view>

namespace recordio::core {

/** \brief Portable getenv.
 *
 * Returns std::nullopt when the variable is unset. A variable set to the empty
 * string yields an engaged, empty optional on POSIX; the Windows CRT removes
 * empty variables, so there it reads as unset.
 */
auto safe_getenv(const char* name) noexcept -> std::optional<std::string>;

/** \brief ASCII case-insensitive comparison. */
auto equals_ci(std::string_view a, std::string_view b) noexcept -> bool;

} // namespace recordio::core
