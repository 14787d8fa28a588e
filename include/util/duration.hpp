/**
 * @file duration.hpp
 * @brief Human-readable duration parsing utilities.
 *
 * Parses duration strings such as "90s", "5m" or "1h30m" used for the
 * authorization timeout setting.
 */
#ifndef HOSTLOGIN_UTIL_DURATION_HPP
#define HOSTLOGIN_UTIL_DURATION_HPP

#include <chrono>
#include <string>

namespace hostlogin {

/**
 * Parse a human-readable duration string into seconds.
 *
 * Units `s`, `m` and `h` may be combined ("1h30m"); a bare number is read as
 * seconds. Surrounding whitespace is ignored.
 *
 * @param str Duration string; an empty string yields zero.
 * @return Parsed duration.
 * @throws std::invalid_argument On malformed input, unknown units or overflow.
 */
std::chrono::seconds parse_duration(const std::string &str);

/**
 * Format a duration compactly, e.g. 330 seconds as "5m30s".
 *
 * @param value Duration to format.
 * @return Formatted string; zero is "0s".
 */
std::string format_duration(std::chrono::seconds value);

} // namespace hostlogin

#endif // HOSTLOGIN_UTIL_DURATION_HPP
