/**
 * @file hostname.hpp
 * @brief Hostname canonicalization for credential lookups.
 *
 * Turns user-supplied hostnames into a display form and a comparison key. Two
 * inputs that differ only in letter case, in the implicit HTTPS port or in
 * IDNA encoding yield the same key. No network access is performed.
 */
#ifndef HOSTLOGIN_HOSTNAME_HPP
#define HOSTLOGIN_HOSTNAME_HPP

#include <optional>
#include <string>

namespace hostlogin {

/// Host used when the caller does not name one.
inline constexpr const char *kDefaultHostname = "app.terraform.io";

/// Port implied by the HTTPS scheme; removed during normalization.
inline constexpr int kDefaultHttpsPort = 443;

/// Canonicalized hostname.
struct Hostname {
  std::string display;        ///< Unicode form for messages, with port
  std::string comparison_key; ///< Lower-case ASCII (punycode) form, with port
  std::optional<int> port;    ///< Explicit non-default port

  /// Comparison key without the port suffix.
  std::string host() const;

  bool operator==(const Hostname &other) const {
    return comparison_key == other.comparison_key;
  }
  bool operator!=(const Hostname &other) const { return !(*this == other); }
};

/**
 * Normalize a raw hostname.
 *
 * @param raw User input, optionally with a `:port` suffix.
 * @param default_host Host substituted when @p raw is blank.
 * @return Canonical hostname.
 * @throws LoginError with ErrorKind::InvalidHostname when the input is not a
 *         valid DNS-style host. The message includes @p raw and the reason.
 */
Hostname normalize_hostname(const std::string &raw,
                            const std::string &default_host = kDefaultHostname);

/**
 * Return the comparison key of a hostname.
 *
 * @throws LoginError with ErrorKind::InvalidHostname on invalid input.
 */
std::string for_comparison(const std::string &raw);

/**
 * Return a display form of a hostname.
 *
 * Never fails: input that cannot be normalized is returned trimmed but
 * otherwise unchanged so it can still appear in error messages.
 */
std::string for_display(const std::string &raw);

} // namespace hostlogin

#endif // HOSTLOGIN_HOSTNAME_HPP
