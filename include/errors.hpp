/**
 * @file errors.hpp
 * @brief Error taxonomy shared by the login subsystem.
 *
 * Declares the ErrorKind enumeration and the LoginError exception thrown by
 * the hostname, discovery, authorization and credential store components.
 */
#ifndef HOSTLOGIN_ERRORS_HPP
#define HOSTLOGIN_ERRORS_HPP

#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace hostlogin {

/// Failure categories surfaced by the login subsystem.
enum class ErrorKind {
  InvalidHostname,       ///< Hostname cannot be parsed as a DNS host.
  DiscoveryFailed,       ///< Host metadata could not be obtained.
  UnsupportedHost,       ///< Host advertises no handshake we understand.
  AuthorizationFailed,   ///< Remote host rejected the handshake.
  AuthorizationTimedOut, ///< Handshake exceeded its deadline.
  Aborted,               ///< Handshake cancelled by the caller.
  CorruptStore,          ///< Existing credentials file is unreadable.
  PersistFailed          ///< Credentials file could not be written.
};

/**
 * Convert an error kind into its stable identifier.
 *
 * @param kind Error category.
 * @return Identifier such as "InvalidHostname".
 */
std::string to_string(ErrorKind kind);

/**
 * Whether an error kind aborts the attempt without touching the store.
 *
 * @param kind Error category.
 * @return `true` for CorruptStore and PersistFailed.
 */
bool is_fatal(ErrorKind kind);

/**
 * Exception carrying an ErrorKind.
 *
 * Lower-level causes are attached with std::throw_with_nested so that the
 * full chain can be reported through error_chain().
 */
class LoginError : public std::runtime_error {
public:
  LoginError(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  /// Category of the failure.
  ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

/**
 * Flatten an exception and its nested causes into a list of messages.
 *
 * @param e Outermost exception.
 * @return Messages ordered from outermost to innermost cause.
 */
std::vector<std::string> error_chain(const std::exception &e);

/**
 * Join the messages of an exception chain with ": ".
 *
 * @param e Outermost exception.
 * @return Single line describing the failure and its causes.
 */
std::string describe_error(const std::exception &e);

} // namespace hostlogin

#endif // HOSTLOGIN_ERRORS_HPP
