/**
 * @file login.hpp
 * @brief Login and logout flows composing normalization, discovery,
 *        authorization and credential persistence.
 */
#ifndef HOSTLOGIN_LOGIN_HPP
#define HOSTLOGIN_LOGIN_HPP

#include "cancellation.hpp"
#include "diagnostics.hpp"
#include "hostname.hpp"
#include "service_discovery.hpp"
#include "token_acquirer.hpp"

#include <string>

namespace hostlogin {

/// Progress of a login attempt.
enum class LoginState {
  Start,
  Normalized,
  Discovered,
  Acquired,
  Persisted,
  Done,
  Failed
};

/// Lower-case name of a state, e.g. "discovered".
std::string to_string(LoginState state);

/// Result of LoginOrchestrator::login().
struct LoginOutcome {
  LoginState state{LoginState::Start};
  /// Last state reached before a failure; equals state on success.
  LoginState reached{LoginState::Start};
  std::string display_hostname;
  std::string comparison_key;
  std::string credentials_file;
  Diagnostics diagnostics;

  bool succeeded() const { return state == LoginState::Done; }
};

/// Result of LoginOrchestrator::logout().
struct LogoutOutcome {
  bool removed = false; ///< Whether a stored credential was deleted
  std::string display_hostname;
  std::string comparison_key;
  std::string credentials_file;
  Diagnostics diagnostics;

  bool succeeded() const { return !diagnostics.has_errors(); }
};

/**
 * Remove the credential stored for @p raw_hostname from @p credentials_file
 * (default_credentials_file() when empty).
 *
 * A missing entry is reported as a warning and the file is not touched.
 */
LogoutOutcome logout(const std::string &raw_hostname,
                     const std::string &credentials_file,
                     const std::string &default_hostname = kDefaultHostname);

/**
 * Runs `Start -> Normalized -> Discovered -> Acquired -> Persisted -> Done`.
 *
 * Every failure ends the attempt in `Failed` and is reported as a diagnostic
 * instead of an exception. The credentials file is only written in the
 * `Persisted` step.
 */
class LoginOrchestrator {
public:
  /**
   * @param discoverer Source of service endpoints.
   * @param acquirer Performs the authorization handshake.
   * @param default_hostname Host used when the caller passes an empty name.
   */
  LoginOrchestrator(ServiceDiscoverer &discoverer, TokenAcquirer &acquirer,
                    std::string default_hostname = kDefaultHostname);

  /**
   * Log in to @p raw_hostname and store the credential in
   * @p credentials_file, or in default_credentials_file() when empty.
   */
  LoginOutcome login(const std::string &raw_hostname,
                     const std::string &credentials_file,
                     const CancellationToken &cancel = {});

  /// Remove the credential stored for @p raw_hostname.
  LogoutOutcome logout(const std::string &raw_hostname,
                       const std::string &credentials_file) const;

private:
  ServiceDiscoverer &discoverer_;
  TokenAcquirer &acquirer_;
  std::string default_hostname_;
};

} // namespace hostlogin

#endif // HOSTLOGIN_LOGIN_HPP
