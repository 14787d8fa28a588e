/**
 * @file token_acquirer.hpp
 * @brief OAuth token acquisition for discovered hosts.
 *
 * The acquirer picks a handshake from the grant types a host advertises in
 * its `login.v1` service and drives it until a bearer token is issued, the
 * user cancels, or the authorization timeout elapses.
 */
#ifndef HOSTLOGIN_TOKEN_ACQUIRER_HPP
#define HOSTLOGIN_TOKEN_ACQUIRER_HPP

#include "authorization_ui.hpp"
#include "cancellation.hpp"
#include "credential.hpp"
#include "hostname.hpp"
#include "http_client.hpp"
#include "service_discovery.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace hostlogin {

/** Interface for obtaining credentials from a discovered host. */
class TokenAcquirer {
public:
  virtual ~TokenAcquirer() = default;

  /**
   * Run the authorization handshake advertised by @p endpoints.
   *
   * @return Credential bound to `endpoints.host()`.
   * @throws LoginError with ErrorKind::UnsupportedHost,
   *         ErrorKind::AuthorizationFailed, ErrorKind::AuthorizationTimedOut
   *         or ErrorKind::Aborted.
   */
  virtual Credential acquire(const ServiceEndpointSet &endpoints,
                             const CancellationToken &cancel) = 0;
};

/// Proof Key for Code Exchange parameters.
struct PkcePair {
  std::string verifier;
  std::string challenge; ///< S256 challenge derived from the verifier
};

/// Unpadded base64url encoding.
std::string base64url_encode(const unsigned char *data, std::size_t len);

/// Random base64url string built from @p bytes bytes of OpenSSL randomness.
std::string random_urlsafe(std::size_t bytes);

/// S256 code challenge for @p verifier.
std::string pkce_challenge(const std::string &verifier);

/// Fresh verifier and matching challenge.
PkcePair make_pkce_pair();

/// Decode an `application/x-www-form-urlencoded` value.
std::string url_decode(const std::string &value);

/// Parse the query string of a request target such as `/login?code=x`.
std::map<std::string, std::string> parse_query(const std::string &target);

/// Request received on the loopback redirect endpoint.
struct CallbackRequest {
  std::string path;
  std::map<std::string, std::string> params;
};

/**
 * HTTP listener on 127.0.0.1 receiving the authorization redirect.
 *
 * Binds the first free port in the requested range on construction and
 * closes its socket on destruction.
 */
class LoopbackListener {
public:
  /**
   * @throws std::system_error when no port in the range can be bound.
   */
  LoopbackListener(int min_port, int max_port);
  ~LoopbackListener();
  LoopbackListener(const LoopbackListener &) = delete;
  LoopbackListener &operator=(const LoopbackListener &) = delete;

  int port() const { return port_; }

  /// Redirect URI to register with the authorization request.
  std::string redirect_uri() const;

  /**
   * Wait for the browser to hit the redirect path.
   *
   * Requests for other paths are answered with 404 and ignored. The browser
   * receives a short HTML page describing the outcome.
   *
   * @throws LoginError with ErrorKind::Aborted on cancellation or
   *         ErrorKind::AuthorizationTimedOut when @p deadline passes.
   */
  CallbackRequest wait(const CancellationToken &cancel,
                       const Deadline &deadline);

private:
  int fd_ = -1;
  int port_ = 0;
};

/// Tunables of OAuthTokenAcquirer.
struct AcquirerOptions {
  /// Total time allowed for the user to complete authorization.
  std::chrono::milliseconds timeout = std::chrono::minutes(5);
  /// Duration of one second of a server-provided polling interval.
  std::chrono::milliseconds interval_unit = std::chrono::seconds(1);
};

/**
 * Acquirer implementing the `login.v1` OAuth grants.
 *
 * Preference order: authorization code with PKCE, device code, password.
 */
class OAuthTokenAcquirer : public TokenAcquirer {
public:
  OAuthTokenAcquirer(HttpClient &http, AuthorizationUi &ui,
                     AcquirerOptions options = {});

  Credential acquire(const ServiceEndpointSet &endpoints,
                     const CancellationToken &cancel) override;

  /**
   * Grant type that will be used for @p client.
   *
   * @throws LoginError with ErrorKind::UnsupportedHost when no supported
   *         grant is advertised or its endpoints are missing.
   */
  static std::string select_grant(const Hostname &host,
                                  const OAuthClient &client);

private:
  Credential authorization_code(const Hostname &host, const OAuthClient &client,
                                const CancellationToken &cancel,
                                const Deadline &deadline);
  Credential device_code(const Hostname &host, const OAuthClient &client,
                         const CancellationToken &cancel,
                         const Deadline &deadline);
  Credential password(const Hostname &host, const OAuthClient &client,
                      const CancellationToken &cancel,
                      const Deadline &deadline);
  HttpResponse post(const Hostname &host, const std::string &url,
                    const FormFields &fields, const CancellationToken &cancel);

  HttpClient &http_;
  AuthorizationUi &ui_;
  AcquirerOptions options_;
};

} // namespace hostlogin

#endif // HOSTLOGIN_TOKEN_ACQUIRER_HPP
