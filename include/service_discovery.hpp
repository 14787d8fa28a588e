/**
 * @file service_discovery.hpp
 * @brief Well-known service discovery for remote hosts.
 *
 * A host advertises the services it offers through a JSON document served at
 * `/.well-known/terraform.json`. The discoverer fetches that document once
 * per login attempt and exposes it as a ServiceEndpointSet.
 */
#ifndef HOSTLOGIN_SERVICE_DISCOVERY_HPP
#define HOSTLOGIN_SERVICE_DISCOVERY_HPP

#include "hostname.hpp"
#include "http_client.hpp"

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace hostlogin {

/// Service identifier of the login protocol consumed by the acquirer.
inline constexpr const char *kLoginService = "login.v1";

/// Path of the discovery document on every host.
inline constexpr const char *kDiscoveryPath = "/.well-known/terraform.json";

/// Largest discovery document accepted.
inline constexpr long kMaxDiscoveryBytes = 1024 * 1024;

/// Grant type identifiers advertised in `login.v1`.
namespace grant {
inline constexpr const char *kAuthzCode = "authz_code";
inline constexpr const char *kDeviceCode =
    "urn:ietf:params:oauth:grant-type:device_code";
inline constexpr const char *kDeviceCodeShort = "device_code";
inline constexpr const char *kPassword = "password";
} // namespace grant

/**
 * OAuth client parameters advertised by the `login.v1` service.
 *
 * URLs are already resolved against the discovery document location.
 */
struct OAuthClient {
  std::string client_id;
  std::vector<std::string> grant_types;
  std::string authz_url;
  std::string token_url;
  std::string device_url;
  int min_port = 1024;
  int max_port = 65535;
  std::vector<std::string> scopes;

  /// Whether @p grant_type (or its short alias) is advertised.
  bool supports(const std::string &grant_type) const;
};

/// Services advertised by one host.
class ServiceEndpointSet {
public:
  ServiceEndpointSet(Hostname host, std::string discovery_url,
                     nlohmann::json services);

  const Hostname &host() const { return host_; }
  const std::string &discovery_url() const { return discovery_url_; }
  const nlohmann::json &services() const { return services_; }

  bool has(const std::string &service) const;

  /**
   * URL advertised for a service, resolved against the discovery URL.
   *
   * @return Empty when the service is absent or is not a URL string.
   */
  std::optional<std::string> service_url(const std::string &service) const;

  /**
   * Parse the `login.v1` object.
   *
   * When `grant_types` is absent the host is assumed to support `authz_code`.
   *
   * @throws LoginError with ErrorKind::UnsupportedHost when the service is
   *         missing, is not an object or lacks a client id.
   */
  OAuthClient login_client() const;

private:
  Hostname host_;
  std::string discovery_url_;
  nlohmann::json services_;
};

/// Resolves a canonical host to its advertised services.
class ServiceDiscoverer {
public:
  virtual ~ServiceDiscoverer() = default;

  /**
   * Discover the services of @p host.
   *
   * @throws LoginError with ErrorKind::DiscoveryFailed. The message is a
   *         sentence for end users naming the host.
   */
  virtual ServiceEndpointSet discover(const Hostname &host) = 0;
};

/**
 * Discoverer fetching the well-known document over HTTPS.
 *
 * Hosts present in the override map are answered from configuration without
 * network access. Override keys are normalized hostnames.
 */
class HttpServiceDiscoverer : public ServiceDiscoverer {
public:
  explicit HttpServiceDiscoverer(
      HttpClient &http, std::map<std::string, nlohmann::json> overrides = {});

  ServiceEndpointSet discover(const Hostname &host) override;

  /// Discovery URL for @p host.
  static std::string discovery_url(const Hostname &host);

private:
  HttpClient &http_;
  std::map<std::string, nlohmann::json> overrides_;
};

} // namespace hostlogin

#endif // HOSTLOGIN_SERVICE_DISCOVERY_HPP
