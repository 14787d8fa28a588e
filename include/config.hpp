#ifndef HOSTLOGIN_CONFIG_HPP
#define HOSTLOGIN_CONFIG_HPP

#include "hostname.hpp"
#include <chrono>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <utility>

namespace hostlogin {

/// Application configuration loaded from a YAML, TOML, or JSON file.
class Config {
public:
  /// Host used when the command line does not name one.
  const std::string &default_hostname() const { return default_hostname_; }

  /// Set the fallback host.
  void set_default_hostname(const std::string &host) {
    default_hostname_ = host;
  }

  /// Credentials file override; empty selects the default location.
  const std::string &credentials_file() const { return credentials_file_; }

  /// Set the credentials file override.
  void set_credentials_file(const std::string &path) {
    credentials_file_ = path;
  }

  /// Time allowed for the user to complete authorization.
  std::chrono::seconds authorization_timeout() const {
    return authorization_timeout_;
  }

  /// Set the authorization timeout.
  void set_authorization_timeout(std::chrono::seconds timeout) {
    authorization_timeout_ = timeout;
  }

  /// HTTP request timeout in seconds.
  int http_timeout() const { return http_timeout_; }

  /// Set HTTP request timeout.
  void set_http_timeout(int t) { http_timeout_ = t; }

  /// HTTP proxy URL.
  const std::string &http_proxy() const { return http_proxy_; }

  /// Set HTTP proxy URL.
  void set_http_proxy(const std::string &proxy) { http_proxy_ = proxy; }

  /// HTTPS proxy URL.
  const std::string &https_proxy() const { return https_proxy_; }

  /// Set HTTPS proxy URL.
  void set_https_proxy(const std::string &proxy) { https_proxy_ = proxy; }

  /// Whether the browser is launched for the authorization code flow.
  bool open_browser() const { return open_browser_; }

  void set_open_browser(bool open) { open_browser_ = open; }

  /// Logging verbosity level.
  const std::string &log_level() const { return log_level_; }

  /// Set logging verbosity level.
  void set_log_level(const std::string &level) { log_level_ = level; }

  /// Logging pattern.
  const std::string &log_pattern() const { return log_pattern_; }

  /// Set logging pattern.
  void set_log_pattern(const std::string &pattern) { log_pattern_ = pattern; }

  /// Path to the log file.
  const std::string &log_file() const { return log_file_; }

  /// Set log file path.
  void set_log_file(const std::string &file) { log_file_ = file; }

  /// Number of rotated log files to keep.
  int log_rotate() const { return log_rotate_; }

  /// Set number of rotated log files to keep.
  void set_log_rotate(int count) { log_rotate_ = count < 0 ? 0 : count; }

  /// Per-category log level overrides.
  const std::unordered_map<std::string, std::string> &log_categories() const {
    return log_categories_;
  }

  /// Replace per-category log level overrides.
  void set_log_categories(std::unordered_map<std::string, std::string> values) {
    log_categories_ = std::move(values);
  }

  /**
   * Discovery documents served locally instead of over the network.
   *
   * Keys are host names exactly as written in the configuration file; they
   * are normalized by the discoverer.
   */
  const std::map<std::string, nlohmann::json> &host_services() const {
    return host_services_;
  }

  /// Register a discovery override for @p host.
  void set_host_services(const std::string &host, nlohmann::json services) {
    host_services_[host] = std::move(services);
  }

  /**
   * Load configuration from a file.
   *
   * @param path Path to a YAML, TOML, or JSON configuration file.
   * @return Parsed configuration object.
   * @throws std::runtime_error When the file cannot be opened, parsed, or the
   *         extension is unsupported.
   */
  static Config from_file(const std::string &path);

  /**
   * Build configuration from an already parsed JSON document.
   *
   * @throws nlohmann::json::exception When values have the wrong type.
   * @throws std::invalid_argument On a malformed duration.
   */
  static Config from_json(const nlohmann::json &j);

private:
  void load_json(const nlohmann::json &j);

  std::string default_hostname_ = kDefaultHostname;
  std::string credentials_file_;
  std::chrono::seconds authorization_timeout_{std::chrono::minutes(5)};
  int http_timeout_ = 30;
  std::string http_proxy_;
  std::string https_proxy_;
  bool open_browser_ = true;
  std::string log_level_ = "info";
  std::string log_pattern_;
  std::string log_file_;
  int log_rotate_ = 3;
  std::unordered_map<std::string, std::string> log_categories_;
  std::map<std::string, nlohmann::json> host_services_;
};

} // namespace hostlogin

#endif // HOSTLOGIN_CONFIG_HPP
