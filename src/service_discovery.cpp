#include "service_discovery.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <spdlog/spdlog.h>

namespace hostlogin {

namespace {

std::shared_ptr<spdlog::logger> discovery_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("discovery");
  }();
  return logger;
}

[[noreturn]] void unsupported(const Hostname &host, const std::string &reason) {
  throw LoginError(ErrorKind::UnsupportedHost,
                   "Host " + host.display +
                       " does not support automatic login: " + reason + ".");
}

void require_login_service(const Hostname &host,
                           const nlohmann::json &services) {
  if (!services.contains(kLoginService)) {
    throw LoginError(ErrorKind::DiscoveryFailed,
                     "Host " + host.display +
                         " does not offer the login.v1 service required for "
                         "automatic login.");
  }
}

std::string required_string(const Hostname &host, const nlohmann::json &obj,
                            const char *key) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    return {};
  }
  if (!it->is_string()) {
    unsupported(host, std::string("the \"") + key +
                          "\" property of login.v1 must be a string");
  }
  return it->get<std::string>();
}

std::vector<std::string> string_list(const Hostname &host,
                                     const nlohmann::json &obj,
                                     const char *key) {
  std::vector<std::string> out;
  auto it = obj.find(key);
  if (it == obj.end()) {
    return out;
  }
  if (!it->is_array()) {
    unsupported(host, std::string("the \"") + key +
                          "\" property of login.v1 must be a list");
  }
  for (const auto &item : *it) {
    if (!item.is_string()) {
      unsupported(host, std::string("the \"") + key +
                            "\" property of login.v1 must list strings");
    }
    out.push_back(item.get<std::string>());
  }
  return out;
}

} // namespace

bool OAuthClient::supports(const std::string &grant_type) const {
  auto matches = [&](const std::string &g) {
    if (g == grant_type) {
      return true;
    }
    bool device_alias =
        (g == grant::kDeviceCode || g == grant::kDeviceCodeShort);
    bool device_wanted = (grant_type == grant::kDeviceCode ||
                          grant_type == grant::kDeviceCodeShort);
    return device_alias && device_wanted;
  };
  return std::any_of(grant_types.begin(), grant_types.end(), matches);
}

ServiceEndpointSet::ServiceEndpointSet(Hostname host, std::string discovery_url,
                                       nlohmann::json services)
    : host_(std::move(host)), discovery_url_(std::move(discovery_url)),
      services_(std::move(services)) {
  if (!services_.is_object()) {
    services_ = nlohmann::json::object();
  }
}

bool ServiceEndpointSet::has(const std::string &service) const {
  return services_.contains(service);
}

std::optional<std::string>
ServiceEndpointSet::service_url(const std::string &service) const {
  auto it = services_.find(service);
  if (it == services_.end() || !it->is_string()) {
    return std::nullopt;
  }
  try {
    return resolve_url(discovery_url_, it->get<std::string>());
  } catch (const std::invalid_argument &e) {
    discovery_log()->warn("Ignoring service {} of {}: {}", service,
                          host_.display, e.what());
    return std::nullopt;
  }
}

OAuthClient ServiceEndpointSet::login_client() const {
  auto it = services_.find(kLoginService);
  if (it == services_.end()) {
    unsupported(host_, "it does not advertise the login.v1 service");
  }
  if (!it->is_object()) {
    unsupported(host_, "the login.v1 service must be described by an object");
  }
  const nlohmann::json &obj = *it;
  OAuthClient client;
  client.client_id = required_string(host_, obj, "client");
  if (client.client_id.empty()) {
    unsupported(host_, "login.v1 does not name an OAuth client");
  }
  client.grant_types = string_list(host_, obj, "grant_types");
  if (!obj.contains("grant_types")) {
    client.grant_types.push_back(grant::kAuthzCode);
  }
  client.scopes = string_list(host_, obj, "scopes");

  auto resolve = [&](const char *key) -> std::string {
    std::string raw = required_string(host_, obj, key);
    if (raw.empty()) {
      return raw;
    }
    try {
      return resolve_url(discovery_url_, raw);
    } catch (const std::invalid_argument &e) {
      unsupported(host_, std::string("login.v1 has an invalid \"") + key +
                             "\" URL (" + e.what() + ")");
    }
  };
  client.authz_url = resolve("authz");
  client.token_url = resolve("token");
  client.device_url = resolve("device");

  if (auto ports = obj.find("ports"); ports != obj.end()) {
    if (!ports->is_array() || ports->size() != 2 ||
        !(*ports)[0].is_number_integer() || !(*ports)[1].is_number_integer()) {
      unsupported(host_, "login.v1 \"ports\" must be a pair of integers");
    }
    auto min_port = (*ports)[0].get<long long>();
    auto max_port = (*ports)[1].get<long long>();
    if (min_port < 1024 || max_port > 65535 || min_port > max_port) {
      unsupported(host_, "login.v1 \"ports\" must be an ordered range within "
                         "1024-65535");
    }
    client.min_port = static_cast<int>(min_port);
    client.max_port = static_cast<int>(max_port);
  }
  return client;
}

HttpServiceDiscoverer::HttpServiceDiscoverer(
    HttpClient &http, std::map<std::string, nlohmann::json> overrides)
    : http_(http) {
  for (auto &[name, services] : overrides) {
    try {
      overrides_[for_comparison(name)] = std::move(services);
    } catch (const LoginError &e) {
      discovery_log()->warn("Ignoring service override: {}", e.what());
    }
  }
}

std::string HttpServiceDiscoverer::discovery_url(const Hostname &host) {
  return "https://" + host.comparison_key + kDiscoveryPath;
}

ServiceEndpointSet HttpServiceDiscoverer::discover(const Hostname &host) {
  const std::string url = discovery_url(host);
  if (auto it = overrides_.find(host.comparison_key); it != overrides_.end()) {
    discovery_log()->info("Using configured services for {}", host.display);
    if (!it->second.is_object()) {
      throw LoginError(ErrorKind::DiscoveryFailed,
                       "The configured services for " + host.display +
                           " must be an object.");
    }
    require_login_service(host, it->second);
    return ServiceEndpointSet(host, url, it->second);
  }

  discovery_log()->debug("Discovering services for {} at {}", host.display,
                         url);
  HttpResponse response;
  try {
    response = http_.get(url, {"Accept: application/json"});
  } catch (const HttpStatusError &e) {
    if (e.status() == 404) {
      std::throw_with_nested(LoginError(
          ErrorKind::DiscoveryFailed,
          "Host " + host.display + " does not provide any services."));
    }
    std::throw_with_nested(LoginError(
        ErrorKind::DiscoveryFailed,
        "Failed to request discovery document for " + host.display +
            ": the server responded with HTTP status " +
            std::to_string(e.status()) + "."));
  } catch (const RequestCancelled &) {
    std::throw_with_nested(LoginError(
        ErrorKind::Aborted,
        "Service discovery for " + host.display + " was interrupted."));
  } catch (const std::runtime_error &) {
    std::throw_with_nested(LoginError(
        ErrorKind::DiscoveryFailed,
        "Failed to request discovery document for " + host.display + "."));
  }

  if (auto type = response.header("Content-Type")) {
    std::string media = type->substr(0, type->find(';'));
    std::transform(media.begin(), media.end(), media.begin(),
                   [](unsigned char c) {
                     return static_cast<char>(std::tolower(c));
                   });
    if (media.find("json") == std::string::npos) {
      throw LoginError(ErrorKind::DiscoveryFailed,
                       "Discovery URL for " + host.display +
                           " returned an unsupported document type \"" +
                           media + "\".");
    }
  }
  if (response.body.size() > static_cast<std::size_t>(kMaxDiscoveryBytes)) {
    throw LoginError(ErrorKind::DiscoveryFailed,
                     "Discovery document for " + host.display +
                         " is larger than 1 MiB.");
  }

  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(response.body);
  } catch (const nlohmann::json::parse_error &) {
    std::throw_with_nested(LoginError(
        ErrorKind::DiscoveryFailed,
        "Discovery document for " + host.display + " is not valid JSON."));
  }
  if (!doc.is_object()) {
    throw LoginError(ErrorKind::DiscoveryFailed,
                     "Discovery document for " + host.display +
                         " must be a JSON object.");
  }
  require_login_service(host, doc);
  discovery_log()->info("Discovered {} service(s) for {}", doc.size(),
                        host.display);
  return ServiceEndpointSet(host, url, std::move(doc));
}

} // namespace hostlogin
