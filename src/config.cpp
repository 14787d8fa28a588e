#include "config.hpp"
#include "log.hpp"
#include "util/duration.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace hostlogin {

namespace {

std::shared_ptr<spdlog::logger> config_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("config");
  }();
  return logger;
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

bool is_integer_literal(const std::string &s) {
  std::size_t start = (!s.empty() && (s[0] == '-' || s[0] == '+')) ? 1 : 0;
  return s.size() > start &&
         std::all_of(s.begin() + static_cast<std::ptrdiff_t>(start), s.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; });
}

/**
 * Convert a YAML node into a structurally equivalent JSON value.
 *
 * Scalars that look like booleans or decimal integers keep that type; every
 * other scalar stays a string so durations such as "5m" and host names are
 * not reinterpreted.
 */
nlohmann::json yaml_to_json(const YAML::Node &node) {
  using nlohmann::json;
  switch (node.Type()) {
  case YAML::NodeType::Null:
    return nullptr;
  case YAML::NodeType::Scalar: {
    const std::string s = node.Scalar();
    if (node.Tag() == "!") {
      return s; // quoted scalar
    }
    const std::string lower = to_lower_copy(s);
    if (lower == "true")
      return true;
    if (lower == "false")
      return false;
    if (is_integer_literal(s)) {
      try {
        return std::stoll(s);
      } catch (const std::out_of_range &) {
        return s;
      }
    }
    return s;
  }
  case YAML::NodeType::Sequence: {
    json arr = json::array();
    auto &array = arr.get_ref<json::array_t &>();
    array.reserve(node.size());
    std::transform(node.begin(), node.end(), std::back_inserter(array),
                   [](const YAML::Node &item) { return yaml_to_json(item); });
    return arr;
  }
  case YAML::NodeType::Map: {
    json obj = json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  default:
    return nullptr;
  }
}

/**
 * Translate a TOML node to a JSON representation.
 *
 * @param node TOML node read from a parsed document.
 * @return JSON value containing the equivalent data.
 */
nlohmann::json toml_to_json(const toml::node &node) {
  using nlohmann::json;
  if (const auto *table = node.as_table()) {
    json obj = json::object();
    for (const auto &kv : *table) {
      obj[std::string(kv.first.str())] = toml_to_json(kv.second);
    }
    return obj;
  }

  if (const auto *array = node.as_array()) {
    json arr = json::array();
    arr.get_ref<json::array_t &>().reserve(array->size());
    for (const auto &item : *array) {
      arr.push_back(toml_to_json(item));
    }
    return arr;
  }

  if (const auto *value = node.as_boolean())
    return value->get();
  if (const auto *value = node.as_integer())
    return value->get();
  if (const auto *value = node.as_floating_point())
    return value->get();
  if (const auto *value = node.as_string())
    return value->get();

  return nullptr;
}

/**
 * Merge the grouped sections `login`, `network` and `logging` into the root
 * object so grouped and flat files expose the same keys. The `hosts` section
 * is kept in place.
 */
nlohmann::json normalize_config_sections(const nlohmann::json &source) {
  nlohmann::json normalized = source;
  auto merge_section = [&normalized](std::string_view name) {
    auto it = normalized.find(std::string{name});
    if (it == normalized.end() || !it->is_object()) {
      return;
    }
    const nlohmann::json section = *it;
    for (auto item = section.begin(); item != section.end(); ++item) {
      normalized[item.key()] = item.value();
    }
  };

  for (std::string_view section : {"login", "network", "logging"}) {
    merge_section(section);
  }

  return normalized;
}

std::chrono::seconds duration_value(const nlohmann::json &value) {
  if (value.is_number_integer()) {
    auto secs = value.get<long long>();
    if (secs < 0) {
      throw std::invalid_argument("Duration must not be negative");
    }
    return std::chrono::seconds(secs);
  }
  return parse_duration(value.get<std::string>());
}

void assign_category(std::unordered_map<std::string, std::string> &categories,
                     std::string name, std::string level) {
  if (name.empty()) {
    return;
  }
  if (level.empty()) {
    level = "debug";
  }
  categories[std::move(name)] = std::move(level);
}

void assign_category_spec(
    std::unordered_map<std::string, std::string> &categories,
    const std::string &raw) {
  auto pos = raw.find('=');
  assign_category(categories,
                  pos == std::string::npos ? raw : raw.substr(0, pos),
                  pos == std::string::npos ? std::string{"debug"}
                                           : raw.substr(pos + 1));
}

} // namespace

/**
 * Populate the configuration from a JSON object.
 *
 * Unknown keys are ignored. `hosts` maps a host name to an object whose
 * `services` member is the discovery document served for that host.
 *
 * @throws nlohmann::json::exception When values have the wrong type.
 */
void Config::load_json(const nlohmann::json &j) {
  if (!j.is_object()) {
    if (j.is_null()) {
      return;
    }
    throw std::runtime_error("Configuration root must be a mapping");
  }
  nlohmann::json cfg = normalize_config_sections(j);

  if (cfg.contains("default_hostname")) {
    set_default_hostname(cfg["default_hostname"].get<std::string>());
  }
  if (cfg.contains("credentials_file")) {
    set_credentials_file(cfg["credentials_file"].get<std::string>());
  }
  if (cfg.contains("authorization_timeout")) {
    set_authorization_timeout(duration_value(cfg["authorization_timeout"]));
  }
  if (cfg.contains("http_timeout")) {
    set_http_timeout(cfg["http_timeout"].get<int>());
  }
  if (cfg.contains("http_proxy")) {
    set_http_proxy(cfg["http_proxy"].get<std::string>());
  }
  if (cfg.contains("https_proxy")) {
    set_https_proxy(cfg["https_proxy"].get<std::string>());
  }
  if (cfg.contains("open_browser")) {
    set_open_browser(cfg["open_browser"].get<bool>());
  }
  if (cfg.contains("log_level")) {
    set_log_level(cfg["log_level"].get<std::string>());
  }
  if (cfg.contains("log_pattern")) {
    set_log_pattern(cfg["log_pattern"].get<std::string>());
  }
  if (cfg.contains("log_file")) {
    set_log_file(cfg["log_file"].get<std::string>());
  }
  if (cfg.contains("log_rotate")) {
    set_log_rotate(cfg["log_rotate"].get<int>());
  }
  if (cfg.contains("log_categories")) {
    std::unordered_map<std::string, std::string> categories;
    const auto &value = cfg["log_categories"];
    if (value.is_object()) {
      for (auto it = value.begin(); it != value.end(); ++it) {
        if (it.value().is_string()) {
          assign_category(categories, it.key(),
                          it.value().get<std::string>());
        } else if (it.value().is_null()) {
          assign_category(categories, it.key(), "debug");
        } else {
          config_log()->warn("Unsupported value for log category '{}'; "
                             "expected string or null",
                             it.key());
        }
      }
    } else if (value.is_array()) {
      for (const auto &item : value) {
        if (item.is_string()) {
          assign_category_spec(categories, item.get<std::string>());
        }
      }
    } else if (value.is_string()) {
      assign_category_spec(categories, value.get<std::string>());
    }
    set_log_categories(std::move(categories));
  }
  if (cfg.contains("hosts")) {
    const auto &hosts = cfg["hosts"];
    if (!hosts.is_object()) {
      throw std::runtime_error("'hosts' must be a mapping of host names");
    }
    for (auto it = hosts.begin(); it != hosts.end(); ++it) {
      const auto &entry = it.value();
      if (!entry.is_object() || !entry.contains("services")) {
        config_log()->warn("Ignoring host '{}' without a services mapping",
                           it.key());
        continue;
      }
      set_host_services(it.key(), entry["services"]);
    }
  }
}

/**
 * Construct a configuration object from a JSON representation.
 *
 * @param j JSON document with configuration values.
 * @return Populated configuration instance.
 */
Config Config::from_json(const nlohmann::json &j) {
  Config cfg;
  cfg.load_json(j);
  return cfg;
}

/**
 * Load configuration from a file on disk.
 *
 * The file type is inferred from the extension and may be YAML, JSON, or
 * TOML. Errors during parsing are logged and rethrown.
 */
Config Config::from_file(const std::string &path) {
  config_log()->debug("Loading config from {}", path);
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos) {
    config_log()->error("Unknown config file extension for {}", path);
    throw std::runtime_error("Unknown config file extension: " + path);
  }
  std::string ext = path.substr(pos + 1);
  std::string ext_lower = to_lower_copy(ext);
  config_log()->debug("Detected config file type: {}", ext_lower);
  Config cfg;
  try {
    nlohmann::json j;
    if (ext_lower == "yaml" || ext_lower == "yml") {
      YAML::Node node = YAML::LoadFile(path);
      j = yaml_to_json(node);
    } else if (ext_lower == "json") {
      std::ifstream f(path);
      if (!f) {
        config_log()->error("Failed to open config file {}", path);
        throw std::runtime_error("Failed to open config file " + path);
      }
      f >> j;
    } else if (ext_lower == "toml" || ext_lower == "tml") {
      toml::table tbl = toml::parse_file(path);
      j = toml_to_json(tbl);
    } else {
      config_log()->error("Unsupported config format: {}", ext);
      throw std::runtime_error("Unsupported config format: " + ext);
    }
    cfg.load_json(j);
  } catch (const std::exception &e) {
    config_log()->error("Failed to load config {}: {}", path, e.what());
    throw;
  }
  config_log()->info("Config loaded successfully from {}", path);
  return cfg;
}

} // namespace hostlogin
