#ifndef HOSTLOGIN_CONFIG_MANAGER_HPP
#define HOSTLOGIN_CONFIG_MANAGER_HPP

#include "config.hpp"
#include <string>

namespace hostlogin {

/// Utility class for locating and loading configuration files.
class ConfigManager {
public:
  /**
   * Load a configuration from a YAML, TOML, or JSON file.
   *
   * @param path Path to the configuration file on disk.
   * @return Parsed configuration object.
   * @throws std::runtime_error When the file cannot be read or parsed.
   */
  Config load(const std::string &path) const;

  /**
   * Load the configuration used when no `-C` option is given.
   *
   * Looks for `config.yaml`, `config.yml`, `config.toml` and `config.json`
   * in the configuration directory and loads the first one present.
   *
   * @return Defaults when no file exists.
   */
  Config load_default() const;
};

} // namespace hostlogin

#endif // HOSTLOGIN_CONFIG_MANAGER_HPP
