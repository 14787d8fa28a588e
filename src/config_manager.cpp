/**
 * @file config_manager.cpp
 * @brief Configuration file loader implementation for hostlogin.
 */

#include "config_manager.hpp"
#include "config_dir.hpp"

#include <filesystem>
#include <system_error>

namespace hostlogin {

Config ConfigManager::load(const std::string &path) const {
  return Config::from_file(path);
}

Config ConfigManager::load_default() const {
  namespace fs = std::filesystem;
  const std::string dir = cli_config_dir();
  if (dir.empty()) {
    return Config{};
  }
  for (const char *name :
       {"config.yaml", "config.yml", "config.toml", "config.json"}) {
    fs::path candidate = fs::path(dir) / name;
    std::error_code ec;
    if (fs::is_regular_file(candidate, ec)) {
      return load(candidate.string());
    }
  }
  return Config{};
}

} // namespace hostlogin
