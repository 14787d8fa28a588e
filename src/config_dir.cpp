#include "config_dir.hpp"

#include <cstdlib>
#include <filesystem>

namespace hostlogin {

namespace {
std::string env_value(const char *name) {
  const char *value = std::getenv(name);
  return value ? std::string(value) : std::string();
}
} // namespace

std::string cli_config_dir() {
  namespace fs = std::filesystem;
  if (auto dir = env_value("HOSTLOGIN_CONFIG_DIR"); !dir.empty()) {
    return dir;
  }
  if (auto xdg = env_value("XDG_CONFIG_HOME"); !xdg.empty()) {
    return (fs::path(xdg) / "hostlogin").string();
  }
  if (auto home = env_value("HOME"); !home.empty()) {
    return (fs::path(home) / ".config" / "hostlogin").string();
  }
  if (auto appdata = env_value("APPDATA"); !appdata.empty()) {
    return (fs::path(appdata) / "hostlogin").string();
  }
  return {};
}

std::string default_credentials_file() {
  std::string dir = cli_config_dir();
  if (dir.empty()) {
    return {};
  }
  return (std::filesystem::path(dir) / kCredentialsFileName).string();
}

} // namespace hostlogin
