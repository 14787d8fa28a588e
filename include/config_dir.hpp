#ifndef HOSTLOGIN_CONFIG_DIR_HPP
#define HOSTLOGIN_CONFIG_DIR_HPP

#include <string>

namespace hostlogin {

/// File name of the credentials store inside the configuration directory.
inline constexpr const char *kCredentialsFileName = "credentials.tfrc";

/**
 * Resolve the per-user configuration directory.
 *
 * Checked in order: `HOSTLOGIN_CONFIG_DIR`, `$XDG_CONFIG_HOME/hostlogin`,
 * `$HOME/.config/hostlogin`, `%APPDATA%/hostlogin`.
 *
 * @return Directory path, or an empty string when none can be determined.
 */
std::string cli_config_dir();

/**
 * Default credentials file path.
 *
 * @return `<cli_config_dir()>/credentials.tfrc`, or an empty string when no
 *         configuration directory is available.
 */
std::string default_credentials_file();

} // namespace hostlogin

#endif // HOSTLOGIN_CONFIG_DIR_HPP
