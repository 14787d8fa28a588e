#ifndef HOSTLOGIN_CREDENTIAL_HPP
#define HOSTLOGIN_CREDENTIAL_HPP

#include "hostname.hpp"

#include <optional>
#include <string>

namespace hostlogin {

/// Bearer credential bound to one host.
struct Credential {
  std::string token;
  std::optional<std::string> refresh_token;
  Hostname host;
};

} // namespace hostlogin

#endif // HOSTLOGIN_CREDENTIAL_HPP
