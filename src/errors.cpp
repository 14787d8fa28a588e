#include "errors.hpp"

namespace hostlogin {

namespace {

void collect(const std::exception &e, std::vector<std::string> &out) {
  out.emplace_back(e.what());
  try {
    std::rethrow_if_nested(e);
  } catch (const std::exception &nested) {
    collect(nested, out);
  } catch (...) {
    out.emplace_back("unknown error");
  }
}

} // namespace

std::string to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::InvalidHostname:
    return "InvalidHostname";
  case ErrorKind::DiscoveryFailed:
    return "DiscoveryFailed";
  case ErrorKind::UnsupportedHost:
    return "UnsupportedHost";
  case ErrorKind::AuthorizationFailed:
    return "AuthorizationFailed";
  case ErrorKind::AuthorizationTimedOut:
    return "AuthorizationTimedOut";
  case ErrorKind::Aborted:
    return "Aborted";
  case ErrorKind::CorruptStore:
    return "CorruptStore";
  case ErrorKind::PersistFailed:
    return "PersistFailed";
  }
  return "Unknown";
}

bool is_fatal(ErrorKind kind) {
  return kind == ErrorKind::CorruptStore || kind == ErrorKind::PersistFailed;
}

std::vector<std::string> error_chain(const std::exception &e) {
  std::vector<std::string> messages;
  collect(e, messages);
  return messages;
}

std::string describe_error(const std::exception &e) {
  auto messages = error_chain(e);
  std::string out;
  for (std::size_t i = 0; i < messages.size(); ++i) {
    if (i != 0) {
      out += ": ";
    }
    out += messages[i];
  }
  return out;
}

} // namespace hostlogin
