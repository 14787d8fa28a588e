#include "login.hpp"
#include "config_dir.hpp"
#include "credential_store.hpp"
#include "log.hpp"

#include <exception>
#include <memory>
#include <utility>

#include <spdlog/spdlog.h>

namespace hostlogin {

namespace {

std::shared_ptr<spdlog::logger> login_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("login");
  }();
  return logger;
}

std::string sentence(std::string text) {
  if (!text.empty() && text.back() != '.') {
    text += '.';
  }
  return text;
}

/// Outermost message as a sentence, followed by one line per nested cause.
std::string detail_for(const std::exception &e) {
  auto chain = error_chain(e);
  std::string detail = sentence(chain.front());
  for (std::size_t i = 1; i < chain.size(); ++i) {
    detail += "\nCaused by: " + chain[i];
  }
  return detail;
}

std::string summary_for(ErrorKind kind, const std::string &display) {
  switch (kind) {
  case ErrorKind::InvalidHostname:
    return "Invalid hostname";
  case ErrorKind::DiscoveryFailed:
    return "Service discovery failed for " + display;
  case ErrorKind::UnsupportedHost:
    return "Host does not support login";
  case ErrorKind::AuthorizationFailed:
    return "Authorization failed for " + display;
  case ErrorKind::AuthorizationTimedOut:
    return "Authorization timed out for " + display;
  case ErrorKind::Aborted:
    return "Login to " + display + " was cancelled";
  case ErrorKind::CorruptStore:
    return "Invalid credentials file for " + display;
  case ErrorKind::PersistFailed:
    return "Failed to save credentials for " + display;
  }
  return "Login failed";
}

std::string resolve_path(const std::string &requested, Diagnostics &diags) {
  if (!requested.empty()) {
    return requested;
  }
  std::string path = default_credentials_file();
  if (path.empty()) {
    diags.error("No credentials file location",
                "Cannot determine a configuration directory for the "
                "credentials file; set HOSTLOGIN_CONFIG_DIR or pass an "
                "explicit file.",
                ErrorKind::PersistFailed);
  }
  return path;
}

} // namespace

std::string to_string(LoginState state) {
  switch (state) {
  case LoginState::Start:
    return "start";
  case LoginState::Normalized:
    return "normalized";
  case LoginState::Discovered:
    return "discovered";
  case LoginState::Acquired:
    return "acquired";
  case LoginState::Persisted:
    return "persisted";
  case LoginState::Done:
    return "done";
  case LoginState::Failed:
    return "failed";
  }
  return "unknown";
}

LoginOrchestrator::LoginOrchestrator(ServiceDiscoverer &discoverer,
                                     TokenAcquirer &acquirer,
                                     std::string default_hostname)
    : discoverer_(discoverer), acquirer_(acquirer),
      default_hostname_(std::move(default_hostname)) {}

LoginOutcome LoginOrchestrator::login(const std::string &raw_hostname,
                                      const std::string &credentials_file,
                                      const CancellationToken &cancel) {
  LoginOutcome outcome;
  outcome.display_hostname = for_display(
      raw_hostname.empty() ? default_hostname_ : raw_hostname);

  auto fail = [&outcome](const LoginError &e) {
    std::string detail = detail_for(e);
    if (is_fatal(e.kind())) {
      detail += "\nThe credentials file " + outcome.credentials_file +
                " was left unchanged.";
    }
    outcome.diagnostics.error(summary_for(e.kind(), outcome.display_hostname),
                              detail, e.kind());
    login_log()->error("Login failed in state {}: {}",
                       to_string(outcome.reached), describe_error(e));
    outcome.state = LoginState::Failed;
    return outcome;
  };
  auto advance = [&outcome](LoginState next) {
    login_log()->debug("Login {} -> {}", to_string(outcome.state),
                       to_string(next));
    outcome.state = next;
    outcome.reached = next;
  };

  Hostname host;
  try {
    host = normalize_hostname(raw_hostname, default_hostname_);
  } catch (const LoginError &e) {
    return fail(e);
  }
  outcome.display_hostname = host.display;
  outcome.comparison_key = host.comparison_key;
  advance(LoginState::Normalized);

  outcome.credentials_file = resolve_path(credentials_file, outcome.diagnostics);
  if (outcome.credentials_file.empty()) {
    outcome.state = LoginState::Failed;
    return outcome;
  }
  CredentialStore store(outcome.credentials_file);
  try {
    // Report a broken store before the user is asked to authorize.
    (void)store.load();
  } catch (const LoginError &e) {
    return fail(e);
  }

  try {
    ServiceEndpointSet endpoints = discoverer_.discover(host);
    advance(LoginState::Discovered);

    Credential credential = acquirer_.acquire(endpoints, cancel);
    if (credential.host != host) {
      throw LoginError(ErrorKind::AuthorizationFailed,
                       "The token was issued for " + credential.host.display +
                           " instead of " + host.display + ".");
    }
    advance(LoginState::Acquired);

    store.update([&](CredentialDocument &doc) {
      doc = CredentialStore::upsert(std::move(doc), host.comparison_key,
                                    credential);
    });
    advance(LoginState::Persisted);
  } catch (const LoginError &e) {
    return fail(e);
  }

  advance(LoginState::Done);
  login_log()->info("Stored credentials for {} in {}", host.display,
                    outcome.credentials_file);
  return outcome;
}

LogoutOutcome LoginOrchestrator::logout(
    const std::string &raw_hostname,
    const std::string &credentials_file) const {
  return hostlogin::logout(raw_hostname, credentials_file, default_hostname_);
}

LogoutOutcome logout(const std::string &raw_hostname,
                     const std::string &credentials_file,
                     const std::string &default_hostname) {
  LogoutOutcome outcome;
  outcome.display_hostname = for_display(
      raw_hostname.empty() ? default_hostname : raw_hostname);
  Hostname host;
  try {
    host = normalize_hostname(raw_hostname, default_hostname);
  } catch (const LoginError &e) {
    outcome.diagnostics.error(summary_for(e.kind(), outcome.display_hostname),
                              detail_for(e), e.kind());
    return outcome;
  }
  outcome.display_hostname = host.display;
  outcome.comparison_key = host.comparison_key;

  outcome.credentials_file = resolve_path(credentials_file, outcome.diagnostics);
  if (outcome.credentials_file.empty()) {
    return outcome;
  }
  CredentialStore store(outcome.credentials_file);
  try {
    if (!store.load().find(host.comparison_key)) {
      // Nothing to remove; avoid creating the file or its directory.
      outcome.diagnostics.warning(
          "No credentials for " + host.display,
          "The credentials file " + outcome.credentials_file +
              " holds no credentials for " + host.display + ".");
      return outcome;
    }
    store.update([&](CredentialDocument &doc) {
      outcome.removed = doc.erase(host.comparison_key);
    });
  } catch (const LoginError &e) {
    std::string summary = e.kind() == ErrorKind::PersistFailed
                              ? "Failed to remove credentials for " +
                                    host.display
                              : summary_for(e.kind(), host.display);
    outcome.diagnostics.error(summary, detail_for(e), e.kind());
    return outcome;
  }
  if (outcome.removed) {
    login_log()->info("Removed credentials for {} from {}", host.display,
                      outcome.credentials_file);
  } else {
    outcome.diagnostics.warning(
        "No credentials for " + host.display,
        "The credentials file " + outcome.credentials_file +
            " holds no credentials for " + host.display + ".");
  }
  return outcome;
}

} // namespace hostlogin
