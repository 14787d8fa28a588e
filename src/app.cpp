#include "app.hpp"
#include "authorization_ui.hpp"
#include "cancellation.hpp"
#include "config_dir.hpp"
#include "config_manager.hpp"
#include "diagnostics.hpp"
#include "http_client.hpp"
#include "log.hpp"
#include "login.hpp"
#include "service_discovery.hpp"
#include "token_acquirer.hpp"
#include "util/duration.hpp"

#include <atomic>
#include <csignal>
#include <exception>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

#ifndef _WIN32
#include <signal.h>
#endif

namespace hostlogin {

namespace {
std::shared_ptr<spdlog::logger> app_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}

std::optional<spdlog::level::level_enum> parse_level(const std::string &name) {
  auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") {
    return std::nullopt;
  }
  return level;
}

std::atomic<CancellationSource *> g_interrupt_target{nullptr};

void handle_interrupt(int) {
  if (auto *source = g_interrupt_target.load()) {
    source->cancel_from_signal();
  }
}

/**
 * Routes SIGINT and SIGTERM to a cancellation source for its lifetime and
 * restores the previous handlers afterwards.
 */
class InterruptScope {
public:
  explicit InterruptScope(CancellationSource &source) {
    g_interrupt_target.store(&source);
#ifdef _WIN32
    previous_int_ = std::signal(SIGINT, handle_interrupt);
    previous_term_ = std::signal(SIGTERM, handle_interrupt);
#else
    struct sigaction action {};
    action.sa_handler = handle_interrupt;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0; // no SA_RESTART: blocking calls return EINTR
    sigaction(SIGINT, &action, &previous_int_);
    sigaction(SIGTERM, &action, &previous_term_);
#endif
  }

  ~InterruptScope() {
#ifdef _WIN32
    std::signal(SIGINT, previous_int_);
    std::signal(SIGTERM, previous_term_);
#else
    sigaction(SIGINT, &previous_int_, nullptr);
    sigaction(SIGTERM, &previous_term_, nullptr);
#endif
    g_interrupt_target.store(nullptr);
  }

  InterruptScope(const InterruptScope &) = delete;
  InterruptScope &operator=(const InterruptScope &) = delete;

private:
#ifdef _WIN32
  void (*previous_int_)(int) = SIG_DFL;
  void (*previous_term_)(int) = SIG_DFL;
#else
  struct sigaction previous_int_ {};
  struct sigaction previous_term_ {};
#endif
};
} // namespace

App::App(std::istream &in, std::ostream &out, std::ostream &err)
    : in_(in), out_(out), err_(err) {}

/**
 * Execute the main application flow.
 *
 * Parses the command line, loads configuration, initializes logging and
 * dispatches to the login or logout subcommand.
 */
int App::run(int argc, char **argv) {
  int status = configure(argc, argv);
  if (status >= 0) {
    return status;
  }
  return options_.command == Command::Login ? run_login() : run_logout();
}

/// @return Exit code when the program should stop, -1 to continue.
int App::configure(int argc, char **argv) {
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &exit) {
    return exit.exit_code();
  }
  try {
    ConfigManager manager;
    config_ = options_.config_file.empty()
                  ? manager.load_default()
                  : manager.load(options_.config_file);
  } catch (const std::exception &e) {
    Diagnostics diags;
    diags.error("Invalid configuration", describe_error(e));
    print_diagnostics(err_, diags);
    return 1;
  }

  if (options_.log_level) {
    config_.set_log_level(*options_.log_level);
  } else if (options_.verbose) {
    config_.set_log_level("debug");
  }
  if (!options_.log_file.empty()) {
    config_.set_log_file(options_.log_file);
  }
  if (!options_.log_categories.empty()) {
    auto categories = config_.log_categories();
    for (const auto &[name, level] : options_.log_categories) {
      categories[name] = level;
    }
    config_.set_log_categories(std::move(categories));
  }
  if (options_.timeout) {
    config_.set_authorization_timeout(parse_duration(*options_.timeout));
  }
  if (options_.no_browser) {
    config_.set_open_browser(false);
  }
  setup_logging();
  return -1;
}

void App::setup_logging() {
  auto level = parse_level(config_.log_level());
  if (!level) {
    app_log()->warn("Ignoring invalid log level '{}'", config_.log_level());
  }
  init_logger(level.value_or(spdlog::level::info), config_.log_pattern(),
              config_.log_file(),
              static_cast<std::size_t>(config_.log_rotate()));
  std::unordered_map<std::string, spdlog::level::level_enum> category_levels;
  for (const auto &[category, level_str] : config_.log_categories()) {
    if (auto category_level = parse_level(level_str)) {
      category_levels[category] = *category_level;
    } else {
      app_log()->warn("Ignoring invalid log level '{}' for category '{}'",
                      level_str, category);
    }
  }
  configure_log_categories(category_levels);
  app_log()->debug("Verbose logging enabled");
}

std::string App::credentials_file() const {
  if (!options_.credentials_file.empty()) {
    return options_.credentials_file;
  }
  if (!config_.credentials_file().empty()) {
    return config_.credentials_file();
  }
  return default_credentials_file();
}

int App::run_login() {
  CancellationSource cancel;
  InterruptScope interrupts(cancel);

  HttpOptions http_options;
  http_options.timeout_ms = static_cast<long>(config_.http_timeout()) * 1000;
  http_options.max_response_bytes = kMaxDiscoveryBytes;
  http_options.http_proxy = config_.http_proxy();
  http_options.https_proxy = config_.https_proxy();
  CurlHttpClient http(http_options, cancel.token());
  HttpServiceDiscoverer discoverer(http, config_.host_services());
  ConsoleAuthorizationUi ui(in_, out_, config_.open_browser());
  AcquirerOptions acquirer_options;
  acquirer_options.timeout = config_.authorization_timeout();
  OAuthTokenAcquirer acquirer(http, ui, acquirer_options);
  LoginOrchestrator orchestrator(discoverer, acquirer,
                                 config_.default_hostname());

  LoginOutcome outcome =
      orchestrator.login(options_.hostname, credentials_file(), cancel.token());
  print_diagnostics(err_, outcome.diagnostics);
  if (!outcome.succeeded()) {
    return 1;
  }
  out_ << "\nSuccess! Logged in to " << outcome.display_hostname << ".\n"
       << "The token was saved in " << outcome.credentials_file << ".\n";
  return 0;
}

int App::run_logout() {
  LogoutOutcome outcome = logout(options_.hostname, credentials_file(),
                                 config_.default_hostname());
  print_diagnostics(err_, outcome.diagnostics);
  if (!outcome.succeeded()) {
    return 1;
  }
  if (outcome.removed) {
    out_ << "\nRemoved the stored token for " << outcome.display_hostname
         << " from " << outcome.credentials_file << ".\n";
  }
  return 0;
}

} // namespace hostlogin
