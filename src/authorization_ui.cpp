#include "authorization_ui.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#if defined(_WIN32)
#include <windows.h>
#include <shellapi.h>
#else
#include <poll.h>
#include <spawn.h>
#include <sys/types.h>
#include <termios.h>
#include <unistd.h>
extern char **environ;
#endif

namespace hostlogin {

namespace {
constexpr std::chrono::milliseconds kInputPollSlice{100};

std::shared_ptr<spdlog::logger> ui_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("auth");
  }();
  return logger;
}

/**
 * Check whether an environment flag is enabled.
 *
 * @param name Environment variable name to inspect.
 * @return `true` when the variable exists and is not "0".
 */
bool env_flag_enabled(const char *name) {
  if (const char *v = std::getenv(name)) {
    return (*v != '\0' && *v != '0');
  }
  return false;
}

#if !defined(_WIN32)
/**
 * Spawn a detached process using posix_spawn.
 *
 * @param argv Command arguments beginning with the executable name.
 * @return `true` when the process was spawned successfully.
 */
bool spawn_detached(const std::vector<std::string> &argv) {
  std::vector<char *> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto &s : argv)
    cargv.push_back(const_cast<char *>(s.c_str()));
  cargv.push_back(nullptr);

  pid_t pid = 0;
  int rc = posix_spawnp(&pid, cargv[0], nullptr, nullptr, cargv.data(),
                        environ);
  if (rc != 0) {
    ui_log()->warn("posix_spawnp('{}') failed: {} ({})", argv[0],
                   std::strerror(rc), rc);
    return false;
  }
  return true;
}

/// Disables terminal echo for the lifetime of the guard.
class EchoGuard {
public:
  EchoGuard() {
    if (isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &saved_) == 0) {
      termios quiet = saved_;
      quiet.c_lflag &= ~static_cast<tcflag_t>(ECHO);
      active_ = tcsetattr(STDIN_FILENO, TCSAFLUSH, &quiet) == 0;
    }
  }
  ~EchoGuard() {
    if (active_) {
      tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved_);
    }
  }
  EchoGuard(const EchoGuard &) = delete;
  EchoGuard &operator=(const EchoGuard &) = delete;

  bool active() const { return active_; }

private:
  termios saved_{};
  bool active_ = false;
};

/// Block until the terminal has a line ready. Terminals deliver whole lines.
void wait_for_terminal_line(const CancellationToken &cancel,
                            const Deadline &deadline) {
  while (true) {
    if (cancel.cancelled()) {
      throw LoginError(ErrorKind::Aborted, "Input was cancelled.");
    }
    if (deadline.expired()) {
      throw LoginError(ErrorKind::AuthorizationTimedOut,
                       "No input was entered within the allowed time.");
    }
    auto slice = std::min(kInputPollSlice, deadline.remaining());
    pollfd pfd{STDIN_FILENO, POLLIN, 0};
    int rc = ::poll(&pfd, 1, static_cast<int>(slice.count()));
    if (rc < 0 && errno != EINTR) {
      return;
    }
    if (rc > 0) {
      return;
    }
  }
}
#endif
} // namespace

bool open_in_browser(const std::string &url) {
  if (env_flag_enabled("HOSTLOGIN_SKIP_BROWSER")) {
    ui_log()->debug("Browser launch skipped for {}", url);
    return true;
  }

#if defined(_WIN32)
  HINSTANCE res = ShellExecuteA(nullptr, "open", url.c_str(), nullptr, nullptr,
                                SW_SHOWNORMAL);
  auto code = reinterpret_cast<uintptr_t>(res);
  if (code > 32) {
    return true;
  }
  ui_log()->warn("ShellExecuteA failed with code {}", code);
  return false;
#else
  if (const char *br = std::getenv("BROWSER")) {
    std::string browser = br;
    if (!browser.empty() && spawn_detached({browser, url})) {
      return true;
    }
  }
#if defined(__APPLE__)
  if (spawn_detached({"/usr/bin/open", url}))
    return true;
#else
  if (spawn_detached({"xdg-open", url}))
    return true;
#endif
  ui_log()->warn("Failed to launch a browser for '{}'", url);
  return false;
#endif
}

ConsoleAuthorizationUi::ConsoleAuthorizationUi(std::istream &in,
                                               std::ostream &out,
                                               bool open_browser)
    : in_(in), out_(out), open_browser_(open_browser) {}

bool ConsoleAuthorizationUi::open_url(const std::string &url) {
  if (!open_browser_) {
    return false;
  }
  return open_in_browser(url);
}

void ConsoleAuthorizationUi::show_message(const std::string &message) {
  out_ << message << '\n';
  out_.flush();
}

std::optional<std::string>
ConsoleAuthorizationUi::prompt(const std::string &label, bool secret,
                               const CancellationToken &cancel,
                               const Deadline &deadline) {
  out_ << label << ": ";
  out_.flush();
  std::string line;
#if !defined(_WIN32)
  if (&in_ == &std::cin) {
    std::optional<EchoGuard> guard;
    if (secret) {
      guard.emplace();
    }
    if (isatty(STDIN_FILENO)) {
      wait_for_terminal_line(cancel, deadline);
    }
    if (secret) {
      bool ok = static_cast<bool>(std::getline(in_, line));
      if (guard->active()) {
        out_ << '\n';
      }
      if (!ok) {
        return std::nullopt;
      }
      return line;
    }
  }
#else
  (void)secret;
  (void)cancel;
  (void)deadline;
#endif
  if (!std::getline(in_, line)) {
    return std::nullopt;
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  return line;
}

} // namespace hostlogin
