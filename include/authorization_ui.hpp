/**
 * @file authorization_ui.hpp
 * @brief User interaction required by interactive authorization flows.
 */
#ifndef HOSTLOGIN_AUTHORIZATION_UI_HPP
#define HOSTLOGIN_AUTHORIZATION_UI_HPP

#include "cancellation.hpp"

#include <iosfwd>
#include <optional>
#include <string>

namespace hostlogin {

/** Interface used by token acquirers to talk to the user. */
class AuthorizationUi {
public:
  virtual ~AuthorizationUi() = default;

  /**
   * Open @p url in a browser.
   *
   * @return `true` when a browser was launched.
   */
  virtual bool open_url(const std::string &url) = 0;

  /// Display an informational message.
  virtual void show_message(const std::string &message) = 0;

  /**
   * Ask the user for a value.
   *
   * @param label Prompt text.
   * @param secret Suppress terminal echo while typing.
   * @param cancel Stops waiting for input when cancelled.
   * @param deadline Gives up waiting for input once it passes.
   * @return Entered line, or an empty optional when input was closed.
   * @throws LoginError with ErrorKind::Aborted or
   *         ErrorKind::AuthorizationTimedOut when the wait is cut short.
   */
  virtual std::optional<std::string> prompt(const std::string &label,
                                            bool secret,
                                            const CancellationToken &cancel,
                                            const Deadline &deadline) = 0;
};

/** Console implementation reading from and writing to standard streams. */
class ConsoleAuthorizationUi : public AuthorizationUi {
public:
  /**
   * @param in Input stream for prompts.
   * @param out Output stream for messages.
   * @param open_browser Launch a browser for open_url(); when false the URL
   *        is only printed.
   */
  ConsoleAuthorizationUi(std::istream &in, std::ostream &out,
                         bool open_browser = true);

  bool open_url(const std::string &url) override;
  void show_message(const std::string &message) override;
  std::optional<std::string> prompt(const std::string &label, bool secret,
                                    const CancellationToken &cancel,
                                    const Deadline &deadline) override;

private:
  std::istream &in_;
  std::ostream &out_;
  bool open_browser_;
};

/**
 * @brief Attempt to open a URL in the default browser.
 *
 * Honors the `BROWSER` environment variable before falling back to the
 * platform opener.
 *
 * @return True on success or when skipped via HOSTLOGIN_SKIP_BROWSER, false
 * otherwise.
 */
bool open_in_browser(const std::string &url);

} // namespace hostlogin

#endif // HOSTLOGIN_AUTHORIZATION_UI_HPP
