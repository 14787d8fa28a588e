#include "token_acquirer.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "util/duration.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <exception>
#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <system_error>
#include <utility>
#include <vector>

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace hostlogin {

namespace {

constexpr const char *kCallbackPath = "/login";
constexpr std::chrono::milliseconds kPollSlice{100};
constexpr std::chrono::milliseconds kRequestReadTimeout{5000};
constexpr std::size_t kMaxRequestHead = 16 * 1024;
constexpr long kSlowDownIncrement = 5;
constexpr long kDefaultDeviceInterval = 5;
constexpr long kDefaultDeviceExpiry = 600;

std::shared_ptr<spdlog::logger> auth_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("auth");
  }();
  return logger;
}

/// Owns a socket descriptor.
class UniqueFd {
public:
  explicit UniqueFd(int fd = -1) : fd_(fd) {}
  ~UniqueFd() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }
  UniqueFd(const UniqueFd &) = delete;
  UniqueFd &operator=(const UniqueFd &) = delete;

  int get() const { return fd_; }
  explicit operator bool() const { return fd_ >= 0; }

private:
  int fd_;
};

std::string join(const std::vector<std::string> &items, const char *sep) {
  std::string out;
  for (const auto &item : items) {
    if (!out.empty()) {
      out += sep;
    }
    out += item;
  }
  return out;
}

/// Budget of @p deadline for messages, e.g. "5m".
std::string allowed_time(const Deadline &deadline) {
  return format_duration(
      std::chrono::duration_cast<std::chrono::seconds>(deadline.budget()));
}

bool is_success(const HttpResponse &response) {
  return response.status_code >= 200 && response.status_code < 300;
}

/// OAuth `error` and `error_description` of a response, when present.
std::pair<std::string, std::string> oauth_error(const HttpResponse &response) {
  auto doc = nlohmann::json::parse(response.body, nullptr, false);
  std::pair<std::string, std::string> out;
  if (doc.is_discarded() || !doc.is_object()) {
    return out;
  }
  if (auto it = doc.find("error"); it != doc.end() && it->is_string()) {
    out.first = it->get<std::string>();
  }
  if (auto it = doc.find("error_description");
      it != doc.end() && it->is_string()) {
    out.second = it->get<std::string>();
  }
  return out;
}

std::string describe_oauth_error(const std::pair<std::string, std::string> &e,
                                 long status) {
  std::string text;
  if (!e.first.empty()) {
    text = e.first;
    if (!e.second.empty()) {
      text += " (" + e.second + ")";
    }
  } else {
    text = "HTTP status " + std::to_string(status);
  }
  return text;
}

[[noreturn]] void fail(ErrorKind kind, const std::string &message) {
  throw LoginError(kind, message);
}

Credential token_from_response(const Hostname &host,
                               const HttpResponse &response) {
  if (!is_success(response)) {
    fail(ErrorKind::AuthorizationFailed,
         "The token endpoint of " + host.display + " rejected the request: " +
             describe_oauth_error(oauth_error(response), response.status_code) +
             ".");
  }
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(response.body);
  } catch (const nlohmann::json::parse_error &) {
    std::throw_with_nested(LoginError(ErrorKind::AuthorizationFailed,
                                      "The token endpoint of " + host.display +
                                          " returned a malformed response."));
  }
  if (!doc.is_object()) {
    fail(ErrorKind::AuthorizationFailed,
         "The token endpoint of " + host.display +
             " returned a malformed response.");
  }
  auto token = doc.find("access_token");
  if (token == doc.end() || !token->is_string() ||
      token->get<std::string>().empty()) {
    fail(ErrorKind::AuthorizationFailed,
         "The token endpoint of " + host.display +
             " did not return an access token.");
  }
  if (auto type = doc.find("token_type"); type != doc.end()) {
    std::string value = type->is_string() ? type->get<std::string>() : "";
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) {
                     return static_cast<char>(std::tolower(c));
                   });
    if (lower != "bearer") {
      fail(ErrorKind::AuthorizationFailed,
           "The token endpoint of " + host.display +
               " issued an unsupported token type \"" + value + "\".");
    }
  }
  Credential credential;
  credential.token = token->get<std::string>();
  credential.host = host;
  if (auto refresh = doc.find("refresh_token");
      refresh != doc.end() && refresh->is_string()) {
    credential.refresh_token = refresh->get<std::string>();
  }
  return credential;
}

std::string html_page(const std::string &title, const std::string &text) {
  return "<!DOCTYPE html><html><head><meta charset=\"utf-8\"><title>" + title +
         "</title></head><body><h1>" + title + "</h1><p>" + text +
         "</p></body></html>";
}

void send_response(int fd, int status, const char *reason,
                   const std::string &body) {
  std::string out = "HTTP/1.1 " + std::to_string(status) + " " + reason +
                    "\r\nContent-Type: text/html; charset=utf-8"
                    "\r\nContent-Length: " +
                    std::to_string(body.size()) +
                    "\r\nConnection: close\r\n\r\n" + body;
  std::size_t sent = 0;
  while (sent < out.size()) {
    ssize_t n = ::send(fd, out.data() + sent, out.size() - sent, MSG_NOSIGNAL);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      auth_log()->debug("Failed to answer browser: {}", std::strerror(errno));
      return;
    }
    sent += static_cast<std::size_t>(n);
  }
}

/// Read the request line and headers of one HTTP request.
std::string read_request_head(int fd) {
  std::string head;
  std::array<char, 2048> buffer{};
  Deadline limit(kRequestReadTimeout);
  while (head.find("\r\n\r\n") == std::string::npos &&
         head.size() < kMaxRequestHead && !limit.expired()) {
    pollfd pfd{fd, POLLIN, 0};
    int rc = ::poll(&pfd, 1, static_cast<int>(limit.remaining().count()));
    if (rc < 0 && errno == EINTR) {
      continue;
    }
    if (rc <= 0) {
      break;
    }
    ssize_t n = ::recv(fd, buffer.data(), buffer.size(), 0);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      break;
    }
    head.append(buffer.data(), static_cast<std::size_t>(n));
  }
  return head;
}

} // namespace

std::string base64url_encode(const unsigned char *data, std::size_t len) {
  std::string out(4 * ((len + 2) / 3) + 1, '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&out[0]),
                                data, static_cast<int>(len));
  out.resize(static_cast<std::size_t>(written));
  while (!out.empty() && out.back() == '=') {
    out.pop_back();
  }
  for (char &c : out) {
    if (c == '+') {
      c = '-';
    } else if (c == '/') {
      c = '_';
    }
  }
  return out;
}

std::string random_urlsafe(std::size_t bytes) {
  std::vector<unsigned char> buffer(bytes);
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw std::runtime_error("Failed to gather random bytes");
  }
  return base64url_encode(buffer.data(), buffer.size());
}

std::string pkce_challenge(const std::string &verifier) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int length = 0;
  if (EVP_Digest(verifier.data(), verifier.size(), digest.data(), &length,
                 EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("Failed to compute SHA-256 digest");
  }
  return base64url_encode(digest.data(), length);
}

PkcePair make_pkce_pair() {
  PkcePair pair;
  pair.verifier = random_urlsafe(32);
  pair.challenge = pkce_challenge(pair.verifier);
  return pair;
}

std::string url_decode(const std::string &value) {
  std::string plus_decoded;
  plus_decoded.reserve(value.size());
  for (char c : value) {
    if (c == '+') {
      plus_decoded += "%20";
    } else {
      plus_decoded.push_back(c);
    }
  }
  static CurlHandle curl;
  int length = 0;
  char *raw = curl_easy_unescape(curl.get(), plus_decoded.c_str(),
                                 static_cast<int>(plus_decoded.size()),
                                 &length);
  if (!raw) {
    throw std::runtime_error("Failed to decode URL component");
  }
  std::string out(raw, static_cast<std::size_t>(length));
  curl_free(raw);
  return out;
}

std::map<std::string, std::string> parse_query(const std::string &target) {
  std::map<std::string, std::string> params;
  auto query_pos = target.find('?');
  if (query_pos == std::string::npos) {
    return params;
  }
  std::string query = target.substr(query_pos + 1);
  if (auto hash = query.find('#'); hash != std::string::npos) {
    query.erase(hash);
  }
  std::size_t cursor = 0;
  while (cursor <= query.size()) {
    auto amp = query.find('&', cursor);
    std::string param = query.substr(
        cursor, amp == std::string::npos ? std::string::npos : amp - cursor);
    if (!param.empty()) {
      auto eq = param.find('=');
      std::string key = url_decode(param.substr(0, eq));
      std::string value =
          eq == std::string::npos ? std::string() : url_decode(param.substr(eq + 1));
      params.emplace(std::move(key), std::move(value));
    }
    if (amp == std::string::npos) {
      break;
    }
    cursor = amp + 1;
  }
  return params;
}

LoopbackListener::LoopbackListener(int min_port, int max_port) {
  int last_error = EADDRINUSE;
  for (int port = min_port; port <= max_port; ++port) {
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
      throw std::system_error(errno, std::generic_category(),
                              "cannot create listening socket");
    }
    int reuse = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0 &&
        ::listen(fd, 4) == 0) {
      fd_ = fd;
      port_ = port;
      auth_log()->debug("Listening for authorization redirect on port {}",
                        port_);
      return;
    }
    last_error = errno;
    ::close(fd);
  }
  throw std::system_error(last_error, std::generic_category(),
                          "no free local port between " +
                              std::to_string(min_port) + " and " +
                              std::to_string(max_port));
}

LoopbackListener::~LoopbackListener() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

std::string LoopbackListener::redirect_uri() const {
  return "http://localhost:" + std::to_string(port_) + kCallbackPath;
}

CallbackRequest LoopbackListener::wait(const CancellationToken &cancel,
                                       const Deadline &deadline) {
  while (true) {
    if (cancel.cancelled()) {
      fail(ErrorKind::Aborted, "Authorization was cancelled.");
    }
    if (deadline.expired()) {
      fail(ErrorKind::AuthorizationTimedOut,
           "Authorization was not completed within the allowed time.");
    }
    auto slice = std::min(kPollSlice, deadline.remaining());
    pollfd pfd{fd_, POLLIN, 0};
    int rc = ::poll(&pfd, 1, static_cast<int>(slice.count()));
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw std::system_error(errno, std::generic_category(),
                              "waiting for authorization redirect failed");
    }
    if (rc == 0) {
      continue;
    }
    UniqueFd client(::accept(fd_, nullptr, nullptr));
    if (!client) {
      if (errno == EINTR || errno == EAGAIN || errno == ECONNABORTED) {
        continue;
      }
      throw std::system_error(errno, std::generic_category(),
                              "accepting authorization redirect failed");
    }
    std::string head = read_request_head(client.get());
    auto line_end = head.find("\r\n");
    std::string line = head.substr(0, line_end);
    auto first_space = line.find(' ');
    auto second_space = first_space == std::string::npos
                            ? std::string::npos
                            : line.find(' ', first_space + 1);
    if (second_space == std::string::npos ||
        line.compare(0, first_space, "GET") != 0) {
      send_response(client.get(), 400, "Bad Request",
                    html_page("Bad request", "Unsupported request."));
      continue;
    }
    std::string target =
        line.substr(first_space + 1, second_space - first_space - 1);
    CallbackRequest request;
    request.path = target.substr(0, target.find('?'));
    if (request.path != kCallbackPath) {
      send_response(client.get(), 404, "Not Found",
                    html_page("Not found", "Nothing to see here."));
      continue;
    }
    request.params = parse_query(target);
    if (request.params.count("code") != 0 &&
        request.params.count("error") == 0) {
      send_response(client.get(), 200, "OK",
                    html_page("Authorization received",
                              "You can close this window and return to the "
                              "terminal."));
    } else {
      send_response(client.get(), 200, "OK",
                    html_page("Authorization failed",
                              "The login could not be completed. Return to "
                              "the terminal for details."));
    }
    return request;
  }
}

OAuthTokenAcquirer::OAuthTokenAcquirer(HttpClient &http, AuthorizationUi &ui,
                                       AcquirerOptions options)
    : http_(http), ui_(ui), options_(options) {}

std::string OAuthTokenAcquirer::select_grant(const Hostname &host,
                                             const OAuthClient &client) {
  if (client.supports(grant::kAuthzCode)) {
    if (!client.authz_url.empty() && !client.token_url.empty()) {
      return grant::kAuthzCode;
    }
    auth_log()->debug("{} advertises authz_code without endpoints",
                      host.display);
  }
  if (client.supports(grant::kDeviceCode)) {
    if (!client.device_url.empty() && !client.token_url.empty()) {
      return grant::kDeviceCode;
    }
    auth_log()->debug("{} advertises device_code without endpoints",
                      host.display);
  }
  if (client.supports(grant::kPassword)) {
    if (!client.token_url.empty()) {
      return grant::kPassword;
    }
    auth_log()->debug("{} advertises password without a token endpoint",
                      host.display);
  }
  std::string advertised =
      client.grant_types.empty() ? "none" : join(client.grant_types, ", ");
  fail(ErrorKind::UnsupportedHost,
       "Host " + host.display +
           " does not offer a supported login method (advertised: " +
           advertised + ").");
}

Credential OAuthTokenAcquirer::acquire(const ServiceEndpointSet &endpoints,
                                       const CancellationToken &cancel) {
  const Hostname &host = endpoints.host();
  OAuthClient client = endpoints.login_client();
  std::string grant_type = select_grant(host, client);
  auth_log()->info("Authorizing with {} using the {} grant", host.display,
                   grant_type);
  if (cancel.cancelled()) {
    fail(ErrorKind::Aborted, "Login to " + host.display + " was cancelled.");
  }
  Deadline deadline(options_.timeout);
  try {
    if (grant_type == grant::kAuthzCode) {
      return authorization_code(host, client, cancel, deadline);
    }
    if (grant_type == grant::kDeviceCode) {
      return device_code(host, client, cancel, deadline);
    }
    return password(host, client, cancel, deadline);
  } catch (const LoginError &) {
    throw;
  } catch (const RequestCancelled &) {
    std::throw_with_nested(LoginError(
        ErrorKind::Aborted, "Login to " + host.display + " was cancelled."));
  } catch (const std::exception &) {
    std::throw_with_nested(LoginError(ErrorKind::AuthorizationFailed,
                                      "Authorization with " + host.display +
                                          " failed."));
  }
}

HttpResponse OAuthTokenAcquirer::post(const Hostname &host,
                                      const std::string &url,
                                      const FormFields &fields,
                                      const CancellationToken &cancel) {
  if (cancel.cancelled()) {
    fail(ErrorKind::Aborted, "Login to " + host.display + " was cancelled.");
  }
  return http_.post_form(url, fields, {"Accept: application/json"});
}

Credential OAuthTokenAcquirer::authorization_code(
    const Hostname &host, const OAuthClient &client,
    const CancellationToken &cancel, const Deadline &deadline) {
  LoopbackListener listener(client.min_port, client.max_port);
  PkcePair pkce = make_pkce_pair();
  std::string state = random_urlsafe(16);

  FormFields query{{"response_type", "code"},
                   {"client_id", client.client_id},
                   {"redirect_uri", listener.redirect_uri()},
                   {"state", state},
                   {"code_challenge", pkce.challenge},
                   {"code_challenge_method", "S256"}};
  if (!client.scopes.empty()) {
    query.emplace_back("scope", join(client.scopes, " "));
  }
  std::string url = client.authz_url;
  url += (url.find('?') == std::string::npos ? '?' : '&');
  url += encode_form(query);

  ui_.show_message("A web browser will be opened to the login page for " +
                   host.display +
                   ".\nIf it does not open automatically, open the following "
                   "URL to proceed:\n    " +
                   url + "\n");
  if (!ui_.open_url(url)) {
    auth_log()->debug("Browser not opened; waiting for manual navigation");
  }

  CallbackRequest callback = listener.wait(cancel, deadline);
  if (auto err = callback.params.find("error"); err != callback.params.end()) {
    std::string reason = err->second;
    if (auto desc = callback.params.find("error_description");
        desc != callback.params.end() && !desc->second.empty()) {
      reason += " (" + desc->second + ")";
    }
    fail(ErrorKind::AuthorizationFailed,
         "The authorization server for " + host.display +
             " denied the request: " + reason + ".");
  }
  auto returned_state = callback.params.find("state");
  if (returned_state == callback.params.end() ||
      returned_state->second != state) {
    fail(ErrorKind::AuthorizationFailed,
         "The authorization response for " + host.display +
             " has an unexpected state value.");
  }
  auto code = callback.params.find("code");
  if (code == callback.params.end() || code->second.empty()) {
    fail(ErrorKind::AuthorizationFailed,
         "The authorization response for " + host.display +
             " does not include an authorization code.");
  }

  auth_log()->debug("Exchanging authorization code at {}", client.token_url);
  HttpResponse response = post(host, client.token_url,
                               {{"grant_type", "authorization_code"},
                                {"code", code->second},
                                {"client_id", client.client_id},
                                {"code_verifier", pkce.verifier},
                                {"redirect_uri", listener.redirect_uri()}},
                               cancel);
  return token_from_response(host, response);
}

Credential OAuthTokenAcquirer::device_code(const Hostname &host,
                                           const OAuthClient &client,
                                           const CancellationToken &cancel,
                                           const Deadline &deadline) {
  FormFields request{{"client_id", client.client_id}};
  if (!client.scopes.empty()) {
    request.emplace_back("scope", join(client.scopes, " "));
  }
  HttpResponse response = post(host, client.device_url, request, cancel);
  if (!is_success(response)) {
    fail(ErrorKind::AuthorizationFailed,
         "The device authorization endpoint of " + host.display +
             " rejected the request: " +
             describe_oauth_error(oauth_error(response),
                                  response.status_code) +
             ".");
  }
  auto doc = nlohmann::json::parse(response.body, nullptr, false);
  auto text = [&](const char *key) -> std::string {
    if (doc.is_object()) {
      auto it = doc.find(key);
      if (it != doc.end() && it->is_string()) {
        return it->get<std::string>();
      }
    }
    return {};
  };
  auto number = [&](const char *key, long fallback) -> long {
    if (doc.is_object()) {
      auto it = doc.find(key);
      if (it != doc.end() && it->is_number_integer() && it->get<long>() > 0) {
        return it->get<long>();
      }
    }
    return fallback;
  };
  std::string device_code = text("device_code");
  std::string user_code = text("user_code");
  std::string verification_uri = text("verification_uri");
  if (verification_uri.empty()) {
    verification_uri = text("verification_url");
  }
  if (device_code.empty() || user_code.empty() || verification_uri.empty()) {
    fail(ErrorKind::AuthorizationFailed,
         "The device authorization endpoint of " + host.display +
             " returned a malformed response.");
  }
  long interval = number("interval", kDefaultDeviceInterval);
  Deadline expiry(options_.interval_unit *
                  number("expires_in", kDefaultDeviceExpiry));

  ui_.show_message("To log in to " + host.display + ", visit:\n    " +
                   verification_uri + "\nand enter the code: " + user_code +
                   "\n");
  std::string complete = text("verification_uri_complete");
  if (!complete.empty()) {
    ui_.open_url(complete);
  }

  while (true) {
    std::chrono::milliseconds pause = options_.interval_unit * interval;
    if (cancel.wait_for(std::min(pause, deadline.remaining()))) {
      fail(ErrorKind::Aborted, "Login to " + host.display + " was cancelled.");
    }
    if (deadline.expired()) {
      fail(ErrorKind::AuthorizationTimedOut,
           "Authorization for " + host.display +
               " was not completed within " + allowed_time(deadline) + ".");
    }
    if (expiry.expired()) {
      fail(ErrorKind::AuthorizationTimedOut,
           "The device code for " + host.display +
               " expired before authorization was completed.");
    }
    HttpResponse reply = post(host, client.token_url,
                             {{"grant_type", grant::kDeviceCode},
                              {"device_code", device_code},
                              {"client_id", client.client_id}},
                             cancel);
    if (is_success(reply)) {
      return token_from_response(host, reply);
    }
    std::string error = oauth_error(reply).first;
    if (error == "authorization_pending") {
      continue;
    }
    if (error == "slow_down") {
      interval += kSlowDownIncrement;
      auth_log()->debug("Polling interval for {} raised to {}s", host.display,
                        interval);
      continue;
    }
    if (error == "expired_token") {
      fail(ErrorKind::AuthorizationTimedOut,
           "The device code for " + host.display +
               " expired before authorization was completed.");
    }
    if (error == "access_denied") {
      fail(ErrorKind::AuthorizationFailed,
           "Authorization for " + host.display + " was denied.");
    }
    return token_from_response(host, reply);
  }
}

Credential OAuthTokenAcquirer::password(const Hostname &host,
                                        const OAuthClient &client,
                                        const CancellationToken &cancel,
                                        const Deadline &deadline) {
  const std::string too_slow = "Credentials for " + host.display +
                               " were not entered within " +
                               allowed_time(deadline) + ".";
  auto ask = [&](const std::string &label, bool secret) {
    std::optional<std::string> answer;
    try {
      answer = ui_.prompt(label, secret, cancel, deadline);
    } catch (const LoginError &e) {
      std::throw_with_nested(LoginError(
          e.kind(), e.kind() == ErrorKind::AuthorizationTimedOut
                        ? too_slow
                        : "Login to " + host.display + " was cancelled."));
    }
    if (!answer) {
      std::string what = secret ? "password" : "username";
      fail(ErrorKind::Aborted,
           "No " + what + " was entered for " + host.display + ".");
    }
    return *answer;
  };

  ui_.show_message("Enter your credentials for " + host.display + ".");
  std::string username = ask("Username", false);
  std::string secret = ask("Password", true);
  if (deadline.expired()) {
    fail(ErrorKind::AuthorizationTimedOut, too_slow);
  }
  FormFields fields{{"grant_type", "password"},
                    {"username", username},
                    {"password", secret},
                    {"client_id", client.client_id}};
  if (!client.scopes.empty()) {
    fields.emplace_back("scope", join(client.scopes, " "));
  }
  HttpResponse response = post(host, client.token_url, fields, cancel);
  return token_from_response(host, response);
}

} // namespace hostlogin
