#include "errors.hpp"
#include "token_acquirer.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <string>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace hostlogin;
using namespace std::chrono_literals;

namespace {

struct PostCall {
  std::string url;
  FormFields fields;

  std::string field(const std::string &name) const {
    for (const auto &[key, value] : fields) {
      if (key == name) {
        return value;
      }
    }
    return {};
  }
};

class FakeHttp : public HttpClient {
public:
  std::deque<HttpResponse> replies;
  HttpResponse fallback = reply(400, R"({"error":"authorization_pending"})");
  std::vector<PostCall> posts;

  static HttpResponse reply(long status, const std::string &body) {
    HttpResponse r;
    r.status_code = status;
    r.body = body;
    r.headers = {"Content-Type: application/json"};
    return r;
  }

  HttpResponse get(const std::string &, const std::vector<std::string> &)
      override {
    FAIL("token acquisition must not GET");
    return {};
  }

  HttpResponse post_form(const std::string &url, const FormFields &fields,
                         const std::vector<std::string> &) override {
    posts.push_back({url, fields});
    if (replies.empty()) {
      return fallback;
    }
    HttpResponse r = replies.front();
    replies.pop_front();
    return r;
  }
};

class FakeUi : public AuthorizationUi {
public:
  std::vector<std::string> messages;
  std::vector<std::string> opened;
  std::deque<std::optional<std::string>> answers;
  std::function<void(const std::string &)> on_open;
  std::function<void()> on_message;
  std::chrono::milliseconds answer_delay{0};
  std::chrono::milliseconds prompt_budget{0};

  bool open_url(const std::string &url) override {
    opened.push_back(url);
    if (on_open) {
      on_open(url);
    }
    return true;
  }
  void show_message(const std::string &message) override {
    messages.push_back(message);
    if (on_message) {
      on_message();
    }
  }
  std::optional<std::string> prompt(const std::string &, bool,
                                    const CancellationToken &,
                                    const Deadline &deadline) override {
    prompt_budget = deadline.budget();
    std::this_thread::sleep_for(answer_delay);
    if (answers.empty()) {
      return std::nullopt;
    }
    auto answer = answers.front();
    answers.pop_front();
    return answer;
  }
};

ServiceEndpointSet endpoints_with(const nlohmann::json &login) {
  Hostname host = normalize_hostname("tfe.example.com");
  return ServiceEndpointSet(host, HttpServiceDiscoverer::discovery_url(host),
                            {{"login.v1", login}});
}

nlohmann::json login_service(const std::vector<std::string> &grants) {
  return {{"client", "cli"},
          {"grant_types", grants},
          {"authz", "/oauth/authorize"},
          {"token", "/oauth/token"},
          {"device", "/oauth/device"},
          {"ports", {29100, 29200}}};
}

ErrorKind acquire_error(TokenAcquirer &acquirer,
                        const ServiceEndpointSet &endpoints,
                        const CancellationToken &cancel = {}) {
  try {
    acquirer.acquire(endpoints, cancel);
  } catch (const LoginError &e) {
    return e.kind();
  }
  FAIL("expected acquisition to fail");
  return ErrorKind::AuthorizationFailed;
}

/// Issue a GET against the loopback listener and return the raw reply.
std::string loopback_get(int port, const std::string &target) {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    return {};
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = htons(static_cast<uint16_t>(port));
  std::string reply;
  if (::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0) {
    std::string request = "GET " + target +
                          " HTTP/1.1\r\nHost: localhost\r\n\r\n";
    if (::send(fd, request.data(), request.size(), 0) ==
        static_cast<ssize_t>(request.size())) {
      char buffer[1024];
      ssize_t n;
      while ((n = ::recv(fd, buffer, sizeof(buffer), 0)) > 0) {
        reply.append(buffer, static_cast<std::size_t>(n));
      }
    }
  }
  ::close(fd);
  return reply;
}

int port_of(const std::string &redirect_uri) {
  auto colon = redirect_uri.rfind(':');
  return std::stoi(redirect_uri.substr(colon + 1));
}

} // namespace

TEST_CASE("pkce helpers", "[auth]") {
  CHECK(pkce_challenge("dBjftJeZ4CVP-mB92K27uhbUJU1p1r_wW1gFWFOEjXk") ==
        "E9Melhoa2OwvFrEMTJguCHaoeK1t8URWbuGJSstw-cM");
  const unsigned char bytes[] = {0xfb, 0xff};
  CHECK(base64url_encode(bytes, sizeof(bytes)) == "-_8");

  auto pair = make_pkce_pair();
  CHECK(pair.verifier.size() == 43);
  CHECK(pair.challenge == pkce_challenge(pair.verifier));
  CHECK(make_pkce_pair().verifier != pair.verifier);
}

TEST_CASE("query parsing", "[auth]") {
  CHECK(url_decode("a+b%2Fc") == "a b/c");
  auto params = parse_query("/login?code=a%20b&state=x&flag#frag");
  CHECK(params["code"] == "a b");
  CHECK(params["state"] == "x");
  CHECK(params.count("flag") == 1);
  CHECK(parse_query("/login").empty());
}

TEST_CASE("grant selection", "[auth]") {
  Hostname host = normalize_hostname("tfe.example.com");
  OAuthClient client;
  client.client_id = "cli";
  client.grant_types = {grant::kPassword, grant::kDeviceCodeShort,
                        grant::kAuthzCode};
  client.token_url = "https://tfe.example.com/token";
  client.authz_url = "https://tfe.example.com/authorize";
  client.device_url = "https://tfe.example.com/device";
  CHECK(OAuthTokenAcquirer::select_grant(host, client) == grant::kAuthzCode);

  client.authz_url.clear();
  CHECK(OAuthTokenAcquirer::select_grant(host, client) == grant::kDeviceCode);

  client.device_url.clear();
  CHECK(OAuthTokenAcquirer::select_grant(host, client) == grant::kPassword);

  client.grant_types = {"implicit"};
  try {
    OAuthTokenAcquirer::select_grant(host, client);
    FAIL("expected UnsupportedHost");
  } catch (const LoginError &e) {
    CHECK(e.kind() == ErrorKind::UnsupportedHost);
    CHECK(std::string(e.what()).find("implicit") != std::string::npos);
  }
}

TEST_CASE("password grant", "[auth]") {
  FakeHttp http;
  FakeUi ui;
  OAuthTokenAcquirer acquirer(http, ui);
  auto endpoints = endpoints_with(login_service({"password"}));

  SECTION("issues a bearer token") {
    ui.answers = {std::string("alice"), std::string("s3cret")};
    http.replies.push_back(FakeHttp::reply(
        200,
        R"({"access_token":"T","token_type":"Bearer","refresh_token":"R"})"));
    Credential credential = acquirer.acquire(endpoints, {});
    CHECK(credential.token == "T");
    CHECK(credential.refresh_token == "R");
    CHECK(credential.host == endpoints.host());
    REQUIRE(http.posts.size() == 1);
    CHECK(http.posts[0].url == "https://tfe.example.com/oauth/token");
    CHECK(http.posts[0].field("grant_type") == "password");
    CHECK(http.posts[0].field("username") == "alice");
    CHECK(http.posts[0].field("password") == "s3cret");
    CHECK(http.posts[0].field("client_id") == "cli");
  }

  SECTION("closed input aborts") {
    CHECK(acquire_error(acquirer, endpoints) == ErrorKind::Aborted);
    CHECK(http.posts.empty());
  }

  SECTION("rejected credentials") {
    ui.answers = {std::string("alice"), std::string("wrong")};
    http.replies.push_back(FakeHttp::reply(
        400, R"({"error":"invalid_grant","error_description":"bad login"})"));
    try {
      acquirer.acquire(endpoints, {});
      FAIL("expected AuthorizationFailed");
    } catch (const LoginError &e) {
      CHECK(e.kind() == ErrorKind::AuthorizationFailed);
      std::string what = e.what();
      CHECK(what.find("invalid_grant (bad login)") != std::string::npos);
      CHECK(what.find("tfe.example.com") != std::string::npos);
    }
  }

  SECTION("unsupported token type") {
    ui.answers = {std::string("alice"), std::string("s3cret")};
    http.replies.push_back(
        FakeHttp::reply(200, R"({"access_token":"T","token_type":"mac"})"));
    CHECK(acquire_error(acquirer, endpoints) ==
          ErrorKind::AuthorizationFailed);
  }

  SECTION("malformed token response") {
    ui.answers = {std::string("alice"), std::string("s3cret")};
    http.replies.push_back(FakeHttp::reply(200, "not json"));
    CHECK(acquire_error(acquirer, endpoints) ==
          ErrorKind::AuthorizationFailed);
  }
}

TEST_CASE("unsupported host", "[auth]") {
  FakeHttp http;
  FakeUi ui;
  OAuthTokenAcquirer acquirer(http, ui);
  CHECK(acquire_error(acquirer, endpoints_with(login_service({"implicit"}))) ==
        ErrorKind::UnsupportedHost);
  CHECK(http.posts.empty());
  CHECK(ui.messages.empty());
}

TEST_CASE("device code grant", "[auth]") {
  FakeHttp http;
  FakeUi ui;
  AcquirerOptions options;
  options.interval_unit = 1ms;
  OAuthTokenAcquirer acquirer(http, ui, options);
  auto endpoints = endpoints_with(login_service({"device_code"}));
  http.replies.push_back(FakeHttp::reply(
      200, R"({"device_code":"dc","user_code":"ABCD-EFGH",
               "verification_uri":"https://tfe.example.com/activate",
               "interval":1,"expires_in":600})"));

  SECTION("polls until the token is issued") {
    http.replies.push_back(
        FakeHttp::reply(400, R"({"error":"authorization_pending"})"));
    http.replies.push_back(FakeHttp::reply(400, R"({"error":"slow_down"})"));
    http.replies.push_back(
        FakeHttp::reply(200, R"({"access_token":"D","token_type":"bearer"})"));
    Credential credential = acquirer.acquire(endpoints, {});
    CHECK(credential.token == "D");
    REQUIRE(http.posts.size() == 4);
    CHECK(http.posts[0].url == "https://tfe.example.com/oauth/device");
    CHECK(http.posts[3].field("grant_type") == grant::kDeviceCode);
    CHECK(http.posts[3].field("device_code") == "dc");
    REQUIRE(ui.messages.size() == 1);
    CHECK(ui.messages[0].find("ABCD-EFGH") != std::string::npos);
  }

  SECTION("denied") {
    http.replies.push_back(FakeHttp::reply(400, R"({"error":"access_denied"})"));
    CHECK(acquire_error(acquirer, endpoints) ==
          ErrorKind::AuthorizationFailed);
  }

  SECTION("expired device code") {
    http.replies.push_back(FakeHttp::reply(400, R"({"error":"expired_token"})"));
    CHECK(acquire_error(acquirer, endpoints) ==
          ErrorKind::AuthorizationTimedOut);
  }

  SECTION("cancelled while polling") {
    CancellationSource source;
    ui.on_message = [&source] { source.cancel(); };
    CHECK(acquire_error(acquirer, endpoints, source.token()) ==
          ErrorKind::Aborted);
    CHECK(http.posts.size() == 1);
  }
}

TEST_CASE("device code grant times out", "[auth]") {
  FakeHttp http;
  FakeUi ui;
  AcquirerOptions options;
  options.interval_unit = 1ms;
  options.timeout = 50ms;
  OAuthTokenAcquirer acquirer(http, ui, options);
  http.replies.push_back(FakeHttp::reply(
      200, R"({"device_code":"dc","user_code":"U",
               "verification_uri":"https://tfe.example.com/activate"})"));
  CHECK(acquire_error(acquirer,
                      endpoints_with(login_service({"device_code"}))) ==
        ErrorKind::AuthorizationTimedOut);
}

TEST_CASE("password grant times out while waiting for input", "[auth]") {
  FakeHttp http;
  FakeUi ui;
  ui.answers = {std::string("alice"), std::string("s3cret")};
  ui.answer_delay = 40ms;
  AcquirerOptions options;
  options.timeout = 30ms;
  OAuthTokenAcquirer acquirer(http, ui, options);
  try {
    acquirer.acquire(endpoints_with(login_service({"password"})), {});
    FAIL("expected AuthorizationTimedOut");
  } catch (const LoginError &e) {
    CHECK(e.kind() == ErrorKind::AuthorizationTimedOut);
    CHECK(std::string(e.what()).find("tfe.example.com") != std::string::npos);
  }
  CHECK(ui.prompt_budget == 30ms);
  CHECK(http.posts.empty());
}

TEST_CASE("cancelled before the handshake", "[auth]") {
  FakeHttp http;
  FakeUi ui;
  OAuthTokenAcquirer acquirer(http, ui);
  CancellationSource source;
  source.cancel();
  CHECK(acquire_error(acquirer, endpoints_with(login_service({"password"})),
                      source.token()) == ErrorKind::Aborted);
  CHECK(http.posts.empty());
}

TEST_CASE("authorization code grant", "[auth]") {
  FakeHttp http;
  FakeUi ui;
  OAuthTokenAcquirer acquirer(http, ui);
  auto endpoints = endpoints_with(login_service({"authz_code"}));
  std::thread browser;
  std::string browser_reply;

  auto redirect_with = [&](std::function<std::string(
                               const std::map<std::string, std::string> &)>
                               query) {
    ui.on_open = [&browser, &browser_reply, query](const std::string &url) {
      auto params = parse_query(url);
      int port = port_of(params["redirect_uri"]);
      std::string target = "/login?" + query(params);
      browser = std::thread([port, target, &browser_reply] {
        loopback_get(port, "/favicon.ico");
        browser_reply = loopback_get(port, target);
      });
    };
  };

  SECTION("exchanges the code") {
    redirect_with([](const std::map<std::string, std::string> &params) {
      return "code=abc&state=" + url_encode(params.at("state"));
    });
    http.replies.push_back(
        FakeHttp::reply(200, R"({"access_token":"A","token_type":"Bearer"})"));
    Credential credential = acquirer.acquire(endpoints, {});
    browser.join();
    CHECK(credential.token == "A");
    CHECK(browser_reply.find("200 OK") != std::string::npos);

    REQUIRE(ui.opened.size() == 1);
    auto params = parse_query(ui.opened[0]);
    CHECK(params["response_type"] == "code");
    CHECK(params["client_id"] == "cli");
    CHECK(params["code_challenge_method"] == "S256");
    CHECK(ui.opened[0].find("https://tfe.example.com/oauth/authorize?") == 0);

    REQUIRE(http.posts.size() == 1);
    const auto &exchange = http.posts[0];
    CHECK(exchange.field("grant_type") == "authorization_code");
    CHECK(exchange.field("code") == "abc");
    CHECK(exchange.field("redirect_uri") == params["redirect_uri"]);
    CHECK(pkce_challenge(exchange.field("code_verifier")) ==
          params["code_challenge"]);
  }

  SECTION("state mismatch") {
    redirect_with([](const std::map<std::string, std::string> &) {
      return std::string("code=abc&state=forged");
    });
    CHECK(acquire_error(acquirer, endpoints) ==
          ErrorKind::AuthorizationFailed);
    browser.join();
    CHECK(http.posts.empty());
  }

  SECTION("consent denied") {
    redirect_with([](const std::map<std::string, std::string> &params) {
      return "error=access_denied&state=" + url_encode(params.at("state"));
    });
    CHECK(acquire_error(acquirer, endpoints) ==
          ErrorKind::AuthorizationFailed);
    browser.join();
    CHECK(browser_reply.find("Authorization failed") != std::string::npos);
  }
}

TEST_CASE("authorization code grant times out", "[auth]") {
  FakeHttp http;
  FakeUi ui;
  AcquirerOptions options;
  options.timeout = 200ms;
  OAuthTokenAcquirer acquirer(http, ui, options);
  auto start = std::chrono::steady_clock::now();
  CHECK(acquire_error(acquirer,
                      endpoints_with(login_service({"authz_code"}))) ==
        ErrorKind::AuthorizationTimedOut);
  CHECK(std::chrono::steady_clock::now() - start < 10s);
  CHECK(http.posts.empty());
}

TEST_CASE("loopback listener ignores other paths", "[auth]") {
  LoopbackListener listener(29300, 29400);
  CHECK(listener.port() >= 29300);
  CHECK(listener.redirect_uri() ==
        "http://localhost:" + std::to_string(listener.port()) + "/login");

  std::string not_found;
  std::thread browser([&] {
    not_found = loopback_get(listener.port(), "/other");
    loopback_get(listener.port(), "/login?code=c&state=s");
  });
  auto request = listener.wait({}, Deadline(10s));
  browser.join();
  CHECK(not_found.find("404") != std::string::npos);
  CHECK(request.path == "/login");
  CHECK(request.params["code"] == "c");
  CHECK(request.params["state"] == "s");
}
