#ifndef HOSTLOGIN_HTTP_CLIENT_HPP
#define HOSTLOGIN_HTTP_CLIENT_HPP

#include "cancellation.hpp"

#include <curl/curl.h>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace hostlogin {

/**
 * Simple HTTP response container capturing body, headers, and status code.
 */
struct HttpResponse {
  std::string body;                 ///< Response body
  std::vector<std::string> headers; ///< Response headers
  long status_code = 0;             ///< HTTP status code

  /**
   * Look up a response header by name (case-insensitive).
   *
   * @return Trimmed header value, or an empty optional when absent.
   */
  std::optional<std::string> header(const std::string &name) const;
};

/// Raised when a server answers with a non-success HTTP status.
class HttpStatusError : public std::runtime_error {
public:
  HttpStatusError(int status, const std::string &message)
      : std::runtime_error(message), status_(status) {}

  int status() const noexcept { return status_; }

private:
  int status_;
};

/// Raised for transport failures such as DNS, TLS or timeout errors.
class TransientNetworkError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Raised when an in-flight request is aborted through cancellation.
class RequestCancelled : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Ordered `application/x-www-form-urlencoded` fields.
using FormFields = std::vector<std::pair<std::string, std::string>>;

/** Interface for performing HTTP requests. */
class HttpClient {
public:
  virtual ~HttpClient() = default;

  /**
   * Perform a HTTP GET request.
   *
   * Redirects are followed. Non-2xx final responses raise HttpStatusError.
   *
   * @param url Absolute request URL.
   * @param headers Additional request headers expressed as `Header: value`
   *        strings.
   * @return Aggregated response body, headers, and HTTP status code.
   * @throws HttpStatusError, TransientNetworkError, RequestCancelled
   */
  virtual HttpResponse get(const std::string &url,
                           const std::vector<std::string> &headers) = 0;

  /**
   * Perform a HTTP POST with a form-encoded body.
   *
   * Unlike get(), error statuses are returned to the caller because OAuth
   * token endpoints report protocol errors with 4xx responses.
   *
   * @throws TransientNetworkError, RequestCancelled
   */
  virtual HttpResponse post_form(const std::string &url,
                                 const FormFields &fields,
                                 const std::vector<std::string> &headers) = 0;
};

/**
 * RAII wrapper for a CURL easy handle ensuring global CURL initialization.
 */
class CurlHandle {
public:
  CurlHandle();
  ~CurlHandle();
  CurlHandle(const CurlHandle &) = delete;
  CurlHandle &operator=(const CurlHandle &) = delete;
  /**
   * Access the underlying CURL easy handle.
   *
   * @return Raw pointer to the initialized CURL handle.
   */
  CURL *get() const { return handle_; }

private:
  CURL *handle_;
};

/// Options applied to every request issued by CurlHttpClient.
struct HttpOptions {
  long timeout_ms = 30000;             ///< Connect and transfer timeout
  curl_off_t max_response_bytes = 0;   ///< Per-response body cap, 0 = none
  long max_redirects = 3;              ///< Redirects followed by GET
  std::string http_proxy;              ///< Proxy for http:// URLs
  std::string https_proxy;             ///< Proxy for https:// URLs
  std::string user_agent = "hostlogin";
};

/**
 * HttpClient implementation backed by libcurl.
 *
 * @note This class is not thread-safe; use one instance per thread.
 */
class CurlHttpClient : public HttpClient {
public:
  /**
   * Construct a CURL based HTTP client.
   *
   * @param options Timeout, size limit, redirect and proxy settings.
   * @param cancel Token aborting in-flight transfers when cancelled.
   */
  explicit CurlHttpClient(HttpOptions options = {},
                          CancellationToken cancel = {});

  HttpResponse get(const std::string &url,
                   const std::vector<std::string> &headers) override;

  HttpResponse post_form(const std::string &url, const FormFields &fields,
                         const std::vector<std::string> &headers) override;

  const HttpOptions &options() const { return options_; }

private:
  HttpResponse perform(const char *verb, const std::string &url,
                       const std::vector<std::string> &headers,
                       const std::string *body);
  void apply_proxy(CURL *curl, const std::string &url);

  CurlHandle curl_;
  HttpOptions options_;
  CancellationToken cancel_;
};

/// Percent-encode a single URL component.
std::string url_encode(const std::string &value);

/// Serialize form fields as `application/x-www-form-urlencoded`.
std::string encode_form(const FormFields &fields);

/**
 * Resolve @p reference against an absolute @p base URL.
 *
 * @throws std::invalid_argument when the result is not an absolute URL.
 */
std::string resolve_url(const std::string &base, const std::string &reference);

} // namespace hostlogin

#endif // HOSTLOGIN_HTTP_CLIENT_HPP
