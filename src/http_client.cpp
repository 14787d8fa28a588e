/**
 * @file http_client.cpp
 * @brief libcurl-backed HTTP client and URL helpers.
 */

#include "http_client.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>
#include <sstream>

namespace hostlogin {

namespace {

std::shared_ptr<spdlog::logger> http_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("http");
  }();
  return logger;
}

std::string to_lower_copy(const std::string &value) {
  std::string out = value;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

/**
 * Create a human readable error message for a CURL request.
 *
 * @param verb HTTP verb attempted.
 * @param url Request URL.
 * @param code CURL error code.
 * @param errbuf Optional buffer with extended error text.
 * @return Combined error description.
 */
std::string format_curl_error(const char *verb, const std::string &url,
                              CURLcode code, const char *errbuf) {
  std::ostringstream oss;
  oss << "curl " << verb;
  if (!url.empty()) {
    oss << ' ' << url;
  }
  oss << " failed: " << curl_easy_strerror(code);
  if (errbuf != nullptr && errbuf[0] != '\0') {
    oss << " - " << errbuf;
  }
  return oss.str();
}

/// Destination of a response body with an optional size cap.
struct BodySink {
  std::string *body;
  curl_off_t limit;
  bool exceeded = false;
};

/**
 * libcurl write callback capturing response bodies into a string.
 *
 * Returning a short count aborts the transfer once the cap is exceeded.
 */
size_t write_callback(void *contents, size_t size, size_t nmemb,
                      void *userp) {
  size_t total = size * nmemb;
  auto *sink = static_cast<BodySink *>(userp);
  if (sink->limit > 0 &&
      static_cast<curl_off_t>(sink->body->size() + total) > sink->limit) {
    sink->exceeded = true;
    return 0;
  }
  sink->body->append(static_cast<char *>(contents), total);
  return total;
}

/**
 * libcurl header callback collecting response headers.
 *
 * Headers of intermediate redirect responses are discarded so that only the
 * final response is reported.
 */
size_t header_callback(char *buffer, size_t size, size_t nitems,
                       void *userdata) {
  size_t total = size * nitems;
  std::string line(buffer, total);
  while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
    line.pop_back();
  auto *hdrs = static_cast<std::vector<std::string> *>(userdata);
  if (line.rfind("HTTP/", 0) == 0) {
    hdrs->clear();
  }
  if (!line.empty()) {
    hdrs->push_back(line);
  }
  return total;
}

/// libcurl progress callback aborting transfers on cancellation.
int xferinfo_callback(void *clientp, curl_off_t, curl_off_t, curl_off_t,
                      curl_off_t) {
  const auto *token = static_cast<const CancellationToken *>(clientp);
  return token->cancelled() ? 1 : 0;
}

struct CurlUrlFree {
  void operator()(CURLU *u) const { curl_url_cleanup(u); }
};

struct CurlStringFree {
  void operator()(char *s) const { curl_free(s); }
};

} // namespace

/**
 * RAII wrapper managing a CURL linked list of headers.
 */
struct CurlSlist {
  curl_slist *list{nullptr};
  CurlSlist() = default;
  ~CurlSlist() { curl_slist_free_all(list); }
  void append(const std::string &s) {
    list = curl_slist_append(list, s.c_str());
  }
  curl_slist *get() const { return list; }
  CurlSlist(const CurlSlist &) = delete;
  CurlSlist &operator=(const CurlSlist &) = delete;
};

std::optional<std::string> HttpResponse::header(const std::string &name) const {
  const std::string wanted = to_lower_copy(name);
  for (const auto &line : headers) {
    auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    if (to_lower_copy(line.substr(0, colon)) != wanted) {
      continue;
    }
    std::string value = line.substr(colon + 1);
    auto begin = value.find_first_not_of(" \t");
    if (begin == std::string::npos) {
      return std::string();
    }
    auto end = value.find_last_not_of(" \t");
    return value.substr(begin, end - begin + 1);
  }
  return std::nullopt;
}

/**
 * Initialize the CURL handle, ensuring global setup occurs once.
 */
CurlHandle::CurlHandle() {
  static std::once_flag flag;
  std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
  handle_ = curl_easy_init();
  if (!handle_) {
    throw TransientNetworkError("Failed to init curl");
  }
}

/**
 * Clean up the CURL easy handle.
 */
CurlHandle::~CurlHandle() { curl_easy_cleanup(handle_); }

CurlHttpClient::CurlHttpClient(HttpOptions options, CancellationToken cancel)
    : options_(std::move(options)), cancel_(std::move(cancel)) {}

/**
 * Configure proxy settings on the CURL handle based on the request URL.
 *
 * @param curl CURL handle being prepared.
 * @param url Request target URL.
 */
void CurlHttpClient::apply_proxy(CURL *curl, const std::string &url) {
  const std::string *proxy = nullptr;
  if (url.rfind("https://", 0) == 0) {
    if (!options_.https_proxy.empty()) {
      proxy = &options_.https_proxy;
    } else if (!options_.http_proxy.empty()) {
      proxy = &options_.http_proxy;
    }
    if (proxy) {
      curl_easy_setopt(curl, CURLOPT_HTTPPROXYTUNNEL, 1L);
    }
  } else if (url.rfind("http://", 0) == 0) {
    if (!options_.http_proxy.empty()) {
      proxy = &options_.http_proxy;
    }
    if (proxy) {
      curl_easy_setopt(curl, CURLOPT_HTTPPROXYTUNNEL, 0L);
    }
  }
  if (proxy) {
    curl_easy_setopt(curl, CURLOPT_PROXY, proxy->c_str());
  }
}

/**
 * Execute a request on the shared handle.
 *
 * @param body Form body for POST requests, `nullptr` for GET.
 */
HttpResponse CurlHttpClient::perform(const char *verb, const std::string &url,
                                     const std::vector<std::string> &headers,
                                     const std::string *body) {
  if (cancel_.cancelled()) {
    throw RequestCancelled(std::string("curl ") + verb + " " + url +
                           " cancelled");
  }
  CURL *curl = curl_.get();
  curl_easy_reset(curl);
  HttpResponse result;
  BodySink sink{&result.body, options_.max_response_bytes};
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  apply_proxy(curl, url);
  if (body) {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                     static_cast<curl_off_t>(body->size()));
  } else {
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, options_.max_redirects);
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
  }
  curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https");
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &result.headers);
  curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
  curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &cancel_);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, options_.timeout_ms);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, options_.timeout_ms);
  if (options_.max_response_bytes > 0)
    curl_easy_setopt(curl, CURLOPT_MAXFILESIZE_LARGE,
                     options_.max_response_bytes);
  char errbuf[CURL_ERROR_SIZE];
  errbuf[0] = '\0';
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
  CurlSlist header_list;
  for (const auto &h : headers) {
    header_list.append(h);
  }
  header_list.append("User-Agent: " + options_.user_agent);
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
  http_log()->debug("{} {}", verb, url);
  CURLcode res = curl_easy_perform(curl);
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.status_code);
  if (res == CURLE_ABORTED_BY_CALLBACK && cancel_.cancelled()) {
    http_log()->debug("{} {} aborted by cancellation", verb, url);
    throw RequestCancelled(std::string("curl ") + verb + " " + url +
                           " cancelled");
  }
  if (sink.exceeded || res == CURLE_FILESIZE_EXCEEDED) {
    std::string msg = std::string("curl ") + verb + " " + url +
                      " failed: response exceeds " +
                      std::to_string(options_.max_response_bytes) + " bytes";
    http_log()->error(msg);
    throw TransientNetworkError(msg);
  }
  if (res != CURLE_OK) {
    std::string msg = format_curl_error(verb, url, res, errbuf);
    http_log()->error(msg);
    throw TransientNetworkError(msg);
  }
  http_log()->debug("{} {} -> {}", verb, url, result.status_code);
  return result;
}

/**
 * Perform a GET request capturing both body and headers.
 */
HttpResponse CurlHttpClient::get(const std::string &url,
                                 const std::vector<std::string> &headers) {
  HttpResponse response = perform("GET", url, headers, nullptr);
  if (response.status_code < 200 || response.status_code >= 300) {
    http_log()->warn("curl GET {} failed with HTTP code {}", url,
                     response.status_code);
    throw HttpStatusError(static_cast<int>(response.status_code),
                          "curl GET " + url + " failed with HTTP code " +
                              std::to_string(response.status_code));
  }
  return response;
}

/**
 * Perform a form POST and return the response regardless of status.
 */
HttpResponse CurlHttpClient::post_form(const std::string &url,
                                       const FormFields &fields,
                                       const std::vector<std::string> &headers) {
  std::string body = encode_form(fields);
  std::vector<std::string> all_headers = headers;
  all_headers.push_back("Content-Type: application/x-www-form-urlencoded");
  return perform("POST", url, all_headers, &body);
}

std::string url_encode(const std::string &value) {
  if (value.empty()) {
    return value;
  }
  static CurlHandle curl;
  std::unique_ptr<char, CurlStringFree> escaped(curl_easy_escape(
      curl.get(), value.c_str(), static_cast<int>(value.size())));
  if (!escaped) {
    throw std::runtime_error("Failed to percent-encode value");
  }
  return std::string(escaped.get());
}

std::string encode_form(const FormFields &fields) {
  std::string out;
  for (const auto &[key, value] : fields) {
    if (!out.empty()) {
      out += '&';
    }
    out += url_encode(key);
    out += '=';
    out += url_encode(value);
  }
  return out;
}

std::string resolve_url(const std::string &base, const std::string &reference) {
  std::unique_ptr<CURLU, CurlUrlFree> url(curl_url());
  if (!url) {
    throw std::runtime_error("Failed to allocate URL handle");
  }
  CURLUcode rc = curl_url_set(url.get(), CURLUPART_URL, base.c_str(), 0);
  if (rc != CURLUE_OK) {
    throw std::invalid_argument("invalid base URL \"" + base +
                                "\": " + curl_url_strerror(rc));
  }
  rc = curl_url_set(url.get(), CURLUPART_URL, reference.c_str(), 0);
  if (rc != CURLUE_OK) {
    throw std::invalid_argument("invalid URL \"" + reference +
                                "\": " + curl_url_strerror(rc));
  }
  char *raw = nullptr;
  rc = curl_url_get(url.get(), CURLUPART_URL, &raw, 0);
  std::unique_ptr<char, CurlStringFree> full(raw);
  if (rc != CURLUE_OK || !full) {
    throw std::invalid_argument("cannot resolve URL \"" + reference +
                                "\": " + curl_url_strerror(rc));
  }
  return std::string(full.get());
}

} // namespace hostlogin
