#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace archon::http {

using Headers = std::unordered_map<std::string, std::string>;

inline constexpr std::uint64_t DEFAULT_TIMEOUT_MS = 30000;

struct HttpRequest {
  std::string method = "GET";
  std::string url;
  Headers headers;
  std::optional<std::string> body;
  std::uint64_t timeout_ms = DEFAULT_TIMEOUT_MS;
  // Disables peer and host verification for this request only.
  bool insecure = false;
};

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  Headers headers; // keys lower-cased
  bool network_error = false;
  std::string network_error_message;

  [[nodiscard]] bool ok() const { return !network_error && status >= 200 && status < 300; }
  [[nodiscard]] std::string header(const std::string &name) const;
};

/// Joins a base URL and an absolute path without doubling the slash.
[[nodiscard]] std::string join_url(const std::string &base, const std::string &path);

class HttpClient {
public:
  virtual ~HttpClient() = default;

  [[nodiscard]] virtual HttpResponse execute(const HttpRequest &request) = 0;

  [[nodiscard]] HttpResponse post_json(const std::string &url, const Headers &headers,
                                       const std::string &body, std::uint64_t timeout_ms,
                                       bool insecure = false);
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient &) = delete;
  CurlHttpClient &operator=(const CurlHttpClient &) = delete;

  [[nodiscard]] HttpResponse execute(const HttpRequest &request) override;
};

} // namespace archon::http
