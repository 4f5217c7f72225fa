#pragma once

#include "archon/common/result.hpp"
#include "archon/http/client.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace archon::api {

struct ApiError {
  std::uint16_t status = 0;
  std::string message;
  std::string error;
  std::string details; // raw JSON text of the "details" field
  // Transport failure; no HTTP status was received.
  bool network = false;

  [[nodiscard]] std::string to_string() const;
};

template <typename T> using ApiResult = common::Result<T, ApiError>;

/// Backend API calls for one profile. The bearer token is attached as given;
/// obtaining a valid one is the caller's job.
class ApiClient {
public:
  ApiClient(std::shared_ptr<http::HttpClient> http, std::string base_url,
            std::optional<std::string> token, bool insecure = false,
            std::uint64_t timeout_ms = http::DEFAULT_TIMEOUT_MS);

  /// Any HTTP reply, whatever its status. Fails only on transport errors.
  [[nodiscard]] ApiResult<http::HttpResponse> send(const std::string &method,
                                                   const std::string &path,
                                                   const std::optional<std::string> &body,
                                                   const http::Headers &extra_headers = {});

  /// Returns the response body of a 2xx reply. `body` is only sent for
  /// POST, PUT and PATCH.
  [[nodiscard]] ApiResult<std::string> request(const std::string &method, const std::string &path,
                                               const std::optional<std::string> &body = std::nullopt,
                                               const http::Headers &extra_headers = {});

  [[nodiscard]] ApiResult<std::string> get(const std::string &path);

private:
  std::shared_ptr<http::HttpClient> http_;
  std::string base_url_;
  std::optional<std::string> token_;
  bool insecure_;
  std::uint64_t timeout_ms_;
};

/// User-facing guidance for an API failure, one line per entry.
[[nodiscard]] std::string format_api_error(const ApiError &error);

} // namespace archon::api
