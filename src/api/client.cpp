#include "archon/api/client.hpp"

#include "archon/common/fs.hpp"
#include "archon/common/json_util.hpp"
#include "archon/observability/global.hpp"

#include <chrono>
#include <sstream>

namespace archon::api {

namespace {

bool sends_body(const std::string &method) {
  return method == "POST" || method == "PUT" || method == "PATCH";
}

ApiError error_from_response(const http::HttpResponse &response) {
  ApiError error;
  error.status = response.status;
  const std::string fallback = "HTTP " + std::to_string(response.status);

  const auto content_type = common::to_lower(response.header("content-type"));
  if (content_type.find("application/json") == std::string::npos) {
    error.message = fallback;
    error.error = response.body;
    return error;
  }

  const auto fields = common::json_parse_flat(common::trim(response.body));
  const auto field = [&fields](const std::string &key) {
    const auto it = fields.find(key);
    return it == fields.end() || it->second == "null" ? std::string() : it->second;
  };
  error.error = field("error");
  error.details = field("details");
  error.message = field("message");
  if (error.message.empty()) {
    error.message = error.error;
  }
  if (error.message.empty()) {
    error.message = fallback;
  }
  return error;
}

} // namespace

std::string ApiError::to_string() const {
  if (network) {
    return message;
  }
  std::string out = "HTTP " + std::to_string(status);
  if (!message.empty()) {
    out += ": " + message;
  }
  return out;
}

ApiClient::ApiClient(std::shared_ptr<http::HttpClient> http, std::string base_url,
                     std::optional<std::string> token, const bool insecure,
                     const std::uint64_t timeout_ms)
    : http_(std::move(http)), base_url_(std::move(base_url)), token_(std::move(token)),
      insecure_(insecure), timeout_ms_(timeout_ms) {}

ApiResult<http::HttpResponse> ApiClient::send(const std::string &method, const std::string &path,
                                              const std::optional<std::string> &body,
                                              const http::Headers &extra_headers) {
  http::HttpRequest request;
  request.method = common::to_upper(method);
  request.url = http::join_url(base_url_, path);
  request.timeout_ms = timeout_ms_;
  request.insecure = insecure_;
  request.headers["Content-Type"] = "application/json";
  for (const auto &[name, value] : extra_headers) {
    request.headers[name] = value;
  }
  if (token_.has_value()) {
    request.headers["Authorization"] = "Bearer " + *token_;
  }
  if (body.has_value() && sends_body(request.method)) {
    request.body = *body;
  }

  const auto started = std::chrono::steady_clock::now();
  auto response = http_->execute(request);
  const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  observability::record_api_request(request.method, path, response.status, duration);

  if (response.network_error) {
    observability::record_error("api", response.network_error_message);
    ApiError error;
    error.network = true;
    error.message = "request failed: " + response.network_error_message;
    return ApiResult<http::HttpResponse>::failure(std::move(error));
  }
  return ApiResult<http::HttpResponse>::success(std::move(response));
}

ApiResult<std::string> ApiClient::request(const std::string &method, const std::string &path,
                                          const std::optional<std::string> &body,
                                          const http::Headers &extra_headers) {
  auto sent = send(method, path, body, extra_headers);
  if (!sent.ok()) {
    return ApiResult<std::string>::failure(sent.error());
  }
  const auto &response = sent.value();
  if (!response.ok()) {
    return ApiResult<std::string>::failure(error_from_response(response));
  }
  return ApiResult<std::string>::success(response.body);
}

ApiResult<std::string> ApiClient::get(const std::string &path) { return request("GET", path); }

std::string format_api_error(const ApiError &error) {
  std::ostringstream out;
  if (error.network) {
    out << "Error: " << error.message << "\n";
    return out.str();
  }

  switch (error.status) {
  case 401: {
    const auto lowered = common::to_lower(error.message);
    if (lowered.find("expired") != std::string::npos ||
        lowered.find("invalid token") != std::string::npos) {
      out << "Session expired.\n";
      out << "Your authentication token has expired.\n";
    } else {
      out << "Authentication required.\n";
    }
    out << "Run: archon auth login\n";
    break;
  }
  case 403:
    out << "Permission denied.\n";
    out << "This action requires admin or operator privileges.\n";
    break;
  case 404:
    out << "Not found: " << error.message << "\n";
    break;
  case 409:
    out << "Conflict: " << error.message << "\n";
    break;
  case 422:
    out << "Validation error: " << error.message << "\n";
    if (!error.details.empty()) {
      out << error.details << "\n";
    }
    break;
  case 500:
    out << "Server error: " << error.message << "\n";
    out << "The server encountered an internal error. Please try again later.\n";
    break;
  default:
    out << "Error (" << error.status << "): " << error.message << "\n";
    if (!error.error.empty()) {
      out << error.error << "\n";
    }
    break;
  }
  return out.str();
}

} // namespace archon::api
