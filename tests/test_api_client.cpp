#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "archon/api/client.hpp"

#include <memory>
#include <string>
#include <vector>

void register_api_client_tests(std::vector<archon::tests::TestCase> &tests) {
  using archon::tests::require;
  using archon::tests::require_contains;
  namespace api = archon::api;
  using archon::testing::MockHttpClient;

  tests.push_back({"api_client_attaches_bearer_and_json_headers", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->enqueue_json(200, R"({"id":1})");
                     api::ApiClient client(http, "https://archon.test/", std::string("tok"), true,
                                           4321);

                     auto body = client.request("POST", "/api/machines",
                                                std::string(R"({"name":"m1"})"));
                     require(body.ok(), body.error().to_string());
                     require(body.value() == R"({"id":1})", body.value());

                     const auto &request = http->requests().front();
                     require(request.method == "POST", "method");
                     require(request.url == "https://archon.test/api/machines", request.url);
                     require(request.headers.at("Authorization") == "Bearer tok", "bearer header");
                     require(request.headers.at("Content-Type") == "application/json",
                             "content type");
                     require(request.body == std::optional<std::string>(R"({"name":"m1"})"),
                             "body forwarded");
                     require(request.insecure, "insecure forwarded");
                     require(request.timeout_ms == 4321, "timeout forwarded");
                   }});

  tests.push_back({"api_client_anonymous_and_bodyless_methods", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->enqueue_json(200, "[]");
                     http->enqueue_json(204, "");
                     api::ApiClient client(http, "http://h", std::nullopt);

                     require(client.get("/api/health").ok(), "get");
                     require(!http->requests()[0].headers.contains("Authorization"),
                             "anonymous client sends no bearer");
                     require(client.request("delete", "/api/x", std::string("{}")).ok(), "delete");
                     require(http->requests()[1].method == "DELETE", "method upper-cased");
                     require(!http->requests()[1].body.has_value(), "DELETE sends no body");
                   }});

  tests.push_back({"api_client_maps_json_error_bodies", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->enqueue_json(422, R"({"error":"ValidationError","message":"name is required",)"
                                             R"("details":{"field":"name"}})");
                     http->enqueue_json(404, R"({"error":"Machine not found"})");
                     http->enqueue_json(409, "{}");
                     api::ApiClient client(http, "http://h", std::string("t"));

                     auto invalid = client.request("PUT", "/api/m/1", std::string("{}"));
                     require(!invalid.ok(), "422 must fail");
                     require(invalid.error().status == 422, "status");
                     require(invalid.error().message == "name is required", invalid.error().message);
                     require(invalid.error().error == "ValidationError", "error field");
                     require(invalid.error().details == R"({"field":"name"})", "details raw");

                     auto missing = client.get("/api/m/2");
                     require(missing.error().message == "Machine not found",
                             "error field is the fallback message");

                     auto conflict = client.request("PATCH", "/api/m/3");
                     require(conflict.error().message == "HTTP 409", conflict.error().message);
                   }});

  tests.push_back({"api_client_maps_non_json_and_network_errors", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->enqueue_text(502, "Bad Gateway");
                     http->enqueue_network_error("Connection refused");
                     api::ApiClient client(http, "http://h", std::string("t"));

                     auto gateway = client.get("/x");
                     require(!gateway.ok(), "502 must fail");
                     require(gateway.error().message == "HTTP 502", gateway.error().message);
                     require(gateway.error().error == "Bad Gateway", "body kept as error text");

                     auto offline = client.get("/x");
                     require(!offline.ok() && offline.error().network, "network flag");
                     require(offline.error().message == "request failed: Connection refused",
                             offline.error().message);
                   }});

  tests.push_back({"api_client_send_returns_any_status", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->enqueue_json(500, R"({"error":"boom"})");
                     api::ApiClient client(http, "http://h", std::nullopt);
                     auto sent = client.send("GET", "/x", std::nullopt);
                     require(sent.ok(), "send only fails on transport errors");
                     require(sent.value().status == 500, "status preserved");
                   }});

  tests.push_back({"api_error_guidance_by_status", [] {
                     api::ApiError expired{.status = 401, .message = "Token expired"};
                     const auto expired_text = api::format_api_error(expired);
                     require_contains(expired_text, "Session expired.");
                     require_contains(expired_text, "Run: archon auth login");

                     api::ApiError unauth{.status = 401, .message = "Unauthorized"};
                     require_contains(api::format_api_error(unauth),
                                      "Authentication required.");

                     api::ApiError denied{.status = 403, .message = "nope"};
                     require_contains(api::format_api_error(denied), "Permission denied.");

                     api::ApiError invalid{
                         .status = 422, .message = "bad", .details = R"({"field":"x"})"};
                     const auto invalid_text = api::format_api_error(invalid);
                     require_contains(invalid_text, "Validation error: bad");
                     require_contains(invalid_text, R"({"field":"x"})");

                     api::ApiError server{.status = 500, .message = "boom"};
                     require_contains(api::format_api_error(server), "Server error: boom");

                     api::ApiError teapot{.status = 418, .message = "short", .error = "stout"};
                     const auto teapot_text = api::format_api_error(teapot);
                     require_contains(teapot_text, "Error (418): short");
                     require_contains(teapot_text, "stout");
                   }});
}
