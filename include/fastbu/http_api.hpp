#pragma once

#include "types.hpp"
#include "config.hpp"
#include "metrics.hpp"
#include <elio/coro/task.hpp>
#include <elio/http/http_server.hpp>
#include <elio/io/io_context.hpp>
#include <elio/runtime/scheduler.hpp>
#include <atomic>
#include <memory>
#include <string>
#include <unordered_map>

namespace fastbu {

// Forward declarations
class CacheEngine;
class Cluster;
class RequestCoordinator;
struct CoordinatorResult;

// HTTP request representation (kept for internal use)
struct HttpRequest {
    std::string method;
    std::string path;
    std::string query;
    std::unordered_map<std::string, std::string> headers;
    ByteBuffer body;

    // Case-insensitive header lookup; empty when absent
    std::string header(const std::string& name) const;

    // Build from Elio context
    static HttpRequest from_context(elio::http::context& ctx);
};

// HTTP response representation (kept for internal use)
struct HttpResponse {
    int status_code = 200;
    std::unordered_map<std::string, std::string> headers;
    ByteBuffer body;

    // Common responses
    static HttpResponse ok(ByteBuffer body = {});
    static HttpResponse text(int code, const std::string& msg);
    static HttpResponse json(const std::string& body);
    static HttpResponse not_found(const std::string& msg = "Not Found");
    static HttpResponse bad_request(const std::string& msg);
    static HttpResponse service_unavailable(const std::string& msg);

    // Map a failed Status to its HTTP status code and a plain-text body
    static HttpResponse from_status(const Status& status);

    std::string body_string() const { return std::string(body.begin(), body.end()); }
    std::string header(const std::string& name) const;

    void set_content_type(const std::string& type);

    // Convert to Elio response
    elio::http::response to_elio_response() const;
};

// HTTP status for an error code
int http_status_for(ErrorCode code);

// Decode %XX escapes; false on a malformed escape
bool percent_decode(std::string_view in, std::string& out);

// Escape a string for embedding in a JSON document
std::string json_escape(std::string_view in);

// Client-facing HTTP API
class HttpHandler {
public:
    HttpHandler(RequestCoordinator& coordinator, CacheEngine& engine, Cluster& cluster);

    // Set metrics collector for /metrics endpoint
    void set_metrics_collector(MetricsCollector* collector) { metrics_ = collector; }

    // Key operations, routed to the owner
    elio::coro::task<HttpResponse> handle_get(const HttpRequest& req);
    elio::coro::task<HttpResponse> handle_set(const HttpRequest& req);
    elio::coro::task<HttpResponse> handle_delete(const HttpRequest& req);

    // Local status endpoints
    HttpResponse handle_health(const HttpRequest& req) const;
    HttpResponse handle_stats(const HttpRequest& req) const;
    HttpResponse handle_cluster(const HttpRequest& req) const;
    HttpResponse handle_metrics(const HttpRequest& req) const;
    HttpResponse handle_verify(const HttpRequest& req) const;

    // Build Elio router from the handlers above
    elio::http::router build_router();

    // Split "/set/{key}[/{value}]" style paths. Returns false when the key
    // segment is missing or badly escaped.
    static bool parse_key_path(const std::string& path, const std::string& prefix,
                               std::string& key, std::optional<std::string>* value = nullptr);

private:
    RequestCoordinator& coordinator_;
    CacheEngine& engine_;
    Cluster& cluster_;
    MetricsCollector* metrics_ = nullptr;

    HttpResponse finish(HttpResponse resp, const CoordinatorResult& result) const;
    void tag_local(HttpResponse& resp) const;

    // Elio handler adapter (wraps internal handlers for Elio's router)
    template <typename Fn>
    elio::coro::task<elio::http::response> serve(elio::http::context& ctx, Fn fn);
};

// HTTP server using Elio's async server
class HttpServer {
public:
    HttpServer(const NodeConfig& node, const HttpConfig& config, HttpHandler& handler);
    ~HttpServer();

    // Spawns the listener; NetworkError when the API port cannot be bound
    elio::coro::task<Status> start(elio::io::io_context& io_ctx,
                                   elio::runtime::scheduler& sched);
    elio::coro::task<void> stop();

    uint16_t port() const { return node_.api_port; }
    bool is_running() const { return running_; }

private:
    NodeConfig node_;
    HttpConfig config_;
    HttpHandler& handler_;
    std::unique_ptr<elio::http::server> server_;
    std::atomic<bool> running_{false};
};

}  // namespace fastbu
