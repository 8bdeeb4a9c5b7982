#include "fastbu/http_api.hpp"
#include "fastbu/cache_engine.hpp"
#include "fastbu/cluster.hpp"
#include "fastbu/coordinator.hpp"
#include "fastbu/logging.hpp"
#include <elio/net/tcp.hpp>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <sstream>
#include <type_traits>

namespace fastbu {

namespace {

constexpr const char* NODE_HEADER = "X-Fastbu-Node";
constexpr const char* OWNER_HEADER = "X-Fastbu-Owner";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
        std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
            return std::tolower(static_cast<unsigned char>(x)) ==
                   std::tolower(static_cast<unsigned char>(y));
        });
}

void write_string_array(std::ostringstream& json, const std::vector<std::string>& items) {
    json << "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) json << ", ";
        json << "\"" << json_escape(items[i]) << "\"";
    }
    json << "]";
}

}  // namespace

int http_status_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return 200;
        case ErrorCode::NotFound: return 404;
        case ErrorCode::InvalidArgument:
        case ErrorCode::KeyTooLarge:
        case ErrorCode::ValueTooLarge: return 400;
        case ErrorCode::Misrouted:
        case ErrorCode::NetworkError: return 503;
        case ErrorCode::Timeout: return 504;
        case ErrorCode::DiskError:
        case ErrorCode::Corrupted:
        case ErrorCode::InternalError: return 500;
    }
    return 500;
}

bool percent_decode(std::string_view in, std::string& out) {
    out.clear();
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] != '%') {
            out.push_back(in[i]);
            continue;
        }
        if (i + 2 >= in.size()) {
            return false;
        }
        int hi = hex_value(in[i + 1]);
        int lo = hex_value(in[i + 2]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }
    return true;
}

std::string json_escape(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out.push_back(c);
                }
        }
    }
    return out;
}

// HttpRequest implementation

HttpRequest HttpRequest::from_context(elio::http::context& ctx) {
    HttpRequest req;

    // Map Elio method to string
    switch (ctx.req().get_method()) {
        case elio::http::method::GET:     req.method = "GET"; break;
        case elio::http::method::POST:    req.method = "POST"; break;
        case elio::http::method::PUT:     req.method = "PUT"; break;
        case elio::http::method::DELETE_: req.method = "DELETE"; break;
        case elio::http::method::HEAD:    req.method = "HEAD"; break;
        case elio::http::method::OPTIONS: req.method = "OPTIONS"; break;
        default: req.method = "UNKNOWN"; break;
    }

    req.path = std::string(ctx.req().path());

    // Parse query string from full path if present
    auto query_pos = req.path.find('?');
    if (query_pos != std::string::npos) {
        req.query = req.path.substr(query_pos + 1);
        req.path = req.path.substr(0, query_pos);
    } else {
        req.query = std::string(ctx.req().query());
    }

    for (const auto& [name, value] : ctx.req().get_headers()) {
        req.headers[name] = value;
    }

    auto body_view = ctx.req().body();
    req.body = ByteBuffer(
        reinterpret_cast<const uint8_t*>(body_view.data()),
        reinterpret_cast<const uint8_t*>(body_view.data() + body_view.size())
    );

    return req;
}

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(name);
    if (it != headers.end()) {
        return it->second;
    }
    for (const auto& [k, v] : headers) {
        if (iequals(k, name)) {
            return v;
        }
    }
    return "";
}

// HttpResponse implementation

HttpResponse HttpResponse::ok(ByteBuffer body) {
    HttpResponse resp;
    resp.status_code = 200;
    resp.body = std::move(body);
    return resp;
}

HttpResponse HttpResponse::text(int code, const std::string& msg) {
    HttpResponse resp;
    resp.status_code = code;
    resp.body = ByteBuffer(msg.begin(), msg.end());
    resp.set_content_type("text/plain");
    return resp;
}

HttpResponse HttpResponse::json(const std::string& body) {
    HttpResponse resp = ok(ByteBuffer(body.begin(), body.end()));
    resp.set_content_type("application/json");
    return resp;
}

HttpResponse HttpResponse::not_found(const std::string& msg) {
    return text(404, msg);
}

HttpResponse HttpResponse::bad_request(const std::string& msg) {
    return text(400, msg);
}

HttpResponse HttpResponse::service_unavailable(const std::string& msg) {
    return text(503, msg);
}

HttpResponse HttpResponse::from_status(const Status& status) {
    std::string msg = status.message().empty()
        ? std::string(error_code_string(status.code()))
        : status.message();
    return text(http_status_for(status.code()), msg);
}

std::string HttpResponse::header(const std::string& name) const {
    auto it = headers.find(name);
    return it != headers.end() ? it->second : "";
}

void HttpResponse::set_content_type(const std::string& type) {
    headers["Content-Type"] = type;
}

elio::http::response HttpResponse::to_elio_response() const {
    elio::http::response resp(static_cast<elio::http::status>(status_code));

    resp.set_body(std::string(
        reinterpret_cast<const char*>(body.data()),
        body.size()
    ));

    for (const auto& [name, value] : headers) {
        resp.set_header(name, value);
    }

    return resp;
}

// HttpHandler implementation

HttpHandler::HttpHandler(RequestCoordinator& coordinator, CacheEngine& engine, Cluster& cluster)
    : coordinator_(coordinator)
    , engine_(engine)
    , cluster_(cluster)
{}

bool HttpHandler::parse_key_path(const std::string& path, const std::string& prefix,
                                 std::string& key, std::optional<std::string>* value) {
    if (path.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    std::string_view rest(path);
    rest.remove_prefix(prefix.size());

    std::string_view key_part = rest;
    if (value) {
        value->reset();
        auto slash = rest.find('/');
        if (slash != std::string_view::npos) {
            key_part = rest.substr(0, slash);
            std::string decoded;
            if (!percent_decode(rest.substr(slash + 1), decoded)) {
                return false;
            }
            *value = std::move(decoded);
        }
    }

    if (!percent_decode(key_part, key)) {
        return false;
    }
    return !key.empty();
}

void HttpHandler::tag_local(HttpResponse& resp) const {
    resp.headers[NODE_HEADER] = cluster_.local_id();
}

HttpResponse HttpHandler::finish(HttpResponse resp, const CoordinatorResult& result) const {
    resp.headers[NODE_HEADER] = result.served_by.empty() ? cluster_.local_id() : result.served_by;
    if (!result.status && !result.owner_api.empty()) {
        resp.headers[OWNER_HEADER] = result.owner_api;
    }
    return resp;
}

elio::coro::task<HttpResponse> HttpHandler::handle_get(const HttpRequest& req) {
    metrics().client_gets_total.inc();
    FASTBU_TIME_OPERATION(metrics().get_latency_ms);

    std::string key;
    if (!parse_key_path(req.path, "/get/", key)) {
        co_return HttpResponse::bad_request("Missing or malformed key");
    }

    auto result = co_await coordinator_.get(CacheKey(key));
    if (!result.status) {
        co_return finish(HttpResponse::from_status(result.status), result);
    }
    if (!result.found) {
        co_return finish(HttpResponse::not_found("Key not found"), result);
    }

    HttpResponse resp = HttpResponse::ok(std::move(result.value));
    resp.set_content_type("application/octet-stream");
    if (result.metadata) {
        resp.headers["X-Fastbu-Created"] = std::to_string(to_unix_millis(result.metadata->created_at));
        resp.headers["X-Fastbu-Updated"] = std::to_string(to_unix_millis(result.metadata->updated_at));
    }
    co_return finish(std::move(resp), result);
}

elio::coro::task<HttpResponse> HttpHandler::handle_set(const HttpRequest& req) {
    metrics().client_sets_total.inc();
    FASTBU_TIME_OPERATION(metrics().set_latency_ms);

    std::string key;
    std::optional<std::string> path_value;
    if (!parse_key_path(req.path, "/set/", key, &path_value)) {
        co_return HttpResponse::bad_request("Missing or malformed key");
    }

    ByteBuffer value = path_value
        ? ByteBuffer(path_value->begin(), path_value->end())
        : req.body;

    auto result = co_await coordinator_.set(CacheKey(key), std::move(value));
    if (!result.status) {
        co_return finish(HttpResponse::from_status(result.status), result);
    }
    co_return finish(HttpResponse::text(200, "OK"), result);
}

elio::coro::task<HttpResponse> HttpHandler::handle_delete(const HttpRequest& req) {
    metrics().client_deletes_total.inc();
    FASTBU_TIME_OPERATION(metrics().delete_latency_ms);

    std::string key;
    if (!parse_key_path(req.path, "/delete/", key)) {
        co_return HttpResponse::bad_request("Missing or malformed key");
    }

    auto result = co_await coordinator_.remove(CacheKey(key));
    if (!result.status) {
        co_return finish(HttpResponse::from_status(result.status), result);
    }
    if (!result.found) {
        co_return finish(HttpResponse::not_found("Key not found"), result);
    }
    co_return finish(HttpResponse::text(200, "Deleted"), result);
}

HttpResponse HttpHandler::handle_health(const HttpRequest&) const {
    std::ostringstream json;
    json << "{\"status\": \"healthy\", \"node\": \"" << json_escape(cluster_.local_id())
         << "\", \"entries\": " << engine_.size() << "}";
    HttpResponse resp = HttpResponse::json(json.str());
    tag_local(resp);
    return resp;
}

HttpResponse HttpHandler::handle_stats(const HttpRequest&) const {
    auto stats = engine_.stats();
    auto routing = coordinator_.stats();

    std::ostringstream json;
    json << "{\n";
    json << "  \"node\": \"" << json_escape(cluster_.local_id()) << "\",\n";
    json << "  \"hits\": " << stats.hits << ",\n";
    json << "  \"misses\": " << stats.misses << ",\n";
    json << "  \"sets\": " << stats.sets << ",\n";
    json << "  \"deletes\": " << stats.deletes << ",\n";
    json << "  \"bytes_read\": " << stats.bytes_read << ",\n";
    json << "  \"bytes_written\": " << stats.bytes_written << ",\n";
    json << "  \"consistency_faults\": " << stats.consistency_faults << ",\n";
    json << "  \"disk_errors\": " << stats.disk_errors << ",\n";
    json << "  \"entry_count\": " << stats.entry_count << ",\n";
    json << "  \"size_bytes\": " << stats.size_bytes << ",\n";

    double hit_rate = (stats.hits + stats.misses > 0)
        ? static_cast<double>(stats.hits) / (stats.hits + stats.misses) * 100
        : 0;
    json << "  \"hit_rate_percent\": " << hit_rate << ",\n";
    json << "  \"routing\": {\n";
    json << "    \"local\": " << routing.local_requests << ",\n";
    json << "    \"forwarded\": " << routing.forwarded_requests << ",\n";
    json << "    \"forward_failures\": " << routing.forward_failures << ",\n";
    json << "    \"misrouted\": " << routing.misrouted << ",\n";
    json << "    \"served_for_peers\": " << routing.served_for_peers << ",\n";
    json << "    \"refused_joining\": " << routing.refused_joining << "\n";
    json << "  }\n";
    json << "}\n";

    HttpResponse resp = HttpResponse::json(json.str());
    tag_local(resp);
    return resp;
}

HttpResponse HttpHandler::handle_cluster(const HttpRequest&) const {
    auto stats = cluster_.stats();
    auto ring = cluster_.ring();
    auto nodes = cluster_.membership().snapshot();
    std::sort(nodes.begin(), nodes.end(),
              [](const NodeInfo& a, const NodeInfo& b) { return a.id < b.id; });

    std::ostringstream json;
    json << "{\n";
    json << "  \"self\": \"" << json_escape(cluster_.local_id()) << "\",\n";
    json << "  \"joined\": " << (cluster_.gossip().joined() ? "true" : "false") << ",\n";
    json << "  \"total_nodes\": " << stats.total_nodes << ",\n";
    json << "  \"alive_nodes\": " << stats.alive_nodes << ",\n";
    json << "  \"suspect_nodes\": " << stats.suspect_nodes << ",\n";
    json << "  \"dead_nodes\": " << stats.dead_nodes << ",\n";
    json << "  \"ring_nodes\": " << ring->node_count() << ",\n";
    json << "  \"ring_points\": " << ring->size() << ",\n";
    json << "  \"virtual_nodes\": " << ring->virtual_nodes() << ",\n";
    json << "  \"nodes\": [";
    for (size_t i = 0; i < nodes.size(); ++i) {
        const auto& node = nodes[i];
        json << (i == 0 ? "\n" : ",\n");
        json << "    {\"id\": \"" << json_escape(node.id) << "\""
             << ", \"address\": \"" << json_escape(node.cluster_address()) << "\""
             << ", \"api_address\": \"" << json_escape(node.api_address()) << "\""
             << ", \"state\": \"" << node_state_string(node.state) << "\""
             << ", \"incarnation\": " << node.incarnation
             << ", \"metadata\": {";
        bool first = true;
        for (const auto& [k, v] : node.metadata) {
            if (!first) json << ", ";
            first = false;
            json << "\"" << json_escape(k) << "\": \"" << json_escape(v) << "\"";
        }
        json << "}}";
    }
    json << (nodes.empty() ? "]\n" : "\n  ]\n");
    json << "}\n";

    HttpResponse resp = HttpResponse::json(json.str());
    tag_local(resp);
    return resp;
}

HttpResponse HttpHandler::handle_metrics(const HttpRequest& req) const {
    if (!metrics_) {
        return HttpResponse::service_unavailable("Metrics not configured");
    }

    metrics_->collect();

    std::string body;
    std::string content_type;
    if (req.header("Accept").find("application/json") != std::string::npos) {
        body = metrics_->export_json();
        content_type = "application/json";
    } else {
        body = metrics_->export_prometheus();
        content_type = "text/plain; version=0.0.4; charset=utf-8";
    }

    HttpResponse resp = HttpResponse::ok(ByteBuffer(body.begin(), body.end()));
    resp.set_content_type(content_type);
    tag_local(resp);
    return resp;
}

HttpResponse HttpHandler::handle_verify(const HttpRequest&) const {
    auto report = engine_.verify();
    if (!report.consistent()) {
        FASTBU_LOG_WARN("Consistency check: " << report.missing_backing << " missing records, "
                        << report.orphan_records << " orphan records");
    }

    std::ostringstream json;
    json << "{\n";
    json << "  \"consistent\": " << (report.consistent() ? "true" : "false") << ",\n";
    json << "  \"indexed_entries\": " << report.indexed_entries << ",\n";
    json << "  \"verified_entries\": " << report.verified_entries << ",\n";
    json << "  \"missing_backing\": " << report.missing_backing << ",\n";
    json << "  \"orphan_records\": " << report.orphan_records << ",\n";
    json << "  \"temp_files\": " << report.temp_files << ",\n";
    json << "  \"missing_keys\": ";
    write_string_array(json, report.missing_keys);
    json << ",\n  \"orphan_files\": ";
    write_string_array(json, report.orphan_files);
    json << ",\n  \"temp_file_names\": ";
    write_string_array(json, report.temp_file_names);
    json << "\n}\n";

    HttpResponse resp = HttpResponse::json(json.str());
    tag_local(resp);
    return resp;
}

template <typename Fn>
elio::coro::task<elio::http::response> HttpHandler::serve(elio::http::context& ctx, Fn fn) {
    metrics().http_requests_total.inc();
    FASTBU_TIME_OPERATION(metrics().http_request_latency_ms);

    auto req = HttpRequest::from_context(ctx);
    HttpResponse resp;
    if constexpr (std::is_same_v<std::invoke_result_t<Fn, const HttpRequest&>, HttpResponse>) {
        resp = fn(req);
    } else {
        resp = co_await fn(req);
    }

    if (resp.status_code >= 500) {
        metrics().http_errors_total.inc();
    }
    FASTBU_LOG_DEBUG(req.method << " " << req.path << " -> " << resp.status_code);
    co_return resp.to_elio_response();
}

elio::http::router HttpHandler::build_router() {
    elio::http::router router;

    router.get("/get/:key", [this](elio::http::context& ctx) {
        return serve(ctx, [this](const HttpRequest& req) { return handle_get(req); });
    });

    // Value in the path, or in the body when the segment is absent
    router.post("/set/:key/:value", [this](elio::http::context& ctx) {
        return serve(ctx, [this](const HttpRequest& req) { return handle_set(req); });
    });

    router.post("/set/:key", [this](elio::http::context& ctx) {
        return serve(ctx, [this](const HttpRequest& req) { return handle_set(req); });
    });

    router.del("/delete/:key", [this](elio::http::context& ctx) {
        return serve(ctx, [this](const HttpRequest& req) { return handle_delete(req); });
    });

    router.get("/health", [this](elio::http::context& ctx) {
        return serve(ctx, [this](const HttpRequest& req) { return handle_health(req); });
    });

    router.get("/stats", [this](elio::http::context& ctx) {
        return serve(ctx, [this](const HttpRequest& req) { return handle_stats(req); });
    });

    router.get("/cluster", [this](elio::http::context& ctx) {
        return serve(ctx, [this](const HttpRequest& req) { return handle_cluster(req); });
    });

    router.get("/metrics", [this](elio::http::context& ctx) {
        return serve(ctx, [this](const HttpRequest& req) { return handle_metrics(req); });
    });

    router.post("/admin/verify", [this](elio::http::context& ctx) {
        return serve(ctx, [this](const HttpRequest& req) { return handle_verify(req); });
    });

    return router;
}

// HttpServer implementation using Elio's async HTTP server

HttpServer::HttpServer(const NodeConfig& node, const HttpConfig& config, HttpHandler& handler)
    : node_(node)
    , config_(config)
    , handler_(handler)
{}

HttpServer::~HttpServer() {
    if (server_) {
        server_->stop();
    }
}

elio::coro::task<Status> HttpServer::start(elio::io::io_context& io_ctx,
                                           elio::runtime::scheduler& sched) {
    elio::net::ipv4_address addr(node_.bind_address, node_.api_port);

    // The server's listen task does not report bind errors back to us, so
    // claim the port once up front
    {
        auto probe = elio::net::tcp_listener::bind(addr, io_ctx);
        if (!probe) {
            co_return Status::error(ErrorCode::NetworkError,
                "Failed to bind API port " + std::to_string(node_.api_port));
        }
        probe->close();
    }

    auto router = handler_.build_router();

    elio::http::server_config server_config;
    server_config.max_request_size = config_.max_request_size;
    server_config.read_buffer_size = config_.read_buffer_size;
    server_config.keep_alive_timeout = config_.keep_alive_timeout;
    server_config.max_keep_alive_requests = config_.max_keep_alive_requests;
    server_config.enable_logging = Logger::enabled(LogLevel::Debug);

    server_ = std::make_unique<elio::http::server>(std::move(router), server_config);

    auto listen_task = server_->listen(addr, io_ctx, sched);
    sched.spawn(listen_task.release());
    running_ = true;

    FASTBU_LOG_INFO("HTTP API listening on " << node_.bind_address << ":" << node_.api_port);
    co_return Status::make_ok();
}

elio::coro::task<void> HttpServer::stop() {
    running_ = false;
    if (server_) {
        server_->stop();
    }
    co_return;
}

}  // namespace fastbu
