#pragma once

// Main fastbu header - includes everything needed

#include "types.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "storage.hpp"
#include "index.hpp"
#include "cache_engine.hpp"
#include "membership.hpp"
#include "hash_ring.hpp"
#include "protocol.hpp"
#include "cluster.hpp"
#include "coordinator.hpp"
#include "http_api.hpp"
#include "metrics.hpp"
#include <elio/io/io_context.hpp>
#include <elio/runtime/scheduler.hpp>

namespace fastbu {

// One cache node: local engine, cluster port and client API
class FastbuServer {
public:
    explicit FastbuServer(const Config& config);
    ~FastbuServer();

    // Open storage, bind both ports and start gossip
    elio::coro::task<Status> start(elio::runtime::scheduler& sched);

    // Stop all services gracefully
    elio::coro::task<void> stop();

    // Access components
    CacheEngine& engine() { return *engine_; }
    Cluster& cluster() { return *cluster_; }
    RequestCoordinator& coordinator() { return *coordinator_; }
    MetricsCollector& metrics() { return *metrics_collector_; }
    elio::io::io_context& io_context() { return io_ctx_; }

    const Config& config() const { return config_; }

private:
    Config config_;
    elio::io::io_context io_ctx_;  // Owned io_context for all async I/O
    std::unique_ptr<CacheEngine> engine_;
    std::unique_ptr<Cluster> cluster_;
    std::unique_ptr<RequestCoordinator> coordinator_;
    std::unique_ptr<MetricsCollector> metrics_collector_;
    std::unique_ptr<HttpHandler> http_handler_;
    std::unique_ptr<HttpServer> http_server_;

    std::atomic<bool> running_{false};
};

// Version information
struct Version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;
    static const char* string() { return "0.1.0"; }
};

}  // namespace fastbu
