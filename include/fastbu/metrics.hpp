#pragma once

#include "types.hpp"
#include <string>
#include <sstream>
#include <array>
#include <atomic>
#include <mutex>
#include <memory>
#include <chrono>
#include <vector>

namespace fastbu {

// Forward declarations
class CacheEngine;
class Cluster;
class RequestCoordinator;

// Latency histogram over fixed millisecond bounds plus +Inf
class LatencyHistogram {
public:
    static constexpr std::array<double, 15> BOUNDS_MS = {
        0.1, 0.5, 1, 2.5, 5, 10, 25, 50, 100, 250, 500, 1000, 2500, 5000, 10000
    };

    LatencyHistogram() = default;

    void observe(double value_ms);

    // Cumulative counts per bound (last entry is +Inf)
    struct Snapshot {
        std::vector<std::pair<double, uint64_t>> buckets;
        uint64_t count = 0;
        double sum = 0;
    };

    Snapshot snapshot() const;
    void reset();

private:
    std::array<std::atomic<uint64_t>, BOUNDS_MS.size() + 1> counts_{};
    std::atomic<uint64_t> count_{0};
    std::atomic<double> sum_{0};
};

// Counter metric
class Counter {
public:
    Counter() = default;

    void inc(uint64_t n = 1) { value_.fetch_add(n, std::memory_order_relaxed); }
    uint64_t get() const { return value_.load(std::memory_order_relaxed); }
    void reset() { value_.store(0, std::memory_order_relaxed); }

    // Mirror a monotonic counter kept by another component
    void set(uint64_t v) { value_.store(v, std::memory_order_relaxed); }

private:
    std::atomic<uint64_t> value_{0};
};

// Gauge metric (can go up or down)
class Gauge {
public:
    Gauge() = default;

    void set(double v) { value_.store(v, std::memory_order_relaxed); }
    void inc(double n = 1) {
        double old = value_.load();
        while (!value_.compare_exchange_weak(old, old + n));
    }
    void dec(double n = 1) { inc(-n); }
    double get() const { return value_.load(std::memory_order_relaxed); }

private:
    std::atomic<double> value_{0};
};

// All metrics for fastbu
struct Metrics {
    // Client operations (HTTP front end)
    Counter client_gets_total;
    Counter client_sets_total;
    Counter client_deletes_total;

    // Local cache engine
    Counter cache_hits_total;
    Counter cache_misses_total;
    Counter cache_sets_total;
    Counter cache_deletes_total;
    Counter bytes_read_total;
    Counter bytes_written_total;
    Counter storage_errors_total;
    Counter consistency_faults_total;
    Gauge cache_entries;
    Gauge cache_size_bytes;

    // Latency histograms
    LatencyHistogram get_latency_ms;
    LatencyHistogram set_latency_ms;
    LatencyHistogram delete_latency_ms;

    // Routing
    Counter route_local_total;
    Counter route_forwarded_total;
    Counter route_forward_failures_total;
    Counter route_misrouted_total;
    Counter route_served_for_peers_total;

    // Cluster and gossip
    Gauge cluster_nodes_alive;
    Gauge cluster_nodes_suspect;
    Gauge cluster_nodes_dead;
    Gauge ring_nodes;
    Gauge ring_points;
    Counter ring_rebuilds_total;
    Counter gossip_rounds_total;
    Counter gossip_probes_total;
    Counter gossip_probe_failures_total;
    Counter cluster_messages_sent_total;
    Counter cluster_messages_received_total;
    Counter cluster_request_timeouts_total;

    // HTTP server metrics
    Counter http_requests_total;
    Counter http_errors_total;
    LatencyHistogram http_request_latency_ms;

    // Uptime
    std::chrono::steady_clock::time_point start_time;

    Metrics() : start_time(std::chrono::steady_clock::now()) {}

    double uptime_seconds() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double>(now - start_time).count();
    }
};

// Global metrics instance
Metrics& metrics();

// Metrics collector - pulls component statistics into the registry
class MetricsCollector {
public:
    MetricsCollector();

    // Set sources for metrics collection
    void set_engine(const CacheEngine* engine) { engine_ = engine; }
    void set_coordinator(const RequestCoordinator* coordinator) { coordinator_ = coordinator; }
    void set_cluster(const Cluster* cluster) { cluster_ = cluster; }

    // Update metrics from sources
    void collect();

    // Export to Prometheus format
    std::string export_prometheus() const;

    // Export to JSON format
    std::string export_json() const;

private:
    const CacheEngine* engine_ = nullptr;
    const RequestCoordinator* coordinator_ = nullptr;
    const Cluster* cluster_ = nullptr;
    mutable std::mutex mutex_;

    void write_counter(std::ostringstream& out, const std::string& name,
                       const std::string& help, uint64_t value) const;
    void write_gauge(std::ostringstream& out, const std::string& name,
                     const std::string& help, double value) const;
    void write_histogram(std::ostringstream& out, const std::string& name,
                         const std::string& help,
                         const LatencyHistogram::Snapshot& snap) const;
};

// RAII timer for latency measurement
class LatencyTimer {
public:
    explicit LatencyTimer(LatencyHistogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now())
    {}

    ~LatencyTimer() {
        auto end = std::chrono::steady_clock::now();
        double ms = std::chrono::duration<double, std::milli>(end - start_).count();
        histogram_.observe(ms);
    }

    // Non-copyable
    LatencyTimer(const LatencyTimer&) = delete;
    LatencyTimer& operator=(const LatencyTimer&) = delete;

private:
    LatencyHistogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

#define FASTBU_CONCAT_INNER(a, b) a##b
#define FASTBU_CONCAT(a, b) FASTBU_CONCAT_INNER(a, b)

// Convenience macro for timing operations
#define FASTBU_TIME_OPERATION(histogram) \
    fastbu::LatencyTimer FASTBU_CONCAT(_timer_, __LINE__)(histogram)

}  // namespace fastbu
