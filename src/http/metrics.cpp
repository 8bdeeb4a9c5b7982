#include "fastbu/metrics.hpp"
#include "fastbu/cache_engine.hpp"
#include "fastbu/cluster.hpp"
#include "fastbu/coordinator.hpp"
#include <algorithm>
#include <iomanip>
#include <cmath>
#include <limits>

namespace fastbu {

// Global metrics instance
static Metrics g_metrics;

Metrics& metrics() {
    return g_metrics;
}

// LatencyHistogram implementation

void LatencyHistogram::observe(double value_ms) {
    auto it = std::lower_bound(BOUNDS_MS.begin(), BOUNDS_MS.end(), value_ms);
    counts_[static_cast<size_t>(it - BOUNDS_MS.begin())].fetch_add(1, std::memory_order_relaxed);
    count_.fetch_add(1, std::memory_order_relaxed);

    double old_sum = sum_.load(std::memory_order_relaxed);
    while (!sum_.compare_exchange_weak(old_sum, old_sum + value_ms,
                                       std::memory_order_relaxed));
}

LatencyHistogram::Snapshot LatencyHistogram::snapshot() const {
    Snapshot snap;
    snap.count = count_.load(std::memory_order_relaxed);
    snap.sum = sum_.load(std::memory_order_relaxed);
    snap.buckets.reserve(counts_.size());

    uint64_t cumulative = 0;
    for (size_t i = 0; i < counts_.size(); ++i) {
        cumulative += counts_[i].load(std::memory_order_relaxed);
        double bound = i < BOUNDS_MS.size() ? BOUNDS_MS[i]
                                            : std::numeric_limits<double>::infinity();
        snap.buckets.emplace_back(bound, cumulative);
    }
    return snap;
}

void LatencyHistogram::reset() {
    for (auto& c : counts_) {
        c.store(0, std::memory_order_relaxed);
    }
    count_.store(0, std::memory_order_relaxed);
    sum_.store(0, std::memory_order_relaxed);
}

// MetricsCollector implementation

MetricsCollector::MetricsCollector() = default;

void MetricsCollector::collect() {
    auto& m = metrics();

    if (engine_) {
        auto stats = engine_->stats();
        m.cache_hits_total.set(stats.hits);
        m.cache_misses_total.set(stats.misses);
        m.cache_sets_total.set(stats.sets);
        m.cache_deletes_total.set(stats.deletes);
        m.bytes_read_total.set(stats.bytes_read);
        m.bytes_written_total.set(stats.bytes_written);
        m.storage_errors_total.set(stats.disk_errors);
        m.consistency_faults_total.set(stats.consistency_faults);
        m.cache_entries.set(static_cast<double>(stats.entry_count));
        m.cache_size_bytes.set(static_cast<double>(stats.size_bytes));
    }

    if (coordinator_) {
        auto stats = coordinator_->stats();
        m.route_local_total.set(stats.local_requests);
        m.route_forwarded_total.set(stats.forwarded_requests);
        m.route_forward_failures_total.set(stats.forward_failures);
        m.route_misrouted_total.set(stats.misrouted);
        m.route_served_for_peers_total.set(stats.served_for_peers);
    }

    if (cluster_) {
        auto stats = cluster_->stats();
        m.cluster_nodes_alive.set(static_cast<double>(stats.alive_nodes));
        m.cluster_nodes_suspect.set(static_cast<double>(stats.suspect_nodes));
        m.cluster_nodes_dead.set(static_cast<double>(stats.dead_nodes));
        m.ring_nodes.set(static_cast<double>(stats.ring_nodes));
        m.ring_points.set(static_cast<double>(stats.ring_points));
        m.ring_rebuilds_total.set(stats.ring_rebuilds);
        m.cluster_messages_sent_total.set(stats.messages_sent);
        m.cluster_messages_received_total.set(stats.messages_received);
        m.cluster_request_timeouts_total.set(stats.request_timeouts);

        auto gossip = cluster_->gossip().stats();
        m.gossip_rounds_total.set(gossip.rounds);
        m.gossip_probes_total.set(gossip.probes_sent);
        m.gossip_probe_failures_total.set(gossip.probe_failures);
    }
}

void MetricsCollector::write_counter(std::ostringstream& out,
                                      const std::string& name,
                                      const std::string& help,
                                      uint64_t value) const {
    out << "# HELP " << name << " " << help << "\n";
    out << "# TYPE " << name << " counter\n";
    out << name << " " << value << "\n";
}

void MetricsCollector::write_gauge(std::ostringstream& out,
                                    const std::string& name,
                                    const std::string& help,
                                    double value) const {
    out << "# HELP " << name << " " << help << "\n";
    out << "# TYPE " << name << " gauge\n";
    out << name << " " << std::fixed << std::setprecision(2) << value << "\n";
}

void MetricsCollector::write_histogram(std::ostringstream& out,
                                        const std::string& name,
                                        const std::string& help,
                                        const LatencyHistogram::Snapshot& snap) const {
    out << "# HELP " << name << " " << help << "\n";
    out << "# TYPE " << name << " histogram\n";

    for (const auto& [bound, count] : snap.buckets) {
        out << name << "_bucket{le=\"";
        if (std::isinf(bound)) {
            out << "+Inf";
        } else {
            out << std::fixed << std::setprecision(1) << bound;
        }
        out << "\"} " << count << "\n";
    }

    out << name << "_sum " << std::fixed << std::setprecision(3) << snap.sum << "\n";
    out << name << "_count " << snap.count << "\n";
}

std::string MetricsCollector::export_prometheus() const {
    std::lock_guard lock(mutex_);
    std::ostringstream out;

    auto& m = metrics();

    // Client requests
    write_counter(out, "fastbu_client_gets_total",
                  "GET requests received from clients", m.client_gets_total.get());
    write_counter(out, "fastbu_client_sets_total",
                  "SET requests received from clients", m.client_sets_total.get());
    write_counter(out, "fastbu_client_deletes_total",
                  "DELETE requests received from clients", m.client_deletes_total.get());

    // Local engine
    write_counter(out, "fastbu_cache_hits_total",
                  "Local cache hits", m.cache_hits_total.get());
    write_counter(out, "fastbu_cache_misses_total",
                  "Local cache misses", m.cache_misses_total.get());
    write_counter(out, "fastbu_cache_sets_total",
                  "Successful local writes", m.cache_sets_total.get());
    write_counter(out, "fastbu_cache_deletes_total",
                  "Successful local deletes", m.cache_deletes_total.get());
    write_counter(out, "fastbu_bytes_read_total",
                  "Value bytes read from disk", m.bytes_read_total.get());
    write_counter(out, "fastbu_bytes_written_total",
                  "Value bytes written to disk", m.bytes_written_total.get());
    write_counter(out, "fastbu_storage_errors_total",
                  "Disk I/O failures", m.storage_errors_total.get());
    write_counter(out, "fastbu_consistency_faults_total",
                  "Index entries whose record could not be read back",
                  m.consistency_faults_total.get());
    write_gauge(out, "fastbu_cache_entries",
                "Entries in the local index", m.cache_entries.get());
    write_gauge(out, "fastbu_cache_size_bytes",
                "Value bytes held locally", m.cache_size_bytes.get());

    // Latency histograms
    write_histogram(out, "fastbu_get_latency_ms",
                    "Get latency in milliseconds", m.get_latency_ms.snapshot());
    write_histogram(out, "fastbu_set_latency_ms",
                    "Set latency in milliseconds", m.set_latency_ms.snapshot());
    write_histogram(out, "fastbu_delete_latency_ms",
                    "Delete latency in milliseconds", m.delete_latency_ms.snapshot());

    // Routing
    write_counter(out, "fastbu_route_local_total",
                  "Requests served by this node as owner", m.route_local_total.get());
    write_counter(out, "fastbu_route_forwarded_total",
                  "Requests forwarded to the owning node", m.route_forwarded_total.get());
    write_counter(out, "fastbu_route_forward_failures_total",
                  "Forwarded requests that failed", m.route_forward_failures_total.get());
    write_counter(out, "fastbu_route_misrouted_total",
                  "Requests for keys this node or the forward target did not own",
                  m.route_misrouted_total.get());
    write_counter(out, "fastbu_route_served_for_peers_total",
                  "Forwarded requests served for other nodes",
                  m.route_served_for_peers_total.get());

    // Cluster
    write_gauge(out, "fastbu_cluster_nodes_alive",
                "Nodes currently alive", m.cluster_nodes_alive.get());
    write_gauge(out, "fastbu_cluster_nodes_suspect",
                "Nodes currently suspected", m.cluster_nodes_suspect.get());
    write_gauge(out, "fastbu_cluster_nodes_dead",
                "Nodes declared dead", m.cluster_nodes_dead.get());
    write_gauge(out, "fastbu_ring_nodes",
                "Physical nodes on the hash ring", m.ring_nodes.get());
    write_gauge(out, "fastbu_ring_points",
                "Virtual nodes on the hash ring", m.ring_points.get());
    write_counter(out, "fastbu_ring_rebuilds_total",
                  "Hash ring rebuilds", m.ring_rebuilds_total.get());
    write_counter(out, "fastbu_gossip_rounds_total",
                  "Gossip rounds run", m.gossip_rounds_total.get());
    write_counter(out, "fastbu_gossip_probes_total",
                  "Probes sent", m.gossip_probes_total.get());
    write_counter(out, "fastbu_gossip_probe_failures_total",
                  "Probes without a valid ack", m.gossip_probe_failures_total.get());
    write_counter(out, "fastbu_cluster_messages_sent_total",
                  "Cluster messages sent", m.cluster_messages_sent_total.get());
    write_counter(out, "fastbu_cluster_messages_received_total",
                  "Cluster messages received", m.cluster_messages_received_total.get());
    write_counter(out, "fastbu_cluster_request_timeouts_total",
                  "Cluster requests that timed out", m.cluster_request_timeouts_total.get());

    // HTTP metrics
    write_counter(out, "fastbu_http_requests_total",
                  "Total HTTP requests handled", m.http_requests_total.get());
    write_counter(out, "fastbu_http_errors_total",
                  "HTTP responses with status >= 500", m.http_errors_total.get());
    write_histogram(out, "fastbu_http_request_latency_ms",
                    "HTTP request latency in milliseconds",
                    m.http_request_latency_ms.snapshot());

    // Uptime
    write_gauge(out, "fastbu_uptime_seconds",
                "Time since server start in seconds", m.uptime_seconds());

    // Hit rate (calculated)
    uint64_t total_gets = m.cache_hits_total.get() + m.cache_misses_total.get();
    double hit_rate = total_gets > 0
        ? static_cast<double>(m.cache_hits_total.get()) / total_gets
        : 0;
    write_gauge(out, "fastbu_cache_hit_rate",
                "Local hit rate (hits / lookups)", hit_rate);

    return out.str();
}

std::string MetricsCollector::export_json() const {
    std::lock_guard lock(mutex_);
    std::ostringstream out;

    auto& m = metrics();

    out << "{\n";
    out << "  \"client\": {\n";
    out << "    \"gets\": " << m.client_gets_total.get() << ",\n";
    out << "    \"sets\": " << m.client_sets_total.get() << ",\n";
    out << "    \"deletes\": " << m.client_deletes_total.get() << "\n";
    out << "  },\n";

    out << "  \"cache\": {\n";
    out << "    \"hits\": " << m.cache_hits_total.get() << ",\n";
    out << "    \"misses\": " << m.cache_misses_total.get() << ",\n";
    out << "    \"sets\": " << m.cache_sets_total.get() << ",\n";
    out << "    \"deletes\": " << m.cache_deletes_total.get() << ",\n";
    out << "    \"bytes_read\": " << m.bytes_read_total.get() << ",\n";
    out << "    \"bytes_written\": " << m.bytes_written_total.get() << ",\n";
    out << "    \"storage_errors\": " << m.storage_errors_total.get() << ",\n";
    out << "    \"consistency_faults\": " << m.consistency_faults_total.get() << ",\n";
    out << "    \"entries\": " << static_cast<uint64_t>(m.cache_entries.get()) << ",\n";
    out << "    \"size_bytes\": " << static_cast<uint64_t>(m.cache_size_bytes.get()) << "\n";
    out << "  },\n";

    out << "  \"routing\": {\n";
    out << "    \"local\": " << m.route_local_total.get() << ",\n";
    out << "    \"forwarded\": " << m.route_forwarded_total.get() << ",\n";
    out << "    \"forward_failures\": " << m.route_forward_failures_total.get() << ",\n";
    out << "    \"misrouted\": " << m.route_misrouted_total.get() << ",\n";
    out << "    \"served_for_peers\": " << m.route_served_for_peers_total.get() << "\n";
    out << "  },\n";

    out << "  \"cluster\": {\n";
    out << "    \"nodes_alive\": " << static_cast<uint64_t>(m.cluster_nodes_alive.get()) << ",\n";
    out << "    \"nodes_suspect\": " << static_cast<uint64_t>(m.cluster_nodes_suspect.get()) << ",\n";
    out << "    \"nodes_dead\": " << static_cast<uint64_t>(m.cluster_nodes_dead.get()) << ",\n";
    out << "    \"ring_nodes\": " << static_cast<uint64_t>(m.ring_nodes.get()) << ",\n";
    out << "    \"ring_points\": " << static_cast<uint64_t>(m.ring_points.get()) << ",\n";
    out << "    \"ring_rebuilds\": " << m.ring_rebuilds_total.get() << ",\n";
    out << "    \"gossip_rounds\": " << m.gossip_rounds_total.get() << ",\n";
    out << "    \"probes\": " << m.gossip_probes_total.get() << ",\n";
    out << "    \"probe_failures\": " << m.gossip_probe_failures_total.get() << ",\n";
    out << "    \"messages_sent\": " << m.cluster_messages_sent_total.get() << ",\n";
    out << "    \"messages_received\": " << m.cluster_messages_received_total.get() << ",\n";
    out << "    \"request_timeouts\": " << m.cluster_request_timeouts_total.get() << "\n";
    out << "  },\n";

    out << "  \"http\": {\n";
    out << "    \"requests\": " << m.http_requests_total.get() << ",\n";
    out << "    \"errors\": " << m.http_errors_total.get() << "\n";
    out << "  },\n";

    auto get_latency = m.get_latency_ms.snapshot();
    double avg_get_latency = get_latency.count > 0 ? get_latency.sum / get_latency.count : 0;

    out << "  \"latency_ms\": {\n";
    out << "    \"get_avg\": " << std::fixed << std::setprecision(3) << avg_get_latency << ",\n";

    auto set_latency = m.set_latency_ms.snapshot();
    double avg_set_latency = set_latency.count > 0 ? set_latency.sum / set_latency.count : 0;
    out << "    \"set_avg\": " << std::fixed << std::setprecision(3) << avg_set_latency << "\n";
    out << "  },\n";

    out << "  \"uptime_seconds\": " << std::fixed << std::setprecision(1) << m.uptime_seconds() << "\n";
    out << "}\n";

    return out.str();
}

}  // namespace fastbu
