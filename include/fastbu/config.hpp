#pragma once

#include "types.hpp"
#include "logging.hpp"
#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <filesystem>

namespace fastbu {

// Identity and addresses of this node
struct NodeConfig {
    std::string id;                       // Empty = "<host>:<port>"
    std::string host = "127.0.0.1";       // Address advertised to peers
    std::string bind_address = "0.0.0.0";
    uint16_t port = 7946;                 // Cluster/gossip port
    uint16_t api_port = 3031;             // Client HTTP port
    std::map<std::string, std::string> metadata;  // Advertised via gossip

    std::string effective_id() const {
        return id.empty() ? host + ":" + std::to_string(port) : id;
    }
};

constexpr size_t MAX_VIRTUAL_NODES = 10000;
constexpr size_t MAX_PROBE_FANOUT = 64;

// Cluster membership and routing
struct ClusterConfig {
    std::vector<std::string> seeds;  // "host:port" of peers' cluster ports
    size_t virtual_nodes = 10;

    std::chrono::milliseconds gossip_interval{1000};
    std::chrono::milliseconds node_timeout{10000};      // Alive -> Suspect
    std::chrono::milliseconds suspect_timeout{10000};   // Suspect -> Dead
    std::chrono::milliseconds dead_node_retention{0};   // 0 = keep forever
    std::chrono::milliseconds request_timeout{5000};    // Forwarded requests
    size_t probe_fanout = 3;
};

// Local storage
struct StorageConfig {
    std::filesystem::path path = "cache_storage";
    std::string index_file = "cache_index.bin";
    bool sync_writes = true;  // fsync records and index
};

// Client API server
struct HttpConfig {
    size_t max_request_size = 64 * 1024 * 1024;
    size_t read_buffer_size = 64 * 1024;
    std::chrono::seconds keep_alive_timeout{30};
    size_t max_keep_alive_requests = 1000;
};

struct PerformanceConfig {
    size_t worker_threads = 0;  // 0 = auto
};

// Main configuration
struct Config {
    NodeConfig node;
    ClusterConfig cluster;
    StorageConfig storage;
    HttpConfig http;
    PerformanceConfig perf;
    LogLevel log_level = LogLevel::Info;

    // Load from file
    static Config load(const std::filesystem::path& path);
    static Config load_toml(const std::string& text);

    // Save to file
    void save(const std::filesystem::path& path) const;
    std::string to_toml() const;

    // Validation
    Status validate() const;
};

// Split "host:port"; returns false on malformed input
bool parse_host_port(const std::string& addr, std::string& host, uint16_t& port);

}  // namespace fastbu
