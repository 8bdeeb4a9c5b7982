#pragma once

#include "types.hpp"
#include "config.hpp"
#include "protocol.hpp"
#include "membership.hpp"
#include "hash_ring.hpp"
#include <elio/coro/task.hpp>
#include <elio/sync/primitives.hpp>
#include <elio/runtime/scheduler.hpp>
#include <elio/io/io_context.hpp>
#include <elio/net/tcp.hpp>
#include <elio/time/timer.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <unordered_map>

namespace fastbu {

// Forward declarations
class GossipProtocol;

// Framed message stream to a remote node using Elio TCP
class Connection {
public:
    Connection(elio::net::tcp_stream stream, elio::io::io_context& io_ctx);
    ~Connection();

    // Send a message
    elio::coro::task<Status> send(const protocol::Message& msg, uint32_t request_id = 0);

    // Receive a message; nullopt on EOF, I/O error or a malformed frame
    elio::coro::task<std::optional<protocol::Message>> receive();

    // Request id of the last received message
    uint32_t last_request_id() const { return last_request_id_; }

    // Check if connected
    bool is_connected() const { return connected_; }

    // Close connection (idempotent)
    elio::coro::task<void> close();

    // Get peer address
    std::string peer_address() const;

    // Time since the last complete frame was sent or received
    std::chrono::milliseconds idle_for() const;

private:
    elio::net::tcp_stream stream_;
    elio::io::io_context& io_ctx_;
    std::atomic<int64_t> last_activity_ms_;
    std::atomic<bool> connected_{true};
    std::atomic<bool> closed_{false};
    elio::sync::mutex send_mutex_;
    elio::sync::mutex recv_mutex_;
    uint32_t last_request_id_ = 0;
};

// Outcome of a request/response exchange with a peer
struct RpcResult {
    Status status;
    std::optional<protocol::Message> response;
};

// Cluster membership, ring ownership and the cluster port
class Cluster {
public:
    // Serves Get/Set/Delete messages forwarded by other nodes
    using ForwardHandler = std::function<elio::coro::task<protocol::Message>(protocol::Message)>;

    Cluster(const Config& config, elio::io::io_context& io_ctx);
    ~Cluster();

    // Lifecycle (requires scheduler for background tasks). Failing to
    // bind the cluster port is reported as NetworkError.
    elio::coro::task<Status> start(elio::runtime::scheduler& sched);
    elio::coro::task<void> stop();
    bool is_running() const { return running_; }

    // Node access
    MembershipTable& membership() { return membership_; }
    const MembershipTable& membership() const { return membership_; }
    NodeInfo local_node() const { return membership_.self(); }
    const std::string& local_id() const { return membership_.self_id(); }

    // Current ring snapshot; never null
    RingPtr ring() const { return ring_.load(); }

    // Log membership transitions and rebuild the ring when the set of
    // ring members changed
    void apply_changes(const std::vector<StateChange>& changes);
    void rebuild_ring();

    void set_forward_handler(ForwardHandler handler);

    // Connect, send `msg`, wait for one reply, close. The whole exchange,
    // connect included, is bounded by `timeout`; Timeout is reported when
    // it expires. Requires a started cluster.
    elio::coro::task<RpcResult> request(const std::string& host, uint16_t port,
                                        protocol::Message msg,
                                        std::chrono::milliseconds timeout);

    GossipProtocol& gossip() { return *gossip_; }
    const GossipProtocol& gossip() const { return *gossip_; }

    // Statistics
    struct Stats {
        size_t total_nodes = 0;
        size_t alive_nodes = 0;
        size_t suspect_nodes = 0;
        size_t dead_nodes = 0;
        size_t ring_nodes = 0;
        size_t ring_points = 0;
        uint64_t messages_sent = 0;
        uint64_t messages_received = 0;
        uint64_t request_failures = 0;
        uint64_t request_timeouts = 0;
        uint64_t ring_rebuilds = 0;
        size_t inbound_connections = 0;
        uint64_t idle_closes = 0;
    };

    Stats stats() const;

    const Config& config() const { return config_; }

private:
    friend class GossipProtocol;

    Config config_;
    elio::io::io_context& io_ctx_;
    elio::runtime::scheduler* sched_ = nullptr;

    MembershipTable membership_;
    RingHolder ring_;

    // TCP listener for incoming connections
    std::optional<elio::net::tcp_listener> listener_;

    std::unique_ptr<GossipProtocol> gossip_;

    std::mutex handler_mutex_;
    ForwardHandler forward_handler_;

    // Inbound connections, for the idle sweep
    mutable std::mutex inbound_mutex_;
    std::unordered_map<const Connection*, std::weak_ptr<Connection>> inbound_;

    std::atomic<bool> running_{false};
    std::atomic<uint32_t> next_request_id_{1};

    std::atomic<uint64_t> messages_sent_{0};
    std::atomic<uint64_t> messages_received_{0};
    std::atomic<uint64_t> request_failures_{0};
    std::atomic<uint64_t> request_timeouts_{0};
    std::atomic<uint64_t> ring_rebuilds_{0};
    std::atomic<uint64_t> idle_closes_{0};

    // Internal helpers
    elio::coro::task<void> accept_loop();
    // Closes inbound connections idle for longer than node_timeout
    elio::coro::task<void> idle_sweep_loop();
    elio::coro::task<void> handle_connection(std::shared_ptr<Connection> conn);
    elio::coro::task<protocol::Message> dispatch(protocol::Message msg, uint32_t request_id);
};

// SWIM-style failure detection and membership dissemination.
//
// Each tick probes a few random peers with a Ping carrying the full
// membership snapshot; the Ack carries the peer's snapshot back. Probes
// run as detached tasks so a stalled peer never delays the tick.
class GossipProtocol {
public:
    GossipProtocol(Cluster& cluster, const ClusterConfig& config,
                   elio::io::io_context& io_ctx);
    ~GossipProtocol();

    elio::coro::task<void> start(elio::runtime::scheduler& sched);
    elio::coro::task<void> stop();

    // Process incoming messages (cluster port)
    protocol::Message handle_join(const protocol::JoinMessage& msg);
    protocol::Message handle_ping(const protocol::PingMessage& msg);

    // One failure-detection and dissemination round
    void gossip_round();

    bool joined() const { return joined_; }

    // Seeds other than this node are configured and no join has succeeded
    // yet. A node with no such seed is the bootstrap origin.
    bool joining() const { return needs_join_ && !joined_; }

    struct Stats {
        uint64_t rounds = 0;
        uint64_t probes_sent = 0;
        uint64_t probe_failures = 0;
        uint64_t joins_sent = 0;
        uint64_t joins_received = 0;
    };

    Stats stats() const;

private:
    Cluster& cluster_;
    ClusterConfig config_;
    elio::io::io_context& io_ctx_;
    elio::runtime::scheduler* sched_ = nullptr;
    bool needs_join_ = false;
    std::atomic<bool> running_{false};
    std::atomic<bool> joined_{false};
    std::atomic<bool> join_in_flight_{false};

    std::mutex rng_mutex_;
    std::mt19937_64 rng_;

    std::atomic<uint64_t> rounds_{0};
    std::atomic<uint64_t> probes_sent_{0};
    std::atomic<uint64_t> probe_failures_{0};
    std::atomic<uint64_t> joins_sent_{0};
    std::atomic<uint64_t> joins_received_{0};

    elio::coro::task<void> gossip_loop();
    elio::coro::task<void> join_seeds();
    elio::coro::task<void> probe(NodeInfo target);

    bool is_self_address(const std::string& host, uint16_t port) const;
    bool has_live_peers() const;
};

}  // namespace fastbu
