#pragma once

#include "types.hpp"
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace fastbu {

// Liveness as seen by the local node. Order is severity.
enum class NodeState : uint32_t {
    Alive = 0,
    Suspect = 1,
    Dead = 2,
};

const char* node_state_string(NodeState state);

// A cluster member as exchanged through gossip
struct NodeInfo {
    std::string id;
    std::string host;
    uint16_t port = 0;       // Cluster/gossip port
    uint16_t api_port = 0;   // Client HTTP port
    uint64_t incarnation = 0;
    NodeState state = NodeState::Alive;
    std::map<std::string, std::string> metadata;

    std::string cluster_address() const { return host + ":" + std::to_string(port); }
    std::string api_address() const { return host + ":" + std::to_string(api_port); }
};

// True when `incoming` should replace `current` for the same node:
// higher incarnation wins; on equal incarnation the more severe state wins.
bool supersedes(const NodeInfo& incoming, const NodeInfo& current) noexcept;

// A transition observed by the local table
struct StateChange {
    std::string id;
    std::optional<NodeState> from;  // nullopt = newly discovered
    std::optional<NodeState> to;    // nullopt = forgotten (retention expired)
    uint64_t incarnation = 0;

    // Whether the set of ring-eligible (non-Dead) nodes changed
    bool affects_ring() const noexcept;
};

struct MembershipOptions {
    std::chrono::milliseconds node_timeout{10000};
    std::chrono::milliseconds suspect_timeout{10000};
    std::chrono::milliseconds dead_node_retention{0};  // 0 = keep forever
};

// Per-node view of the cluster and the failure detector state machine.
//
// All methods are serialized on one mutex. Time is passed in by the caller
// so that probe handling and gossip merges apply to the same clock.
class MembershipTable {
public:
    MembershipTable(NodeInfo self, MembershipOptions opts);

    // Local node (always Alive from its own point of view)
    NodeInfo self() const;
    const std::string& self_id() const { return self_id_; }

    // Every known node including self and Dead entries
    std::vector<NodeInfo> snapshot() const;

    // Alive and Suspect nodes including self
    std::vector<NodeInfo> ring_members() const;

    std::optional<NodeInfo> find(const std::string& id) const;
    size_t size() const;

    struct Counts {
        size_t alive = 0;
        size_t suspect = 0;
        size_t dead = 0;
    };
    Counts counts() const;

    // Apply gossip received from a peer using the incarnation rule.
    // Reports about self that claim Suspect/Dead are refuted by raising
    // the local incarnation above them.
    std::vector<StateChange> merge(const std::vector<NodeInfo>& remote, TimePoint now);

    // `id` answered a probe or contacted us directly. Revives a Suspect
    // node; a Dead node needs a higher incarnation instead.
    std::vector<StateChange> record_ack(const std::string& id, TimePoint now);

    // Advance the failure detector: Alive -> Suspect after node_timeout
    // without an ack, Suspect -> Dead after suspect_timeout, and forget
    // Dead entries past dead_node_retention (when non-zero).
    std::vector<StateChange> check_timeouts(TimePoint now);

    // Pick up to `count` non-Dead peers without a probe in flight and mark
    // them in flight. Dead peers are never returned here.
    std::vector<NodeInfo> select_probe_targets(size_t count, std::mt19937_64& rng);

    // Pick one Dead peer without a probe in flight, if any
    std::optional<NodeInfo> select_dead_target(std::mt19937_64& rng);

    void probe_finished(const std::string& id);

    uint64_t self_incarnation() const;

private:
    struct Member {
        NodeInfo info;
        TimePoint last_ack;
        TimePoint state_since;
        bool probe_in_flight = false;
    };

    mutable std::mutex mutex_;
    std::string self_id_;
    MembershipOptions opts_;
    std::unordered_map<std::string, Member> members_;

    void set_state(Member& m, NodeState state, TimePoint now,
                   std::vector<StateChange>& changes);
};

}  // namespace fastbu
