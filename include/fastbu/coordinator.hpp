#pragma once

#include "cache_engine.hpp"
#include "cluster.hpp"
#include <elio/coro/task.hpp>

namespace fastbu {

// Where an operation on a key is executed
struct RouteDecision {
    enum Target { Local, Remote };

    Target target = Local;
    NodeInfo owner;

    bool is_local() const { return target == Local; }
};

// Outcome of a client operation after routing
struct CoordinatorResult {
    Status status;                // Ok unless the operation failed
    bool found = false;           // get/remove: whether the key existed
    ByteBuffer value;             // get
    std::optional<EntryMetadata> metadata;
    std::string served_by;        // Node id that executed the operation
    std::string owner_api;        // Owner's "host:api_port"
    bool forwarded = false;
};

// Routes client operations to the key's owner.
//
// Keys owned by this node are served by the local CacheEngine. Other keys
// are forwarded over the cluster port to the owner and the reply is
// relayed. Forwarding is one hop: a node that receives a forwarded request
// for a key it does not own answers Misrouted and never serves it.
//
// While the node is still joining through its seeds, client operations are
// refused with NetworkError; its ring does not yet show the real owners.
class RequestCoordinator {
public:
    RequestCoordinator(CacheEngine& engine, Cluster& cluster, const ClusterConfig& config);

    // Owner of `key` on the current ring (no I/O)
    NodeInfo route(const CacheKey& key) const;
    RouteDecision decide(const CacheKey& key) const;

    elio::coro::task<CoordinatorResult> get(const CacheKey& key);
    elio::coro::task<CoordinatorResult> set(const CacheKey& key, ByteBuffer value);
    elio::coro::task<CoordinatorResult> remove(const CacheKey& key);

    // Cluster-port handler for Get/Set/Delete sent by other nodes
    elio::coro::task<protocol::Message> handle_forwarded(protocol::Message msg);
    protocol::Message serve_forwarded(const protocol::Message& msg);

    struct Stats {
        uint64_t local_requests = 0;
        uint64_t forwarded_requests = 0;
        uint64_t forward_failures = 0;
        uint64_t misrouted = 0;
        uint64_t served_for_peers = 0;
        uint64_t refused_joining = 0;
    };

    Stats stats() const;

private:
    CacheEngine& engine_;
    Cluster& cluster_;
    ClusterConfig config_;

    std::atomic<uint64_t> local_requests_{0};
    std::atomic<uint64_t> forwarded_requests_{0};
    std::atomic<uint64_t> forward_failures_{0};
    std::atomic<uint64_t> misrouted_{0};
    std::atomic<uint64_t> served_for_peers_{0};
    std::atomic<uint64_t> refused_joining_{0};

    bool refuse_while_joining(CoordinatorResult& result);

    CoordinatorResult local_get(const CacheKey& key);
    CoordinatorResult local_set(const CacheKey& key, ByteView value);
    CoordinatorResult local_remove(const CacheKey& key);

    // Turn a failed or unexpected exchange into a CoordinatorResult
    CoordinatorResult relay_failure(const RpcResult& rpc, const NodeInfo& owner);
    CoordinatorResult relay_status(ErrorCode code, const std::string& message,
                                   const std::string& owner_hint, const NodeInfo& owner);
};

}  // namespace fastbu
