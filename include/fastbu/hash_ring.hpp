#pragma once

#include "types.hpp"
#include "membership.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace fastbu {

// One ring position of a physical node
struct VirtualNode {
    uint64_t hash = 0;
    std::string owner;
};

// Immutable consistent-hash ring.
//
// Built once from a member list; lookups never lock. A membership change
// produces a new ring which replaces the old one through RingHolder.
class HashRing {
public:
    HashRing() = default;
    HashRing(const std::vector<NodeInfo>& nodes, size_t virtual_nodes);

    // Owner of the first virtual node clockwise from the key's hash
    std::optional<NodeInfo> owner(const CacheKey& key) const;
    std::optional<NodeInfo> owner_of_hash(uint64_t hash) const;

    bool is_owner(const std::string& node_id, const CacheKey& key) const;

    size_t node_count() const { return nodes_.size(); }
    size_t size() const { return points_.size(); }
    bool empty() const { return points_.empty(); }
    size_t virtual_nodes() const { return virtual_nodes_; }

    const std::vector<VirtualNode>& points() const { return points_; }
    std::vector<std::string> node_ids() const;

    // Position of replica `replica` of `node_id` on the ring
    static uint64_t point_hash(std::string_view node_id, size_t replica);

private:
    size_t virtual_nodes_ = 0;
    std::vector<VirtualNode> points_;  // Sorted by (hash, owner)
    std::unordered_map<std::string, NodeInfo> nodes_;
};

using RingPtr = std::shared_ptr<const HashRing>;

// Publishes the current ring to concurrent readers. Readers copy the
// pointer and keep using their snapshot; writers swap in a new ring.
class RingHolder {
public:
    RingHolder() : ring_(std::make_shared<const HashRing>()) {}

    RingPtr load() const {
        std::lock_guard lock(mutex_);
        return ring_;
    }

    void store(RingPtr ring) {
        std::lock_guard lock(mutex_);
        ring_ = std::move(ring);
    }

private:
    mutable std::mutex mutex_;
    RingPtr ring_;
};

}  // namespace fastbu
