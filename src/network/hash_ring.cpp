#include "fastbu/hash_ring.hpp"
#include <algorithm>

namespace fastbu {

uint64_t HashRing::point_hash(std::string_view node_id, size_t replica) {
    std::string point;
    point.reserve(node_id.size() + 8);
    point.append(node_id);
    point.push_back('#');
    point.append(std::to_string(replica));
    return hash64(point);
}

HashRing::HashRing(const std::vector<NodeInfo>& nodes, size_t virtual_nodes)
    : virtual_nodes_(virtual_nodes)
{
    for (const auto& node : nodes) {
        if (node.id.empty() || nodes_.count(node.id)) {
            continue;
        }
        nodes_.emplace(node.id, node);
        for (size_t i = 0; i < virtual_nodes_; ++i) {
            points_.push_back({point_hash(node.id, i), node.id});
        }
    }

    std::sort(points_.begin(), points_.end(),
              [](const VirtualNode& a, const VirtualNode& b) {
                  return a.hash < b.hash || (a.hash == b.hash && a.owner < b.owner);
              });
}

std::optional<NodeInfo> HashRing::owner_of_hash(uint64_t hash) const {
    if (points_.empty()) {
        return std::nullopt;
    }

    auto it = std::lower_bound(points_.begin(), points_.end(), hash,
                               [](const VirtualNode& v, uint64_t h) { return v.hash < h; });
    if (it == points_.end()) {
        it = points_.begin();  // Wrap around
    }

    auto node = nodes_.find(it->owner);
    if (node == nodes_.end()) {
        return std::nullopt;
    }
    return node->second;
}

std::optional<NodeInfo> HashRing::owner(const CacheKey& key) const {
    return owner_of_hash(key.hash());
}

bool HashRing::is_owner(const std::string& node_id, const CacheKey& key) const {
    auto node = owner(key);
    return node && node->id == node_id;
}

std::vector<std::string> HashRing::node_ids() const {
    std::vector<std::string> ids;
    ids.reserve(nodes_.size());
    for (const auto& [id, info] : nodes_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

}  // namespace fastbu
