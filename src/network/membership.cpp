#include "fastbu/membership.hpp"
#include "fastbu/logging.hpp"
#include <algorithm>

namespace fastbu {

const char* node_state_string(NodeState state) {
    switch (state) {
        case NodeState::Alive: return "alive";
        case NodeState::Suspect: return "suspect";
        case NodeState::Dead: return "dead";
    }
    return "unknown";
}

// Higher incarnation wins; at equal incarnation the more severe state wins.
// A third-party Alive report at the held incarnation therefore never clears
// Suspect: only the node's own refutation, which bumps its incarnation, does.
bool supersedes(const NodeInfo& incoming, const NodeInfo& current) noexcept {
    if (incoming.incarnation != current.incarnation) {
        return incoming.incarnation > current.incarnation;
    }
    return static_cast<uint32_t>(incoming.state) > static_cast<uint32_t>(current.state);
}

namespace {

bool ring_eligible(const std::optional<NodeState>& state) {
    return state.has_value() && *state != NodeState::Dead;
}

}  // namespace

bool StateChange::affects_ring() const noexcept {
    return ring_eligible(from) != ring_eligible(to);
}

MembershipTable::MembershipTable(NodeInfo self, MembershipOptions opts)
    : self_id_(self.id)
    , opts_(opts)
{
    auto now = Clock::now();
    self.state = NodeState::Alive;
    members_.emplace(self_id_, Member{std::move(self), now, now, false});
}

NodeInfo MembershipTable::self() const {
    std::lock_guard lock(mutex_);
    return members_.at(self_id_).info;
}

uint64_t MembershipTable::self_incarnation() const {
    std::lock_guard lock(mutex_);
    return members_.at(self_id_).info.incarnation;
}

std::vector<NodeInfo> MembershipTable::snapshot() const {
    std::lock_guard lock(mutex_);
    std::vector<NodeInfo> result;
    result.reserve(members_.size());
    for (const auto& [id, m] : members_) {
        result.push_back(m.info);
    }
    std::sort(result.begin(), result.end(),
              [](const NodeInfo& a, const NodeInfo& b) { return a.id < b.id; });
    return result;
}

std::vector<NodeInfo> MembershipTable::ring_members() const {
    std::lock_guard lock(mutex_);
    std::vector<NodeInfo> result;
    for (const auto& [id, m] : members_) {
        if (m.info.state != NodeState::Dead) {
            result.push_back(m.info);
        }
    }
    return result;
}

std::optional<NodeInfo> MembershipTable::find(const std::string& id) const {
    std::lock_guard lock(mutex_);
    auto it = members_.find(id);
    if (it == members_.end()) {
        return std::nullopt;
    }
    return it->second.info;
}

size_t MembershipTable::size() const {
    std::lock_guard lock(mutex_);
    return members_.size();
}

MembershipTable::Counts MembershipTable::counts() const {
    std::lock_guard lock(mutex_);
    Counts c;
    for (const auto& [id, m] : members_) {
        switch (m.info.state) {
            case NodeState::Alive: c.alive++; break;
            case NodeState::Suspect: c.suspect++; break;
            case NodeState::Dead: c.dead++; break;
        }
    }
    return c;
}

void MembershipTable::set_state(Member& m, NodeState state, TimePoint now,
                                std::vector<StateChange>& changes) {
    if (m.info.state == state) {
        return;
    }
    changes.push_back({m.info.id, m.info.state, state, m.info.incarnation});
    m.info.state = state;
    m.state_since = now;
    if (state == NodeState::Alive) {
        m.last_ack = now;
    }
}

std::vector<StateChange> MembershipTable::merge(const std::vector<NodeInfo>& remote,
                                                TimePoint now) {
    std::vector<StateChange> changes;
    std::lock_guard lock(mutex_);

    for (const auto& incoming : remote) {
        if (incoming.id.empty()) {
            continue;
        }

        if (incoming.id == self_id_) {
            auto& me = members_.at(self_id_).info;
            if (incoming.state != NodeState::Alive && incoming.incarnation >= me.incarnation) {
                me.incarnation = incoming.incarnation + 1;
                FASTBU_LOG_INFO("Refuting " << node_state_string(incoming.state)
                                << " report about self, incarnation now " << me.incarnation);
            }
            continue;
        }

        auto it = members_.find(incoming.id);
        if (it == members_.end()) {
            members_.emplace(incoming.id, Member{incoming, now, now, false});
            changes.push_back({incoming.id, std::nullopt, incoming.state, incoming.incarnation});
            continue;
        }

        auto& m = it->second;
        if (!supersedes(incoming, m.info)) {
            continue;
        }

        bool newer = incoming.incarnation > m.info.incarnation;
        NodeState target = incoming.state;

        m.info.host = incoming.host;
        m.info.port = incoming.port;
        m.info.api_port = incoming.api_port;
        m.info.metadata = incoming.metadata;
        m.info.incarnation = incoming.incarnation;
        set_state(m, target, now, changes);

        if (newer && target == NodeState::Alive) {
            m.last_ack = now;
        }
    }

    return changes;
}

std::vector<StateChange> MembershipTable::record_ack(const std::string& id, TimePoint now) {
    std::vector<StateChange> changes;
    std::lock_guard lock(mutex_);

    auto it = members_.find(id);
    if (it == members_.end() || id == self_id_) {
        return changes;
    }

    auto& m = it->second;
    if (m.info.state == NodeState::Dead) {
        // Only a strictly higher incarnation revives a Dead node
        return changes;
    }

    m.last_ack = now;
    if (m.info.state == NodeState::Suspect) {
        set_state(m, NodeState::Alive, now, changes);
    }
    return changes;
}

std::vector<StateChange> MembershipTable::check_timeouts(TimePoint now) {
    std::vector<StateChange> changes;
    std::lock_guard lock(mutex_);

    for (auto it = members_.begin(); it != members_.end(); ) {
        auto& m = it->second;
        if (it->first == self_id_) {
            ++it;
            continue;
        }

        switch (m.info.state) {
            case NodeState::Alive:
                if (now - m.last_ack > opts_.node_timeout) {
                    set_state(m, NodeState::Suspect, now, changes);
                }
                break;
            case NodeState::Suspect:
                if (now - m.state_since > opts_.suspect_timeout) {
                    set_state(m, NodeState::Dead, now, changes);
                }
                break;
            case NodeState::Dead:
                if (opts_.dead_node_retention.count() > 0 &&
                    now - m.state_since > opts_.dead_node_retention) {
                    changes.push_back({m.info.id, NodeState::Dead, std::nullopt,
                                       m.info.incarnation});
                    it = members_.erase(it);
                    continue;
                }
                break;
        }
        ++it;
    }

    return changes;
}

std::vector<NodeInfo> MembershipTable::select_probe_targets(size_t count, std::mt19937_64& rng) {
    std::lock_guard lock(mutex_);

    std::vector<Member*> candidates;
    for (auto& [id, m] : members_) {
        if (id != self_id_ && m.info.state != NodeState::Dead && !m.probe_in_flight) {
            candidates.push_back(&m);
        }
    }

    // Sort first so the shuffle depends only on the rng
    std::sort(candidates.begin(), candidates.end(),
              [](const Member* a, const Member* b) { return a->info.id < b->info.id; });
    std::shuffle(candidates.begin(), candidates.end(), rng);

    std::vector<NodeInfo> result;
    for (size_t i = 0; i < candidates.size() && result.size() < count; ++i) {
        candidates[i]->probe_in_flight = true;
        result.push_back(candidates[i]->info);
    }
    return result;
}

std::optional<NodeInfo> MembershipTable::select_dead_target(std::mt19937_64& rng) {
    std::lock_guard lock(mutex_);

    std::vector<Member*> candidates;
    for (auto& [id, m] : members_) {
        if (m.info.state == NodeState::Dead && !m.probe_in_flight) {
            candidates.push_back(&m);
        }
    }
    if (candidates.empty()) {
        return std::nullopt;
    }

    std::sort(candidates.begin(), candidates.end(),
              [](const Member* a, const Member* b) { return a->info.id < b->info.id; });
    std::uniform_int_distribution<size_t> dist(0, candidates.size() - 1);
    auto* chosen = candidates[dist(rng)];
    chosen->probe_in_flight = true;
    return chosen->info;
}

void MembershipTable::probe_finished(const std::string& id) {
    std::lock_guard lock(mutex_);
    auto it = members_.find(id);
    if (it != members_.end()) {
        it->second.probe_in_flight = false;
    }
}

}  // namespace fastbu
