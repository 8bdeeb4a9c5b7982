#include "fastbu/cluster.hpp"
#include "fastbu/logging.hpp"

namespace fastbu {

GossipProtocol::GossipProtocol(Cluster& cluster, const ClusterConfig& config,
                               elio::io::io_context& io_ctx)
    : cluster_(cluster)
    , config_(config)
    , io_ctx_(io_ctx)
    , rng_(std::random_device{}())
{
    for (const auto& seed : config_.seeds) {
        std::string host;
        uint16_t port = 0;
        if (parse_host_port(seed, host, port) && !is_self_address(host, port)) {
            needs_join_ = true;
        }
    }
}

GossipProtocol::~GossipProtocol() = default;

elio::coro::task<void> GossipProtocol::start(elio::runtime::scheduler& sched) {
    running_ = true;
    sched_ = &sched;

    if (!needs_join_) {
        FASTBU_LOG_INFO("No seeds to join, bootstrapping a new cluster");
        joined_ = true;
    } else {
        FASTBU_LOG_INFO("Joining via " << config_.seeds.size()
                        << " seeds; client requests are refused until a join succeeds");
    }

    // Spawn periodic gossip loop
    auto gossip_task = gossip_loop();
    sched.spawn(gossip_task.release());

    co_return;
}

elio::coro::task<void> GossipProtocol::stop() {
    running_ = false;
    co_return;
}

elio::coro::task<void> GossipProtocol::gossip_loop() {
    // First join attempt right away
    gossip_round();

    while (running_) {
        co_await elio::time::sleep_for(io_ctx_, config_.gossip_interval);

        if (!running_) break;

        gossip_round();
    }
}

void GossipProtocol::gossip_round() {
    rounds_++;
    auto& members = cluster_.membership();

    cluster_.apply_changes(members.check_timeouts(Clock::now()));

    if (!sched_) {
        return;
    }

    // Seeds are retried until a join succeeds, and again whenever every
    // known peer has been declared dead
    if (needs_join_ && (!joined_ || !has_live_peers()) &&
        !join_in_flight_.exchange(true)) {
        auto join_task = join_seeds();
        sched_->spawn(join_task.release());
    }

    std::vector<NodeInfo> targets;
    std::optional<NodeInfo> dead_target;
    {
        std::lock_guard lock(rng_mutex_);
        targets = members.select_probe_targets(config_.probe_fanout, rng_);
        dead_target = members.select_dead_target(rng_);
    }
    if (dead_target) {
        targets.push_back(std::move(*dead_target));
    }

    for (auto& target : targets) {
        auto probe_task = probe(std::move(target));
        sched_->spawn(probe_task.release());
    }
}

elio::coro::task<void> GossipProtocol::probe(NodeInfo target) {
    auto& members = cluster_.membership();

    protocol::PingMessage ping;
    ping.sender = members.self();
    ping.members = members.snapshot();
    probes_sent_++;

    auto rpc = co_await cluster_.request(target.host, target.port, std::move(ping),
                                         config_.node_timeout);

    auto* ack = rpc.response ? std::get_if<protocol::AckMessage>(&*rpc.response) : nullptr;
    if (rpc.status && ack && ack->sender.id == target.id) {
        auto now = Clock::now();
        auto changes = members.merge(ack->members, now);
        auto sender_changes = members.merge({ack->sender}, now);
        changes.insert(changes.end(), sender_changes.begin(), sender_changes.end());
        auto ack_changes = members.record_ack(target.id, now);
        changes.insert(changes.end(), ack_changes.begin(), ack_changes.end());
        cluster_.apply_changes(changes);
    } else {
        probe_failures_++;
        if (!rpc.status) {
            FASTBU_LOG_DEBUG("Probe of " << target.id << " failed: " << rpc.status.to_string());
        } else {
            FASTBU_LOG_WARN("Unexpected probe reply from " << target.cluster_address());
        }
    }

    members.probe_finished(target.id);
}

elio::coro::task<void> GossipProtocol::join_seeds() {
    auto& members = cluster_.membership();

    for (const auto& seed : config_.seeds) {
        if (!running_) break;

        std::string host;
        uint16_t port = 0;
        if (!parse_host_port(seed, host, port) || is_self_address(host, port)) {
            continue;
        }

        protocol::JoinMessage join;
        join.sender = members.self();
        joins_sent_++;

        auto rpc = co_await cluster_.request(host, port, std::move(join), config_.node_timeout);
        if (!rpc.status) {
            FASTBU_LOG_DEBUG("Join via seed " << seed << " failed: " << rpc.status.to_string());
            continue;
        }

        auto* ack = std::get_if<protocol::JoinAckMessage>(&*rpc.response);
        if (!ack) {
            FASTBU_LOG_WARN("Unexpected join reply from seed " << seed);
            continue;
        }
        if (!ack->accepted) {
            FASTBU_LOG_WARN("Seed " << seed << " rejected join: " << ack->reject_reason);
            continue;
        }
        if (ack->sender.id == members.self_id()) {
            continue;  // Seed list points back at this node
        }

        auto now = Clock::now();
        auto changes = members.merge(ack->members, now);
        auto sender_changes = members.merge({ack->sender}, now);
        changes.insert(changes.end(), sender_changes.begin(), sender_changes.end());
        auto ack_changes = members.record_ack(ack->sender.id, now);
        changes.insert(changes.end(), ack_changes.begin(), ack_changes.end());
        cluster_.apply_changes(changes);

        FASTBU_LOG_INFO("Joined cluster via seed " << seed << " (" << ack->sender.id << "), "
                        << members.size() << " known nodes");
        joined_ = true;
        break;
    }

    join_in_flight_ = false;
}

protocol::Message GossipProtocol::handle_join(const protocol::JoinMessage& msg) {
    auto& members = cluster_.membership();
    joins_received_++;

    protocol::JoinAckMessage ack;
    ack.sender = members.self();

    if (msg.sender.id.empty()) {
        ack.accepted = false;
        ack.reject_reason = "Missing node id";
        return ack;
    }
    if (msg.sender.id == members.self_id() &&
        msg.sender.cluster_address() != ack.sender.cluster_address()) {
        ack.accepted = false;
        ack.reject_reason = "Node id " + msg.sender.id + " is already in use";
        FASTBU_LOG_WARN("Rejected join from " << msg.sender.cluster_address()
                        << ": duplicate node id " << msg.sender.id);
        return ack;
    }

    if (msg.sender.id != members.self_id()) {
        auto now = Clock::now();
        auto changes = members.merge({msg.sender}, now);
        auto ack_changes = members.record_ack(msg.sender.id, now);
        changes.insert(changes.end(), ack_changes.begin(), ack_changes.end());
        cluster_.apply_changes(changes);
    }

    ack.accepted = true;
    ack.members = members.snapshot();
    return ack;
}

protocol::Message GossipProtocol::handle_ping(const protocol::PingMessage& msg) {
    auto& members = cluster_.membership();
    auto now = Clock::now();

    // Merge first so a refutation is reflected in the Ack's sender
    auto changes = members.merge(msg.members, now);
    if (!msg.sender.id.empty() && msg.sender.id != members.self_id()) {
        auto sender_changes = members.merge({msg.sender}, now);
        changes.insert(changes.end(), sender_changes.begin(), sender_changes.end());
        // A direct message is as good as an acknowledged probe
        auto ack_changes = members.record_ack(msg.sender.id, now);
        changes.insert(changes.end(), ack_changes.begin(), ack_changes.end());
    }
    cluster_.apply_changes(changes);

    protocol::AckMessage ack;
    ack.sender = members.self();
    ack.members = members.snapshot();
    return ack;
}

GossipProtocol::Stats GossipProtocol::stats() const {
    Stats s;
    s.rounds = rounds_.load();
    s.probes_sent = probes_sent_.load();
    s.probe_failures = probe_failures_.load();
    s.joins_sent = joins_sent_.load();
    s.joins_received = joins_received_.load();
    return s;
}

bool GossipProtocol::is_self_address(const std::string& host, uint16_t port) const {
    const auto& node = cluster_.config().node;
    if (port != node.port) {
        return false;
    }
    return host == node.host || host == "127.0.0.1" || host == "localhost" || host == "0.0.0.0";
}

bool GossipProtocol::has_live_peers() const {
    auto counts = cluster_.membership().counts();
    return counts.alive + counts.suspect > 1;  // Self is always alive
}

}  // namespace fastbu
