#include "fastbu/cluster.hpp"
#include "fastbu/logging.hpp"
#include <algorithm>

namespace fastbu {

namespace {

NodeInfo make_local_node(const Config& config) {
    NodeInfo info;
    info.id = config.node.effective_id();
    info.host = config.node.host;
    info.port = config.node.port;
    info.api_port = config.node.api_port;
    // A restarted node always announces a higher incarnation than before
    info.incarnation = to_unix_millis(SystemClock::now());
    info.state = NodeState::Alive;
    info.metadata = config.node.metadata;
    return info;
}

MembershipOptions make_membership_options(const ClusterConfig& config) {
    MembershipOptions opts;
    opts.node_timeout = config.node_timeout;
    opts.suspect_timeout = config.suspect_timeout;
    opts.dead_node_retention = config.dead_node_retention;
    return opts;
}

int64_t steady_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

// Poll interval while a request is outstanding; grows from the minimum
constexpr std::chrono::milliseconds MIN_POLL_SLICE{1};
constexpr std::chrono::milliseconds MAX_POLL_SLICE{20};

// Shared by a request and the task running its exchange. Whichever side
// marks it finished first owns the outcome.
struct PendingRequest {
    std::mutex mutex;
    bool finished = false;
    std::shared_ptr<Connection> conn;
    RpcResult result;
    bool sent = false;
};

// Connect, send, receive one reply. Runs detached so the caller can give
// up on a connect that never completes.
elio::coro::task<void> run_exchange(elio::io::io_context& io_ctx,
                                    std::shared_ptr<PendingRequest> pending,
                                    std::string host, uint16_t port,
                                    protocol::Message msg, uint32_t request_id) {
    RpcResult result;
    bool sent = false;
    std::string target = host + ":" + std::to_string(port);

    elio::net::ipv4_address addr(host, port);
    auto stream_result = co_await elio::net::tcp_connect(io_ctx, addr);
    if (!stream_result) {
        result.status = Status::error(ErrorCode::NetworkError, "Failed to connect to " + target);
    } else {
        auto conn = std::make_shared<Connection>(std::move(*stream_result), io_ctx);
        bool abandoned = false;
        {
            std::lock_guard lock(pending->mutex);
            abandoned = pending->finished;
            if (!abandoned) {
                pending->conn = conn;
            }
        }

        if (abandoned) {
            result.status = Status::error(ErrorCode::Timeout,
                                          "Connect to " + target + " was abandoned");
        } else {
            auto status = co_await conn->send(msg, request_id);
            if (!status) {
                result.status = Status::error(status.code(), status.message() + " to " + target);
            } else {
                sent = true;
                result.response = co_await conn->receive();
                if (!result.response) {
                    result.status = Status::error(ErrorCode::NetworkError,
                                                  "No response from " + target);
                }
            }
        }
        co_await conn->close();
    }

    std::lock_guard lock(pending->mutex);
    if (!pending->finished) {
        pending->finished = true;
        pending->result = std::move(result);
        pending->sent = sent;
    }
    pending->conn.reset();
}

}  // namespace

// Connection implementation

Connection::Connection(elio::net::tcp_stream stream, elio::io::io_context& io_ctx)
    : stream_(std::move(stream))
    , io_ctx_(io_ctx)
    , last_activity_ms_(steady_millis())
{}

Connection::~Connection() = default;

elio::coro::task<Status> Connection::send(const protocol::Message& msg, uint32_t request_id) {
    auto data = protocol::Codec::encode(msg, request_id);

    co_await send_mutex_.lock();

    size_t sent = 0;
    while (sent < data.size()) {
        auto result = co_await stream_.write(data.data() + sent, data.size() - sent);
        if (result.result <= 0) {
            connected_ = false;
            send_mutex_.unlock();
            co_return Status::error(ErrorCode::NetworkError, "Failed to send message");
        }
        sent += result.result;
    }
    last_activity_ms_ = steady_millis();

    send_mutex_.unlock();
    co_return Status::make_ok();
}

elio::coro::task<std::optional<protocol::Message>> Connection::receive() {
    co_await recv_mutex_.lock();

    // Read header first
    ByteBuffer frame(protocol::MessageHeader::SIZE);
    size_t header_read = 0;

    while (header_read < protocol::MessageHeader::SIZE) {
        auto result = co_await stream_.read(frame.data() + header_read,
                                            protocol::MessageHeader::SIZE - header_read);
        if (result.result <= 0) {
            connected_ = false;
            recv_mutex_.unlock();
            co_return std::nullopt;
        }
        header_read += result.result;
    }

    protocol::MessageHeader header;
    try {
        header = protocol::Codec::parse_header(frame);
    } catch (const std::exception& e) {
        FASTBU_LOG_WARN("Dropping connection from " << peer_address() << ": " << e.what());
        connected_ = false;
        recv_mutex_.unlock();
        co_return std::nullopt;
    }

    // Read body into the same buffer
    frame.resize(protocol::MessageHeader::SIZE + header.length);
    size_t body_read = 0;

    while (body_read < header.length) {
        auto result = co_await stream_.read(frame.data() + protocol::MessageHeader::SIZE + body_read,
                                            header.length - body_read);
        if (result.result <= 0) {
            connected_ = false;
            recv_mutex_.unlock();
            co_return std::nullopt;
        }
        body_read += result.result;
    }

    try {
        auto [msg, hdr] = protocol::Codec::decode(frame);
        last_request_id_ = hdr.request_id;
        last_activity_ms_ = steady_millis();
        recv_mutex_.unlock();
        co_return std::move(msg);
    } catch (const std::exception& e) {
        FASTBU_LOG_WARN("Malformed message from " << peer_address() << ": " << e.what());
        connected_ = false;
        recv_mutex_.unlock();
        co_return std::nullopt;
    }
}

elio::coro::task<void> Connection::close() {
    connected_ = false;
    if (!closed_.exchange(true)) {
        co_await stream_.close();
    }
}

std::string Connection::peer_address() const {
    auto addr = stream_.peer_address();
    if (addr) {
        return addr->to_string();
    }
    return "unknown";
}

std::chrono::milliseconds Connection::idle_for() const {
    return std::chrono::milliseconds(steady_millis() - last_activity_ms_.load());
}

// Cluster implementation

Cluster::Cluster(const Config& config, elio::io::io_context& io_ctx)
    : config_(config)
    , io_ctx_(io_ctx)
    , membership_(make_local_node(config), make_membership_options(config.cluster))
    , gossip_(std::make_unique<GossipProtocol>(*this, config.cluster, io_ctx))
{
    rebuild_ring();
}

Cluster::~Cluster() = default;

elio::coro::task<Status> Cluster::start(elio::runtime::scheduler& sched) {
    sched_ = &sched;

    // Bind TCP listener for incoming cluster connections
    elio::net::ipv4_address listen_addr(config_.node.bind_address, config_.node.port);

    auto listener_result = elio::net::tcp_listener::bind(listen_addr, io_ctx_);
    if (!listener_result) {
        co_return Status::error(ErrorCode::NetworkError,
            "Failed to bind cluster port " + std::to_string(config_.node.port));
    }

    listener_ = std::move(*listener_result);
    running_ = true;

    // Spawn accept loop
    auto accept_task = accept_loop();
    sched.spawn(accept_task.release());

    auto sweep_task = idle_sweep_loop();
    sched.spawn(sweep_task.release());

    FASTBU_LOG_INFO("Cluster port listening on " << config_.node.bind_address << ":"
                    << config_.node.port << " as " << local_id());

    // Start gossip with scheduler for periodic tasks
    co_await gossip_->start(sched);

    co_return Status::make_ok();
}

elio::coro::task<void> Cluster::stop() {
    running_ = false;

    // Close listener
    if (listener_) {
        listener_->close();
    }

    co_await gossip_->stop();
}

void Cluster::apply_changes(const std::vector<StateChange>& changes) {
    bool ring_changed = false;
    for (const auto& change : changes) {
        if (!change.from) {
            FASTBU_LOG_INFO("Discovered node " << change.id << " ("
                            << node_state_string(*change.to) << ", incarnation "
                            << change.incarnation << ")");
        } else if (!change.to) {
            FASTBU_LOG_INFO("Forgot dead node " << change.id);
        } else {
            FASTBU_LOG_INFO("Node " << change.id << ": " << node_state_string(*change.from)
                            << " -> " << node_state_string(*change.to)
                            << " (incarnation " << change.incarnation << ")");
        }
        ring_changed = ring_changed || change.affects_ring();
    }

    if (ring_changed) {
        rebuild_ring();
    }
}

void Cluster::rebuild_ring() {
    auto ring = std::make_shared<const HashRing>(membership_.ring_members(),
                                                 config_.cluster.virtual_nodes);
    FASTBU_LOG_DEBUG("Ring rebuilt: " << ring->node_count() << " nodes, "
                     << ring->size() << " points");
    ring_.store(std::move(ring));
    ring_rebuilds_++;
}

void Cluster::set_forward_handler(ForwardHandler handler) {
    std::lock_guard lock(handler_mutex_);
    forward_handler_ = std::move(handler);
}

elio::coro::task<RpcResult> Cluster::request(const std::string& host, uint16_t port,
                                             protocol::Message msg,
                                             std::chrono::milliseconds timeout) {
    std::string target = host + ":" + std::to_string(port);
    if (!sched_) {
        RpcResult result;
        result.status = Status::error(ErrorCode::InternalError,
                                      "Cluster is not started; cannot reach " + target);
        co_return result;
    }

    auto pending = std::make_shared<PendingRequest>();
    auto exchange = run_exchange(io_ctx_, pending, host, port, std::move(msg),
                                 next_request_id_++);
    sched_->spawn(exchange.release());

    auto deadline = std::chrono::steady_clock::now() + timeout;
    auto slice = MIN_POLL_SLICE;
    while (true) {
        {
            std::lock_guard lock(pending->mutex);
            if (pending->finished) {
                break;
            }
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        co_await elio::time::sleep_for(io_ctx_, std::clamp(remaining, MIN_POLL_SLICE, slice));
        slice = std::min(slice * 2, MAX_POLL_SLICE);
    }

    RpcResult result;
    bool sent = false;
    std::shared_ptr<Connection> abandoned;
    {
        std::lock_guard lock(pending->mutex);
        if (pending->finished) {
            result = std::move(pending->result);
            sent = pending->sent;
        } else {
            pending->finished = true;
            abandoned = std::move(pending->conn);
            result.status = Status::error(ErrorCode::Timeout,
                                          "Request to " + target + " timed out");
        }
    }

    if (abandoned) {
        // Wakes the exchange blocked in receive
        co_await abandoned->close();
    }

    if (sent) {
        messages_sent_++;
    }
    if (result.status.code() == ErrorCode::Timeout) {
        request_timeouts_++;
    } else if (!result.status) {
        request_failures_++;
    } else {
        messages_received_++;
    }
    co_return result;
}

Cluster::Stats Cluster::stats() const {
    Stats s;
    auto counts = membership_.counts();
    s.total_nodes = counts.alive + counts.suspect + counts.dead;
    s.alive_nodes = counts.alive;
    s.suspect_nodes = counts.suspect;
    s.dead_nodes = counts.dead;

    auto ring = ring_.load();
    s.ring_nodes = ring->node_count();
    s.ring_points = ring->size();

    s.messages_sent = messages_sent_.load();
    s.messages_received = messages_received_.load();
    s.request_failures = request_failures_.load();
    s.request_timeouts = request_timeouts_.load();
    s.ring_rebuilds = ring_rebuilds_.load();
    s.idle_closes = idle_closes_.load();
    {
        std::lock_guard lock(inbound_mutex_);
        s.inbound_connections = inbound_.size();
    }
    return s;
}

elio::coro::task<void> Cluster::accept_loop() {
    while (running_ && listener_) {
        auto stream_result = co_await listener_->accept();
        if (!stream_result) {
            continue;
        }

        auto conn = std::make_shared<Connection>(std::move(*stream_result), io_ctx_);

        // Spawn handler for this connection
        if (sched_) {
            auto handler = handle_connection(conn);
            sched_->spawn(handler.release());
        }
    }
}

elio::coro::task<void> Cluster::idle_sweep_loop() {
    auto idle_limit = config_.cluster.node_timeout;
    while (running_) {
        co_await elio::time::sleep_for(io_ctx_, config_.cluster.gossip_interval);

        std::vector<std::shared_ptr<Connection>> idle;
        {
            std::lock_guard lock(inbound_mutex_);
            for (const auto& [key, weak] : inbound_) {
                auto conn = weak.lock();
                if (conn && conn->is_connected() && conn->idle_for() > idle_limit) {
                    idle.push_back(std::move(conn));
                }
            }
        }

        for (auto& conn : idle) {
            FASTBU_LOG_DEBUG("Closing idle cluster connection from " << conn->peer_address());
            idle_closes_++;
            co_await conn->close();
        }
    }
}

elio::coro::task<void> Cluster::handle_connection(std::shared_ptr<Connection> conn) {
    {
        std::lock_guard lock(inbound_mutex_);
        inbound_.emplace(conn.get(), conn);
    }

    while (running_ && conn->is_connected()) {
        auto msg = co_await conn->receive();
        if (!msg) {
            break;
        }
        messages_received_++;

        uint32_t request_id = conn->last_request_id();
        auto reply = co_await dispatch(std::move(*msg), request_id);

        auto status = co_await conn->send(reply, request_id);
        if (!status) {
            FASTBU_LOG_DEBUG("Reply to " << conn->peer_address() << " failed: "
                             << status.to_string());
            break;
        }
        messages_sent_++;
    }

    {
        std::lock_guard lock(inbound_mutex_);
        inbound_.erase(conn.get());
    }
    co_await conn->close();
}

elio::coro::task<protocol::Message> Cluster::dispatch(protocol::Message msg, uint32_t request_id) {
    if (auto* join = std::get_if<protocol::JoinMessage>(&msg)) {
        co_return gossip_->handle_join(*join);
    }
    if (auto* ping = std::get_if<protocol::PingMessage>(&msg)) {
        co_return gossip_->handle_ping(*ping);
    }

    auto type = protocol::message_type(msg);
    if (type == protocol::MessageType::Get ||
        type == protocol::MessageType::Set ||
        type == protocol::MessageType::Delete) {
        ForwardHandler handler;
        {
            std::lock_guard lock(handler_mutex_);
            handler = forward_handler_;
        }
        if (handler) {
            co_return co_await handler(std::move(msg));
        }
        co_return protocol::ErrorMessage{ErrorCode::InternalError,
                                         "Node is not serving requests", request_id};
    }

    co_return protocol::ErrorMessage{ErrorCode::InvalidArgument,
                                     "Unexpected message type", request_id};
}

}  // namespace fastbu
