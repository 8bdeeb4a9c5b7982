#include "fastbu/coordinator.hpp"
#include "fastbu/logging.hpp"

namespace fastbu {

RequestCoordinator::RequestCoordinator(CacheEngine& engine, Cluster& cluster,
                                       const ClusterConfig& config)
    : engine_(engine)
    , cluster_(cluster)
    , config_(config)
{}

NodeInfo RequestCoordinator::route(const CacheKey& key) const {
    auto ring = cluster_.ring();
    auto owner = ring->owner(key);
    if (!owner) {
        // The ring always contains the local node once built
        return cluster_.local_node();
    }
    return *owner;
}

RouteDecision RequestCoordinator::decide(const CacheKey& key) const {
    RouteDecision decision;
    decision.owner = route(key);
    decision.target = decision.owner.id == cluster_.local_id()
        ? RouteDecision::Local
        : RouteDecision::Remote;
    return decision;
}

bool RequestCoordinator::refuse_while_joining(CoordinatorResult& result) {
    if (!cluster_.gossip().joining()) {
        return false;
    }
    refused_joining_++;
    result.served_by = cluster_.local_id();
    result.status = Status::error(ErrorCode::NetworkError, "Joining cluster");
    return true;
}

CoordinatorResult RequestCoordinator::local_get(const CacheKey& key) {
    CoordinatorResult result;
    result.served_by = cluster_.local_id();

    auto read = engine_.get(key);
    if (read.is_hit()) {
        result.found = true;
        result.value = std::move(read.data);
        result.metadata = read.metadata;
    } else if (read.result == CacheResult::Error) {
        result.status = read.status;
    }
    return result;
}

CoordinatorResult RequestCoordinator::local_set(const CacheKey& key, ByteView value) {
    CoordinatorResult result;
    result.served_by = cluster_.local_id();
    result.status = engine_.set(key, value);
    return result;
}

CoordinatorResult RequestCoordinator::local_remove(const CacheKey& key) {
    CoordinatorResult result;
    result.served_by = cluster_.local_id();
    result.status = engine_.remove(key, &result.found);
    return result;
}

CoordinatorResult RequestCoordinator::relay_failure(const RpcResult& rpc, const NodeInfo& owner) {
    CoordinatorResult result;
    result.forwarded = true;
    result.owner_api = owner.api_address();
    forward_failures_++;

    if (!rpc.status) {
        result.status = rpc.status;
    } else if (rpc.response) {
        if (auto* err = std::get_if<protocol::ErrorMessage>(&*rpc.response)) {
            result.status = Status::error(err->code, err->message);
        } else {
            result.status = Status::error(ErrorCode::InternalError,
                "Unexpected reply from " + owner.id);
        }
    } else {
        result.status = Status::error(ErrorCode::NetworkError, "No reply from " + owner.id);
    }

    FASTBU_LOG_WARN("Forward to " << owner.id << " failed: " << result.status.to_string());
    return result;
}

CoordinatorResult RequestCoordinator::relay_status(ErrorCode code, const std::string& message,
                                                   const std::string& owner_hint,
                                                   const NodeInfo& owner) {
    CoordinatorResult result;
    result.forwarded = true;
    result.served_by = owner.id;
    result.owner_api = owner.api_address();

    if (code == ErrorCode::Misrouted) {
        // The owner's ring disagrees with ours; let the client retry there
        misrouted_++;
        if (!owner_hint.empty()) {
            result.owner_api = owner_hint;
        }
        FASTBU_LOG_INFO("Request misrouted to " << owner.id << ", it points at "
                        << result.owner_api);
    }
    if (code != ErrorCode::Ok) {
        result.status = Status::error(code, message);
    }
    return result;
}

elio::coro::task<CoordinatorResult> RequestCoordinator::get(const CacheKey& key) {
    CoordinatorResult refused;
    if (refuse_while_joining(refused)) {
        co_return refused;
    }

    auto decision = decide(key);
    if (decision.is_local()) {
        local_requests_++;
        co_return local_get(key);
    }

    forwarded_requests_++;
    protocol::GetMessage msg;
    msg.key = key;
    auto rpc = co_await cluster_.request(decision.owner.host, decision.owner.port,
                                         std::move(msg), config_.request_timeout);

    auto* resp = rpc.response ? std::get_if<protocol::GetResponseMessage>(&*rpc.response) : nullptr;
    if (!rpc.status || !resp) {
        co_return relay_failure(rpc, decision.owner);
    }

    auto result = relay_status(resp->code, resp->message, resp->owner, decision.owner);
    if (result.status) {
        result.found = resp->found;
        result.value = std::move(resp->value);
        result.metadata = resp->metadata;
    }
    co_return result;
}

elio::coro::task<CoordinatorResult> RequestCoordinator::set(const CacheKey& key, ByteBuffer value) {
    CoordinatorResult refused;
    if (refuse_while_joining(refused)) {
        co_return refused;
    }

    auto decision = decide(key);
    if (decision.is_local()) {
        local_requests_++;
        co_return local_set(key, value);
    }

    forwarded_requests_++;
    protocol::SetMessage msg;
    msg.key = key;
    msg.value = std::move(value);
    auto rpc = co_await cluster_.request(decision.owner.host, decision.owner.port,
                                         std::move(msg), config_.request_timeout);

    auto* resp = rpc.response ? std::get_if<protocol::SetResponseMessage>(&*rpc.response) : nullptr;
    if (!rpc.status || !resp) {
        co_return relay_failure(rpc, decision.owner);
    }
    co_return relay_status(resp->code, resp->message, resp->owner, decision.owner);
}

elio::coro::task<CoordinatorResult> RequestCoordinator::remove(const CacheKey& key) {
    CoordinatorResult refused;
    if (refuse_while_joining(refused)) {
        co_return refused;
    }

    auto decision = decide(key);
    if (decision.is_local()) {
        local_requests_++;
        co_return local_remove(key);
    }

    forwarded_requests_++;
    protocol::DeleteMessage msg;
    msg.key = key;
    auto rpc = co_await cluster_.request(decision.owner.host, decision.owner.port,
                                         std::move(msg), config_.request_timeout);

    auto* resp = rpc.response ? std::get_if<protocol::DeleteResponseMessage>(&*rpc.response) : nullptr;
    if (!rpc.status || !resp) {
        co_return relay_failure(rpc, decision.owner);
    }

    auto result = relay_status(resp->code, resp->message, resp->owner, decision.owner);
    // NotFound on a delete is a successful "did not exist"
    if (result.status.code() == ErrorCode::NotFound) {
        result.status = Status::make_ok();
        result.found = false;
    } else if (result.status) {
        result.found = true;
    }
    co_return result;
}

elio::coro::task<protocol::Message> RequestCoordinator::handle_forwarded(protocol::Message msg) {
    co_return serve_forwarded(msg);
}

protocol::Message RequestCoordinator::serve_forwarded(const protocol::Message& msg) {
    if (auto* get = std::get_if<protocol::GetMessage>(&msg)) {
        protocol::GetResponseMessage resp;
        auto decision = decide(get->key);
        if (!decision.is_local()) {
            misrouted_++;
            resp.code = ErrorCode::Misrouted;
            resp.message = "Key is owned by " + decision.owner.id;
            resp.owner = decision.owner.api_address();
            return resp;
        }

        served_for_peers_++;
        auto result = local_get(get->key);
        resp.code = result.status.code();
        resp.message = result.status.message();
        resp.found = result.found;
        resp.value = std::move(result.value);
        resp.metadata = result.metadata;
        return resp;
    }

    if (auto* set = std::get_if<protocol::SetMessage>(&msg)) {
        protocol::SetResponseMessage resp;
        auto decision = decide(set->key);
        if (!decision.is_local()) {
            misrouted_++;
            resp.code = ErrorCode::Misrouted;
            resp.message = "Key is owned by " + decision.owner.id;
            resp.owner = decision.owner.api_address();
            return resp;
        }

        served_for_peers_++;
        auto result = local_set(set->key, set->value);
        resp.code = result.status.code();
        resp.message = result.status.message();
        return resp;
    }

    if (auto* del = std::get_if<protocol::DeleteMessage>(&msg)) {
        protocol::DeleteResponseMessage resp;
        auto decision = decide(del->key);
        if (!decision.is_local()) {
            misrouted_++;
            resp.code = ErrorCode::Misrouted;
            resp.message = "Key is owned by " + decision.owner.id;
            resp.owner = decision.owner.api_address();
            return resp;
        }

        served_for_peers_++;
        auto result = local_remove(del->key);
        if (result.status && !result.found) {
            resp.code = ErrorCode::NotFound;
        } else {
            resp.code = result.status.code();
            resp.message = result.status.message();
        }
        return resp;
    }

    return protocol::ErrorMessage{ErrorCode::InvalidArgument, "Not a cache operation", 0};
}

RequestCoordinator::Stats RequestCoordinator::stats() const {
    Stats s;
    s.local_requests = local_requests_.load();
    s.forwarded_requests = forwarded_requests_.load();
    s.forward_failures = forward_failures_.load();
    s.misrouted = misrouted_.load();
    s.served_for_peers = served_for_peers_.load();
    s.refused_joining = refused_joining_.load();
    return s;
}

}  // namespace fastbu
