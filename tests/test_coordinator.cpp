#include <catch2/catch_test_macros.hpp>
#include "fastbu/coordinator.hpp"
#include "fastbu/config.hpp"
#include <elio/io/io_context.hpp>
#include <elio/runtime/scheduler.hpp>
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <random>

using namespace fastbu;

// Helper to create a temp directory
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("fastbu_coord_test_" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

namespace {

Config make_config(const std::filesystem::path& dir) {
    Config config;
    config.node.id = "self";
    config.node.port = 7946;
    config.node.api_port = 3031;
    config.storage.path = dir / "store";
    config.storage.sync_writes = false;
    return config;
}

NodeInfo peer(const std::string& id, uint16_t port, uint16_t api_port) {
    NodeInfo n;
    n.id = id;
    n.host = "127.0.0.2";
    n.port = port;
    n.api_port = api_port;
    n.incarnation = 1;
    return n;
}

ByteBuffer bytes(const std::string& s) {
    return ByteBuffer(s.begin(), s.end());
}

// First key of the form "key-<n>" whose owner satisfies `want_local`
CacheKey find_key(const RequestCoordinator& coordinator, bool want_local) {
    for (int i = 0; i < 10000; ++i) {
        CacheKey key("key-" + std::to_string(i));
        if (coordinator.decide(key).is_local() == want_local) {
            return key;
        }
    }
    FAIL("No suitable key found");
    return CacheKey();
}

// Drive one coordinator operation to completion on a scheduler
template <typename Make>
CoordinatorResult run_operation(elio::runtime::scheduler& sched, Make make) {
    auto done = std::make_shared<std::promise<CoordinatorResult>>();
    auto future = done->get_future();
    auto runner = [](Make make, std::shared_ptr<std::promise<CoordinatorResult>> done)
        -> elio::coro::task<void> {
        done->set_value(co_await make());
    };
    auto task = runner(std::move(make), done);
    sched.spawn(task.release());
    REQUIRE(future.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    return future.get();
}

}  // namespace

TEST_CASE("Single node routes everything locally", "[coordinator]") {
    TempDir tmp;
    elio::io::io_context io_ctx;
    auto config = make_config(tmp.path());

    CacheEngine engine(config.storage);
    REQUIRE(engine.start().ok());
    Cluster cluster(config, io_ctx);
    RequestCoordinator coordinator(engine, cluster, config.cluster);

    REQUIRE(cluster.ring()->node_count() == 1);
    for (int i = 0; i < 100; ++i) {
        auto decision = coordinator.decide(CacheKey("key-" + std::to_string(i)));
        REQUIRE(decision.is_local());
        REQUIRE(decision.owner.id == "self");
    }
}

TEST_CASE("Forwarded requests", "[coordinator]") {
    TempDir tmp;
    elio::io::io_context io_ctx;
    auto config = make_config(tmp.path());

    CacheEngine engine(config.storage);
    REQUIRE(engine.start().ok());
    Cluster cluster(config, io_ctx);
    RequestCoordinator coordinator(engine, cluster, config.cluster);

    auto now = Clock::now();
    cluster.apply_changes(cluster.membership().merge(
        {peer("peer-a", 7947, 3032), peer("peer-b", 7948, 3033)}, now));
    REQUIRE(cluster.ring()->node_count() == 3);

    SECTION("Keys owned elsewhere are answered Misrouted with the owner") {
        auto key = find_key(coordinator, false);
        auto owner = coordinator.route(key);
        REQUIRE(owner.id != "self");

        protocol::GetMessage get;
        get.key = key;
        auto reply = coordinator.serve_forwarded(get);
        auto& resp = std::get<protocol::GetResponseMessage>(reply);
        REQUIRE(resp.code == ErrorCode::Misrouted);
        REQUIRE(resp.owner == owner.api_address());

        protocol::SetMessage set;
        set.key = key;
        set.value = bytes("never stored");
        auto set_reply = coordinator.serve_forwarded(set);
        REQUIRE(std::get<protocol::SetResponseMessage>(set_reply).code == ErrorCode::Misrouted);

        // One hop only: nothing was written locally
        REQUIRE(engine.get(key).is_miss());
        REQUIRE(coordinator.stats().misrouted == 2);
    }

    SECTION("Local keys are served for peers") {
        auto key = find_key(coordinator, true);

        protocol::SetMessage set;
        set.key = key;
        set.value = bytes("from a peer");
        auto set_reply = coordinator.serve_forwarded(set);
        REQUIRE(std::get<protocol::SetResponseMessage>(set_reply).code == ErrorCode::Ok);

        protocol::GetMessage get;
        get.key = key;
        auto reply = coordinator.serve_forwarded(get);
        auto& resp = std::get<protocol::GetResponseMessage>(reply);
        REQUIRE(resp.code == ErrorCode::Ok);
        REQUIRE(resp.found);
        REQUIRE(resp.value == bytes("from a peer"));
        REQUIRE(resp.metadata);

        protocol::DeleteMessage del;
        del.key = key;
        auto del_reply = coordinator.serve_forwarded(del);
        REQUIRE(std::get<protocol::DeleteResponseMessage>(del_reply).code == ErrorCode::Ok);

        // Deleting again reports the key as absent
        auto again = coordinator.serve_forwarded(del);
        REQUIRE(std::get<protocol::DeleteResponseMessage>(again).code == ErrorCode::NotFound);

        REQUIRE(coordinator.stats().served_for_peers == 4);
    }

    SECTION("Local miss is not an error") {
        protocol::GetMessage get;
        get.key = find_key(coordinator, true);
        auto reply = coordinator.serve_forwarded(get);
        auto& resp = std::get<protocol::GetResponseMessage>(reply);
        REQUIRE(resp.code == ErrorCode::Ok);
        REQUIRE(!resp.found);
    }

    SECTION("Non-cache messages are rejected") {
        auto reply = coordinator.serve_forwarded(protocol::PingMessage{});
        REQUIRE(std::get<protocol::ErrorMessage>(reply).code == ErrorCode::InvalidArgument);
    }

    SECTION("Dead owners leave the ring") {
        auto key = find_key(coordinator, false);
        auto owner = coordinator.route(key);

        auto dead = *cluster.membership().find(owner.id);
        dead.state = NodeState::Dead;
        cluster.apply_changes(cluster.membership().merge({dead}, Clock::now()));

        REQUIRE(cluster.ring()->node_count() == 2);
        REQUIRE(coordinator.route(key).id != owner.id);
    }
}

TEST_CASE("Join handling", "[coordinator]") {
    TempDir tmp;
    elio::io::io_context io_ctx;
    auto config = make_config(tmp.path());
    Cluster cluster(config, io_ctx);

    SECTION("Accepted join returns the membership") {
        protocol::JoinMessage join;
        join.sender = peer("newcomer", 7950, 3050);

        auto reply = cluster.gossip().handle_join(join);
        auto& ack = std::get<protocol::JoinAckMessage>(reply);
        REQUIRE(ack.accepted);
        REQUIRE(ack.sender.id == "self");
        REQUIRE(ack.members.size() == 2);
        REQUIRE(cluster.ring()->node_count() == 2);
        REQUIRE(cluster.membership().find("newcomer"));
    }

    SECTION("Join without an id is rejected") {
        protocol::JoinMessage join;
        join.sender = peer("", 7950, 3050);

        auto reply = cluster.gossip().handle_join(join);
        auto& ack = std::get<protocol::JoinAckMessage>(reply);
        REQUIRE(!ack.accepted);
        REQUIRE(!ack.reject_reason.empty());
        REQUIRE(cluster.membership().size() == 1);
    }

    SECTION("Join reusing this node's id is rejected") {
        protocol::JoinMessage join;
        join.sender = peer("self", 7999, 3099);

        auto reply = cluster.gossip().handle_join(join);
        auto& ack = std::get<protocol::JoinAckMessage>(reply);
        REQUIRE(!ack.accepted);
        REQUIRE(ack.members.empty());
    }
}

TEST_CASE("Ping handling", "[coordinator]") {
    TempDir tmp;
    elio::io::io_context io_ctx;
    auto config = make_config(tmp.path());
    Cluster cluster(config, io_ctx);

    SECTION("Ping merges membership and acks with self") {
        protocol::PingMessage ping;
        ping.sender = peer("peer-a", 7947, 3032);
        ping.members = {peer("peer-a", 7947, 3032), peer("peer-b", 7948, 3033)};

        auto reply = cluster.gossip().handle_ping(ping);
        auto& ack = std::get<protocol::AckMessage>(reply);
        REQUIRE(ack.sender.id == "self");
        REQUIRE(ack.members.size() == 3);
        REQUIRE(cluster.ring()->node_count() == 3);
    }

    SECTION("Suspicion about self is refuted in the ack") {
        auto before = cluster.membership().self_incarnation();
        auto suspected = cluster.local_node();
        suspected.state = NodeState::Suspect;

        protocol::PingMessage ping;
        ping.sender = peer("peer-a", 7947, 3032);
        ping.members = {suspected};

        auto reply = cluster.gossip().handle_ping(ping);
        auto& ack = std::get<protocol::AckMessage>(reply);
        REQUIRE(ack.sender.incarnation == before + 1);
        REQUIRE(ack.sender.state == NodeState::Alive);
    }
}

TEST_CASE("Client requests are refused while joining", "[coordinator]") {
    TempDir tmp;
    elio::io::io_context io_ctx;
    elio::runtime::scheduler sched(1);
    sched.set_io_context(&io_ctx);
    sched.start();

    auto config = make_config(tmp.path());
    config.cluster.seeds = {"127.0.0.2:7946"};

    CacheEngine engine(config.storage);
    REQUIRE(engine.start().ok());
    Cluster cluster(config, io_ctx);
    RequestCoordinator coordinator(engine, cluster, config.cluster);

    REQUIRE(cluster.gossip().joining());
    CacheKey key("early");

    auto set = run_operation(sched, [&] { return coordinator.set(key, bytes("v")); });
    REQUIRE(set.status.code() == ErrorCode::NetworkError);
    REQUIRE(set.served_by == "self");
    REQUIRE(engine.size() == 0);

    auto get = run_operation(sched, [&] { return coordinator.get(key); });
    REQUIRE(get.status.code() == ErrorCode::NetworkError);

    auto removed = run_operation(sched, [&] { return coordinator.remove(key); });
    REQUIRE(removed.status.code() == ErrorCode::NetworkError);

    auto stats = coordinator.stats();
    REQUIRE(stats.refused_joining == 3);
    REQUIRE(stats.local_requests == 0);

    sched.shutdown();
}

TEST_CASE("Seed lists decide the bootstrap origin", "[coordinator]") {
    TempDir tmp;
    elio::io::io_context io_ctx;
    auto config = make_config(tmp.path());

    SECTION("No seeds") {
        Cluster cluster(config, io_ctx);
        REQUIRE(!cluster.gossip().joining());
    }

    SECTION("Only this node's own address") {
        config.cluster.seeds = {"127.0.0.1:7946"};
        Cluster cluster(config, io_ctx);
        REQUIRE(!cluster.gossip().joining());
    }

    SECTION("A remote seed") {
        config.cluster.seeds = {"127.0.0.1:7946", "10.0.0.9:7946"};
        Cluster cluster(config, io_ctx);
        REQUIRE(cluster.gossip().joining());
    }
}
