#include <catch2/catch_test_macros.hpp>
#include "fastbu/membership.hpp"
#include <algorithm>
#include <set>

using namespace fastbu;
using namespace std::chrono_literals;

namespace {

NodeInfo node(const std::string& id, uint64_t incarnation = 1,
              NodeState state = NodeState::Alive) {
    NodeInfo n;
    n.id = id;
    n.host = "127.0.0.1";
    n.port = 7000;
    n.api_port = 3000;
    n.incarnation = incarnation;
    n.state = state;
    return n;
}

MembershipOptions options() {
    MembershipOptions opts;
    opts.node_timeout = 10s;
    opts.suspect_timeout = 5s;
    opts.dead_node_retention = 0s;
    return opts;
}

NodeState state_of(const MembershipTable& table, const std::string& id) {
    return table.find(id)->state;
}

}  // namespace

TEST_CASE("Incarnation rule", "[membership]") {
    SECTION("Higher incarnation wins regardless of state") {
        REQUIRE(supersedes(node("a", 2, NodeState::Alive), node("a", 1, NodeState::Dead)));
        REQUIRE(!supersedes(node("a", 1, NodeState::Dead), node("a", 2, NodeState::Alive)));
    }

    SECTION("Equal incarnation: more severe state wins") {
        REQUIRE(supersedes(node("a", 3, NodeState::Suspect), node("a", 3, NodeState::Alive)));
        REQUIRE(supersedes(node("a", 3, NodeState::Dead), node("a", 3, NodeState::Suspect)));
        REQUIRE(!supersedes(node("a", 3, NodeState::Alive), node("a", 3, NodeState::Suspect)));
        REQUIRE(!supersedes(node("a", 3, NodeState::Alive), node("a", 3, NodeState::Alive)));
    }
}

TEST_CASE("Membership table basics", "[membership]") {
    MembershipTable table(node("self", 100), options());

    REQUIRE(table.size() == 1);
    REQUIRE(table.self_id() == "self");
    REQUIRE(table.self().state == NodeState::Alive);
    REQUIRE(table.self_incarnation() == 100);
    REQUIRE(table.ring_members().size() == 1);

    auto now = Clock::now();
    auto changes = table.merge({node("b"), node("a")}, now);
    REQUIRE(changes.size() == 2);
    REQUIRE(!changes[0].from);
    REQUIRE(changes[0].affects_ring());

    auto snap = table.snapshot();
    REQUIRE(snap.size() == 3);
    REQUIRE(snap[0].id == "a");  // Sorted by id
    REQUIRE(snap[2].id == "self");

    auto counts = table.counts();
    REQUIRE(counts.alive == 3);
    REQUIRE(counts.suspect == 0);
    REQUIRE(counts.dead == 0);

    SECTION("Entries without id are ignored") {
        REQUIRE(table.merge({node("")}, now).empty());
        REQUIRE(table.size() == 3);
    }

    SECTION("Repeating the same report changes nothing") {
        REQUIRE(table.merge({node("a")}, now).empty());
    }
}

TEST_CASE("Failure detector timeouts", "[membership]") {
    MembershipTable table(node("self"), options());
    auto t0 = Clock::now();
    table.merge({node("peer")}, t0);

    SECTION("Alive stays Alive within node_timeout") {
        REQUIRE(table.check_timeouts(t0 + 9s).empty());
        REQUIRE(state_of(table, "peer") == NodeState::Alive);
    }

    SECTION("Alive -> Suspect -> Dead") {
        auto changes = table.check_timeouts(t0 + 11s);
        REQUIRE(changes.size() == 1);
        REQUIRE(*changes[0].from == NodeState::Alive);
        REQUIRE(*changes[0].to == NodeState::Suspect);
        // Suspect nodes keep their ring position
        REQUIRE(!changes[0].affects_ring());
        REQUIRE(table.ring_members().size() == 2);

        REQUIRE(table.check_timeouts(t0 + 15s).empty());

        changes = table.check_timeouts(t0 + 17s);
        REQUIRE(changes.size() == 1);
        REQUIRE(*changes[0].to == NodeState::Dead);
        REQUIRE(changes[0].affects_ring());
        REQUIRE(table.ring_members().size() == 1);
        REQUIRE(table.counts().dead == 1);
    }

    SECTION("Acks keep a node Alive") {
        table.record_ack("peer", t0 + 8s);
        REQUIRE(table.check_timeouts(t0 + 15s).empty());
        REQUIRE(state_of(table, "peer") == NodeState::Alive);
    }

    SECTION("An ack revives a Suspect node") {
        table.check_timeouts(t0 + 11s);
        REQUIRE(state_of(table, "peer") == NodeState::Suspect);

        auto changes = table.record_ack("peer", t0 + 12s);
        REQUIRE(changes.size() == 1);
        REQUIRE(*changes[0].to == NodeState::Alive);
        REQUIRE(state_of(table, "peer") == NodeState::Alive);
    }

    SECTION("An ack does not revive a Dead node") {
        table.check_timeouts(t0 + 11s);
        table.check_timeouts(t0 + 17s);
        REQUIRE(table.record_ack("peer", t0 + 18s).empty());
        REQUIRE(state_of(table, "peer") == NodeState::Dead);

        // A higher incarnation does
        auto changes = table.merge({node("peer", 2)}, t0 + 19s);
        REQUIRE(changes.size() == 1);
        REQUIRE(*changes[0].to == NodeState::Alive);
        REQUIRE(changes[0].affects_ring());

        // And the revived node gets a fresh node_timeout
        REQUIRE(table.check_timeouts(t0 + 25s).empty());
    }

    SECTION("Self never times out") {
        table.check_timeouts(t0 + 1h);
        REQUIRE(table.self().state == NodeState::Alive);
    }
}

TEST_CASE("Dead node retention", "[membership]") {
    auto opts = options();

    SECTION("Zero retention keeps Dead nodes forever") {
        MembershipTable table(node("self"), opts);
        auto t0 = Clock::now();
        table.merge({node("peer", 1, NodeState::Dead)}, t0);
        REQUIRE(table.check_timeouts(t0 + 24h).empty());
        REQUIRE(table.find("peer"));
    }

    SECTION("Dead nodes are forgotten after retention") {
        opts.dead_node_retention = 60s;
        MembershipTable table(node("self"), opts);
        auto t0 = Clock::now();
        table.merge({node("peer", 1, NodeState::Dead)}, t0);

        REQUIRE(table.check_timeouts(t0 + 30s).empty());
        auto changes = table.check_timeouts(t0 + 61s);
        REQUIRE(changes.size() == 1);
        REQUIRE(!changes[0].to);
        REQUIRE(!changes[0].affects_ring());
        REQUIRE(!table.find("peer"));
    }
}

TEST_CASE("Gossip merge", "[membership]") {
    MembershipTable table(node("self", 10), options());
    auto t0 = Clock::now();
    table.merge({node("peer", 5)}, t0);

    SECTION("Stale reports are ignored") {
        REQUIRE(table.merge({node("peer", 4, NodeState::Dead)}, t0).empty());
        REQUIRE(state_of(table, "peer") == NodeState::Alive);
    }

    SECTION("Third-party suspicion at the same incarnation is adopted") {
        auto changes = table.merge({node("peer", 5, NodeState::Suspect)}, t0);
        REQUIRE(changes.size() == 1);
        REQUIRE(state_of(table, "peer") == NodeState::Suspect);
    }

    SECTION("Alive at the same incarnation does not clear suspicion") {
        table.merge({node("peer", 5, NodeState::Suspect)}, t0);
        REQUIRE(table.merge({node("peer", 5, NodeState::Alive)}, t0).empty());
        REQUIRE(state_of(table, "peer") == NodeState::Suspect);
    }

    SECTION("Refutation by the node itself clears suspicion") {
        table.merge({node("peer", 5, NodeState::Suspect)}, t0);
        table.merge({node("peer", 6, NodeState::Alive)}, t0);
        REQUIRE(state_of(table, "peer") == NodeState::Alive);
        REQUIRE(table.find("peer")->incarnation == 6);
    }

    SECTION("Newer incarnation updates addresses and metadata") {
        auto moved = node("peer", 7);
        moved.host = "10.1.1.1";
        moved.api_port = 4000;
        moved.metadata["zone"] = "b";
        table.merge({moved}, t0);

        auto found = table.find("peer");
        REQUIRE(found->host == "10.1.1.1");
        REQUIRE(found->api_port == 4000);
        REQUIRE(found->metadata.at("zone") == "b");
    }
}

TEST_CASE("Refuting reports about self", "[membership]") {
    MembershipTable table(node("self", 10), options());
    auto t0 = Clock::now();

    SECTION("Suspect at current incarnation raises it") {
        REQUIRE(table.merge({node("self", 10, NodeState::Suspect)}, t0).empty());
        REQUIRE(table.self_incarnation() == 11);
        REQUIRE(table.self().state == NodeState::Alive);
    }

    SECTION("Dead at a higher incarnation raises above it") {
        table.merge({node("self", 42, NodeState::Dead)}, t0);
        REQUIRE(table.self_incarnation() == 43);
    }

    SECTION("Stale suspicion is ignored") {
        table.merge({node("self", 9, NodeState::Suspect)}, t0);
        REQUIRE(table.self_incarnation() == 10);
    }

    SECTION("Alive reports about self change nothing") {
        table.merge({node("self", 50, NodeState::Alive)}, t0);
        REQUIRE(table.self_incarnation() == 10);
    }

    SECTION("Refuted self wins over the suspicion elsewhere") {
        table.merge({node("self", 10, NodeState::Suspect)}, t0);
        REQUIRE(supersedes(table.self(), node("self", 10, NodeState::Suspect)));
    }
}

TEST_CASE("Probe target selection", "[membership]") {
    MembershipTable table(node("self"), options());
    auto t0 = Clock::now();
    table.merge({node("a"), node("b"), node("c"), node("d", 1, NodeState::Dead)}, t0);
    std::mt19937_64 rng(42);

    SECTION("Never self, never Dead, at most count") {
        auto targets = table.select_probe_targets(2, rng);
        REQUIRE(targets.size() == 2);
        for (const auto& t : targets) {
            REQUIRE(t.id != "self");
            REQUIRE(t.id != "d");
        }
    }

    SECTION("In-flight peers are skipped until finished") {
        auto first = table.select_probe_targets(3, rng);
        REQUIRE(first.size() == 3);
        REQUIRE(table.select_probe_targets(3, rng).empty());

        table.probe_finished(first[0].id);
        auto again = table.select_probe_targets(3, rng);
        REQUIRE(again.size() == 1);
        REQUIRE(again[0].id == first[0].id);
    }

    SECTION("Dead peers are probed separately") {
        auto dead = table.select_dead_target(rng);
        REQUIRE(dead);
        REQUIRE(dead->id == "d");
        REQUIRE(!table.select_dead_target(rng));
        table.probe_finished("d");
        REQUIRE(table.select_dead_target(rng));
    }

    SECTION("Selection covers every peer over time") {
        std::set<std::string> seen;
        for (int i = 0; i < 50; ++i) {
            for (const auto& t : table.select_probe_targets(1, rng)) {
                seen.insert(t.id);
                table.probe_finished(t.id);
            }
        }
        REQUIRE(seen == std::set<std::string>{"a", "b", "c"});
    }
}
