#include <catch2/catch_test_macros.hpp>
#include "fastbu/protocol.hpp"

using namespace fastbu;
using namespace fastbu::protocol;

namespace {

ByteBuffer valid_header(uint16_t type, uint32_t length, uint32_t request_id) {
    ByteBuffer buf(MessageHeader::SIZE, 0);
    // Magic "FSBU" in little-endian = 0x46534255
    buf[0] = 0x55; buf[1] = 0x42; buf[2] = 0x53; buf[3] = 0x46;
    // Version = 1
    buf[4] = 0x01; buf[5] = 0x00;
    buf[6] = static_cast<uint8_t>(type & 0xFF);
    buf[7] = static_cast<uint8_t>(type >> 8);
    for (int i = 0; i < 4; ++i) {
        buf[8 + i] = static_cast<uint8_t>(length >> (i * 8));
        buf[12 + i] = static_cast<uint8_t>(request_id >> (i * 8));
    }
    return buf;
}

NodeInfo sample_node() {
    NodeInfo n;
    n.id = "node-1";
    n.host = "10.0.0.1";
    n.port = 7946;
    n.api_port = 3031;
    n.incarnation = 1700000000123ULL;
    n.state = NodeState::Suspect;
    n.metadata["zone"] = "eu-1";
    return n;
}

}  // namespace

TEST_CASE("Message header parsing", "[protocol]") {
    SECTION("Valid header") {
        auto buf = valid_header(static_cast<uint16_t>(MessageType::Ping), 16, 1);
        auto header = Codec::parse_header(buf);

        REQUIRE(header.magic == MAGIC);
        REQUIRE(header.version == VERSION);
        REQUIRE(header.type == static_cast<uint16_t>(MessageType::Ping));
        REQUIRE(header.length == 16);
        REQUIRE(header.request_id == 1);
    }

    SECTION("Invalid magic throws") {
        auto buf = valid_header(1, 0, 0);
        buf[0] = 0xFF;
        REQUIRE_THROWS(Codec::parse_header(buf));
    }

    SECTION("Truncated header throws") {
        ByteBuffer buf(10, 0);
        REQUIRE_THROWS(Codec::parse_header(buf));
    }

    SECTION("Unsupported version throws") {
        auto buf = valid_header(1, 0, 0);
        buf[4] = 0x02;
        REQUIRE_THROWS(Codec::parse_header(buf));
    }

    SECTION("Oversized payload throws") {
        auto buf = valid_header(1, 0xFFFFFFFF, 0);
        REQUIRE_THROWS(Codec::parse_header(buf));
    }
}

TEST_CASE("Join handshake encoding", "[protocol]") {
    JoinMessage join;
    join.sender = sample_node();

    auto encoded = Codec::encode(join, 7);
    REQUIRE(encoded.size() > MessageHeader::SIZE);

    auto [msg, header] = Codec::decode(encoded);
    REQUIRE(header.request_id == 7);
    REQUIRE(header.timestamp > 0);

    auto& decoded = std::get<JoinMessage>(msg);
    REQUIRE(decoded.sender.id == "node-1");
    REQUIRE(decoded.sender.host == "10.0.0.1");
    REQUIRE(decoded.sender.port == 7946);
    REQUIRE(decoded.sender.api_port == 3031);
    REQUIRE(decoded.sender.incarnation == 1700000000123ULL);
    REQUIRE(decoded.sender.state == NodeState::Suspect);
    REQUIRE(decoded.sender.metadata.at("zone") == "eu-1");

    SECTION("Rejected ack carries the reason") {
        JoinAckMessage ack;
        ack.sender = sample_node();
        ack.accepted = false;
        ack.reject_reason = "duplicate node id";

        auto [ack_msg, ack_header] = Codec::decode(Codec::encode(ack, 7));
        auto& decoded_ack = std::get<JoinAckMessage>(ack_msg);
        REQUIRE(!decoded_ack.accepted);
        REQUIRE(decoded_ack.reject_reason == "duplicate node id");
        REQUIRE(decoded_ack.members.empty());
    }

    SECTION("Accepted ack carries members") {
        JoinAckMessage ack;
        ack.sender = sample_node();
        auto other = sample_node();
        other.id = "node-2";
        other.state = NodeState::Dead;
        ack.members = {sample_node(), other};

        auto [ack_msg, ack_header] = Codec::decode(Codec::encode(ack));
        auto& decoded_ack = std::get<JoinAckMessage>(ack_msg);
        REQUIRE(decoded_ack.accepted);
        REQUIRE(decoded_ack.members.size() == 2);
        REQUIRE(decoded_ack.members[1].id == "node-2");
        REQUIRE(decoded_ack.members[1].state == NodeState::Dead);
    }
}

TEST_CASE("Ping and ack encoding", "[protocol]") {
    PingMessage ping;
    ping.sender = sample_node();
    ping.members = {sample_node()};

    auto [ping_msg, ping_header] = Codec::decode(Codec::encode(ping, 99));
    REQUIRE(ping_header.type == static_cast<uint16_t>(MessageType::Ping));
    REQUIRE(std::get<PingMessage>(ping_msg).members.size() == 1);

    AckMessage ack;
    ack.sender = sample_node();
    auto [ack_msg, ack_header] = Codec::decode(Codec::encode(ack, 99));
    REQUIRE(ack_header.request_id == 99);
    REQUIRE(std::get<AckMessage>(ack_msg).sender.id == "node-1");
}

TEST_CASE("Forwarded operation encoding", "[protocol]") {
    SECTION("Get with binary key") {
        GetMessage get;
        get.key = CacheKey(std::string("a\0b/c", 5));
        auto [msg, header] = Codec::decode(Codec::encode(get, 3));
        REQUIRE(std::get<GetMessage>(msg).key == get.key);
    }

    SECTION("Get response with value and metadata") {
        GetResponseMessage resp;
        resp.found = true;
        resp.value = ByteBuffer{'H', 'e', 'l', 'l', 'o'};
        EntryMetadata meta;
        meta.created_at = from_unix_millis(1000);
        meta.updated_at = from_unix_millis(2000);
        meta.size_bytes = 5;
        resp.metadata = meta;

        auto [msg, header] = Codec::decode(Codec::encode(resp));
        auto& decoded = std::get<GetResponseMessage>(msg);
        REQUIRE(decoded.code == ErrorCode::Ok);
        REQUIRE(decoded.found);
        REQUIRE(decoded.value == resp.value);
        REQUIRE(decoded.metadata);
        REQUIRE(to_unix_millis(decoded.metadata->created_at) == 1000);
        REQUIRE(to_unix_millis(decoded.metadata->updated_at) == 2000);
        REQUIRE(decoded.metadata->size_bytes == 5);
    }

    SECTION("Get miss has no metadata") {
        GetResponseMessage resp;
        auto [msg, header] = Codec::decode(Codec::encode(resp));
        auto& decoded = std::get<GetResponseMessage>(msg);
        REQUIRE(!decoded.found);
        REQUIRE(!decoded.metadata);
    }

    SECTION("Set with empty value") {
        SetMessage set;
        set.key = CacheKey("k");
        auto [msg, header] = Codec::decode(Codec::encode(set));
        auto& decoded = std::get<SetMessage>(msg);
        REQUIRE(decoded.key.view() == "k");
        REQUIRE(decoded.value.empty());
    }

    SECTION("Misrouted delete response names the owner") {
        DeleteResponseMessage resp;
        resp.code = ErrorCode::Misrouted;
        resp.message = "Not the owner";
        resp.owner = "10.0.0.2:3032";

        auto [msg, header] = Codec::decode(Codec::encode(resp));
        auto& decoded = std::get<DeleteResponseMessage>(msg);
        REQUIRE(decoded.code == ErrorCode::Misrouted);
        REQUIRE(decoded.message == "Not the owner");
        REQUIRE(decoded.owner == "10.0.0.2:3032");
    }

    SECTION("Error message") {
        ErrorMessage err;
        err.code = ErrorCode::DiskError;
        err.message = "disk full";
        err.original_request_id = 12;

        auto [msg, header] = Codec::decode(Codec::encode(err));
        auto& decoded = std::get<ErrorMessage>(msg);
        REQUIRE(decoded.code == ErrorCode::DiskError);
        REQUIRE(decoded.original_request_id == 12);
    }
}

TEST_CASE("Malformed payloads", "[protocol]") {
    SECTION("Truncated payload throws") {
        SetMessage set;
        set.key = CacheKey("key");
        set.value = ByteBuffer(100, 'x');
        auto encoded = Codec::encode(set);
        encoded.resize(encoded.size() - 10);
        REQUIRE_THROWS(Codec::decode(encoded));
    }

    SECTION("Unknown type throws") {
        auto buf = valid_header(0x0777, 0, 0);
        REQUIRE_THROWS(Codec::decode(buf));
    }

    SECTION("Payload shorter than its fields throws") {
        // Get with a declared key length but no key bytes
        auto buf = valid_header(static_cast<uint16_t>(MessageType::Get), 4, 0);
        buf.insert(buf.end(), {0x10, 0x00, 0x00, 0x00});
        REQUIRE_THROWS(Codec::decode(buf));
    }
}

TEST_CASE("Message type mapping", "[protocol]") {
    REQUIRE(message_type(JoinMessage{}) == MessageType::Join);
    REQUIRE(message_type(AckMessage{}) == MessageType::Ack);
    REQUIRE(message_type(SetResponseMessage{}) == MessageType::SetResponse);
    REQUIRE(message_type(ErrorMessage{}) == MessageType::Error);
}
