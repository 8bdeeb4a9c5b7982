#pragma once

#include "fastbu/types.hpp"
#include "fastbu/membership.hpp"
#include <variant>
#include <vector>

namespace fastbu::protocol {

// Protocol version
constexpr uint16_t VERSION = 1;
constexpr uint32_t MAGIC = 0x46534255;  // "FSBU"

// Largest payload accepted from a peer
constexpr size_t MAX_PAYLOAD_SIZE = MAX_VALUE_SIZE + MAX_KEY_SIZE + 64 * 1024;

// Message types
enum class MessageType : uint16_t {
    // Handshake
    Join = 0x0001,
    JoinAck = 0x0002,

    // Failure detection / gossip
    Ping = 0x0010,
    Ack = 0x0011,

    // Forwarded cache operations
    Get = 0x0100,
    GetResponse = 0x0101,
    Set = 0x0102,
    SetResponse = 0x0103,
    Delete = 0x0104,
    DeleteResponse = 0x0105,

    // Error
    Error = 0xFFFF,
};

// Message header (fixed size for easy parsing)
struct MessageHeader {
    uint32_t magic = MAGIC;
    uint16_t version = VERSION;
    uint16_t type = 0;
    uint32_t length = 0;  // Payload length (not including header)
    uint32_t request_id = 0;
    uint64_t timestamp = 0;

    static constexpr size_t SIZE = 24;
};

// Join handshake sent to seeds
struct JoinMessage {
    NodeInfo sender;
};

struct JoinAckMessage {
    NodeInfo sender;
    bool accepted = true;
    std::string reject_reason;
    std::vector<NodeInfo> members;  // Full membership of the seed
};

// Direct probe with piggybacked membership
struct PingMessage {
    NodeInfo sender;
    std::vector<NodeInfo> members;
};

struct AckMessage {
    NodeInfo sender;
    std::vector<NodeInfo> members;
};

// Forwarded operations. Responses carry the responder's view of the
// owner's API address when code == Misrouted.
struct GetMessage {
    CacheKey key;
};

struct GetResponseMessage {
    ErrorCode code = ErrorCode::Ok;
    bool found = false;
    ByteBuffer value;
    std::optional<EntryMetadata> metadata;
    std::string message;
    std::string owner;
};

struct SetMessage {
    CacheKey key;
    ByteBuffer value;
};

struct SetResponseMessage {
    ErrorCode code = ErrorCode::Ok;
    std::string message;
    std::string owner;
};

struct DeleteMessage {
    CacheKey key;
};

struct DeleteResponseMessage {
    ErrorCode code = ErrorCode::Ok;
    std::string message;
    std::string owner;
};

// Error message
struct ErrorMessage {
    ErrorCode code = ErrorCode::InternalError;
    std::string message;
    uint32_t original_request_id = 0;
};

// Unified message type
using Message = std::variant<
    JoinMessage,
    JoinAckMessage,
    PingMessage,
    AckMessage,
    GetMessage,
    GetResponseMessage,
    SetMessage,
    SetResponseMessage,
    DeleteMessage,
    DeleteResponseMessage,
    ErrorMessage
>;

MessageType message_type(const Message& msg);

// Codec for serialization/deserialization
class Codec {
public:
    // Serialize message to buffer
    static ByteBuffer encode(const Message& msg, uint32_t request_id = 0);

    // Deserialize message from buffer; throws std::runtime_error on
    // truncated or malformed input
    static std::pair<Message, MessageHeader> decode(ByteView data);

    // Parse header only (for length-prefixed reading)
    static MessageHeader parse_header(ByteView data);

    // Encoding helpers (shared with the on-disk formats)
    static void encode_header(ByteBuffer& buf, MessageType type,
                              uint32_t payload_len, uint32_t request_id);
    static void encode_string(ByteBuffer& buf, std::string_view str);
    static void encode_bytes(ByteBuffer& buf, ByteView data);
    static void encode_u8(ByteBuffer& buf, uint8_t v);
    static void encode_u16(ByteBuffer& buf, uint16_t v);
    static void encode_u32(ByteBuffer& buf, uint32_t v);
    static void encode_u64(ByteBuffer& buf, uint64_t v);
    static void encode_node_info(ByteBuffer& buf, const NodeInfo& info);
    static void encode_metadata(ByteBuffer& buf, const EntryMetadata& meta);

    // Decoding helpers
    static std::string decode_string(ByteView& data);
    static ByteBuffer decode_bytes(ByteView& data);
    static uint8_t decode_u8(ByteView& data);
    static uint16_t decode_u16(ByteView& data);
    static uint32_t decode_u32(ByteView& data);
    static uint64_t decode_u64(ByteView& data);
    static NodeInfo decode_node_info(ByteView& data);
    static EntryMetadata decode_metadata(ByteView& data);
};

}  // namespace fastbu::protocol
