#include "fastbu/protocol.hpp"
#include <cstring>
#include <stdexcept>

namespace fastbu::protocol {

namespace {

void encode_members(ByteBuffer& buf, const std::vector<NodeInfo>& members) {
    Codec::encode_u32(buf, static_cast<uint32_t>(members.size()));
    for (const auto& node : members) {
        Codec::encode_node_info(buf, node);
    }
}

std::vector<NodeInfo> decode_members(ByteView& data) {
    uint32_t count = Codec::decode_u32(data);
    std::vector<NodeInfo> members;
    members.reserve(std::min<uint32_t>(count, 1024));
    for (uint32_t i = 0; i < count; ++i) {
        members.push_back(Codec::decode_node_info(data));
    }
    return members;
}

ErrorCode decode_code(ByteView& data) {
    uint32_t raw = Codec::decode_u32(data);
    if (raw > static_cast<uint32_t>(ErrorCode::InternalError)) {
        throw std::runtime_error("Invalid error code");
    }
    return static_cast<ErrorCode>(raw);
}

}  // namespace

MessageType message_type(const Message& msg) {
    return std::visit([](const auto& m) -> MessageType {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, JoinMessage>) return MessageType::Join;
        else if constexpr (std::is_same_v<T, JoinAckMessage>) return MessageType::JoinAck;
        else if constexpr (std::is_same_v<T, PingMessage>) return MessageType::Ping;
        else if constexpr (std::is_same_v<T, AckMessage>) return MessageType::Ack;
        else if constexpr (std::is_same_v<T, GetMessage>) return MessageType::Get;
        else if constexpr (std::is_same_v<T, GetResponseMessage>) return MessageType::GetResponse;
        else if constexpr (std::is_same_v<T, SetMessage>) return MessageType::Set;
        else if constexpr (std::is_same_v<T, SetResponseMessage>) return MessageType::SetResponse;
        else if constexpr (std::is_same_v<T, DeleteMessage>) return MessageType::Delete;
        else if constexpr (std::is_same_v<T, DeleteResponseMessage>) return MessageType::DeleteResponse;
        else return MessageType::Error;
    }, msg);
}

// Encoding helpers
void Codec::encode_header(ByteBuffer& buf, MessageType type,
                          uint32_t payload_len, uint32_t request_id) {
    MessageHeader hdr;
    hdr.type = static_cast<uint16_t>(type);
    hdr.length = payload_len;
    hdr.request_id = request_id;
    hdr.timestamp = to_unix_millis(SystemClock::now());

    encode_u32(buf, hdr.magic);
    encode_u16(buf, hdr.version);
    encode_u16(buf, hdr.type);
    encode_u32(buf, hdr.length);
    encode_u32(buf, hdr.request_id);
    encode_u64(buf, hdr.timestamp);
}

void Codec::encode_string(ByteBuffer& buf, std::string_view str) {
    encode_u32(buf, static_cast<uint32_t>(str.size()));
    buf.insert(buf.end(), str.begin(), str.end());
}

void Codec::encode_bytes(ByteBuffer& buf, ByteView data) {
    encode_u32(buf, static_cast<uint32_t>(data.size()));
    buf.insert(buf.end(), data.begin(), data.end());
}

void Codec::encode_u8(ByteBuffer& buf, uint8_t v) {
    buf.push_back(v);
}

void Codec::encode_u16(ByteBuffer& buf, uint16_t v) {
    buf.push_back(v & 0xFF);
    buf.push_back((v >> 8) & 0xFF);
}

void Codec::encode_u32(ByteBuffer& buf, uint32_t v) {
    buf.push_back(v & 0xFF);
    buf.push_back((v >> 8) & 0xFF);
    buf.push_back((v >> 16) & 0xFF);
    buf.push_back((v >> 24) & 0xFF);
}

void Codec::encode_u64(ByteBuffer& buf, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        buf.push_back((v >> (i * 8)) & 0xFF);
    }
}

void Codec::encode_node_info(ByteBuffer& buf, const NodeInfo& info) {
    encode_string(buf, info.id);
    encode_string(buf, info.host);
    encode_u16(buf, info.port);
    encode_u16(buf, info.api_port);
    encode_u64(buf, info.incarnation);
    encode_u32(buf, static_cast<uint32_t>(info.state));
    encode_u32(buf, static_cast<uint32_t>(info.metadata.size()));
    for (const auto& [k, v] : info.metadata) {
        encode_string(buf, k);
        encode_string(buf, v);
    }
}

void Codec::encode_metadata(ByteBuffer& buf, const EntryMetadata& meta) {
    encode_u64(buf, to_unix_millis(meta.created_at));
    encode_u64(buf, to_unix_millis(meta.updated_at));
    encode_u64(buf, meta.size_bytes);
}

// Decoding helpers
std::string Codec::decode_string(ByteView& data) {
    uint32_t len = decode_u32(data);
    if (data.size() < len) {
        throw std::runtime_error("Truncated string");
    }
    std::string result(reinterpret_cast<const char*>(data.data()), len);
    data = data.subspan(len);
    return result;
}

ByteBuffer Codec::decode_bytes(ByteView& data) {
    uint32_t len = decode_u32(data);
    if (data.size() < len) {
        throw std::runtime_error("Truncated bytes");
    }
    ByteBuffer result(data.begin(), data.begin() + len);
    data = data.subspan(len);
    return result;
}

uint8_t Codec::decode_u8(ByteView& data) {
    if (data.empty()) throw std::runtime_error("Truncated u8");
    uint8_t v = data[0];
    data = data.subspan(1);
    return v;
}

uint16_t Codec::decode_u16(ByteView& data) {
    if (data.size() < 2) throw std::runtime_error("Truncated u16");
    uint16_t v = data[0] | (static_cast<uint16_t>(data[1]) << 8);
    data = data.subspan(2);
    return v;
}

uint32_t Codec::decode_u32(ByteView& data) {
    if (data.size() < 4) throw std::runtime_error("Truncated u32");
    uint32_t v = data[0] |
                 (static_cast<uint32_t>(data[1]) << 8) |
                 (static_cast<uint32_t>(data[2]) << 16) |
                 (static_cast<uint32_t>(data[3]) << 24);
    data = data.subspan(4);
    return v;
}

uint64_t Codec::decode_u64(ByteView& data) {
    if (data.size() < 8) throw std::runtime_error("Truncated u64");
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v |= static_cast<uint64_t>(data[i]) << (i * 8);
    }
    data = data.subspan(8);
    return v;
}

NodeInfo Codec::decode_node_info(ByteView& data) {
    NodeInfo info;
    info.id = decode_string(data);
    info.host = decode_string(data);
    info.port = decode_u16(data);
    info.api_port = decode_u16(data);
    info.incarnation = decode_u64(data);
    uint32_t state = decode_u32(data);
    if (state > static_cast<uint32_t>(NodeState::Dead)) {
        throw std::runtime_error("Invalid node state");
    }
    info.state = static_cast<NodeState>(state);
    uint32_t meta_count = decode_u32(data);
    for (uint32_t i = 0; i < meta_count; ++i) {
        auto key = decode_string(data);
        info.metadata[key] = decode_string(data);
    }
    return info;
}

EntryMetadata Codec::decode_metadata(ByteView& data) {
    EntryMetadata meta;
    meta.created_at = from_unix_millis(decode_u64(data));
    meta.updated_at = from_unix_millis(decode_u64(data));
    meta.size_bytes = decode_u64(data);
    return meta;
}

MessageHeader Codec::parse_header(ByteView data) {
    if (data.size() < MessageHeader::SIZE) {
        throw std::runtime_error("Truncated header");
    }

    MessageHeader hdr;
    hdr.magic = decode_u32(data);
    hdr.version = decode_u16(data);
    hdr.type = decode_u16(data);
    hdr.length = decode_u32(data);
    hdr.request_id = decode_u32(data);
    hdr.timestamp = decode_u64(data);

    if (hdr.magic != MAGIC) {
        throw std::runtime_error("Invalid magic number");
    }
    if (hdr.version != VERSION) {
        throw std::runtime_error("Unsupported protocol version " + std::to_string(hdr.version));
    }
    if (hdr.length > MAX_PAYLOAD_SIZE) {
        throw std::runtime_error("Payload too large");
    }

    return hdr;
}

ByteBuffer Codec::encode(const Message& msg, uint32_t request_id) {
    ByteBuffer payload;

    std::visit([&](const auto& m) {
        using T = std::decay_t<decltype(m)>;

        if constexpr (std::is_same_v<T, JoinMessage>) {
            encode_node_info(payload, m.sender);
        }
        else if constexpr (std::is_same_v<T, JoinAckMessage>) {
            encode_node_info(payload, m.sender);
            encode_u8(payload, m.accepted ? 1 : 0);
            encode_string(payload, m.reject_reason);
            encode_members(payload, m.members);
        }
        else if constexpr (std::is_same_v<T, PingMessage> || std::is_same_v<T, AckMessage>) {
            encode_node_info(payload, m.sender);
            encode_members(payload, m.members);
        }
        else if constexpr (std::is_same_v<T, GetMessage> || std::is_same_v<T, DeleteMessage>) {
            encode_string(payload, m.key.view());
        }
        else if constexpr (std::is_same_v<T, GetResponseMessage>) {
            encode_u32(payload, static_cast<uint32_t>(m.code));
            encode_u8(payload, m.found ? 1 : 0);
            encode_bytes(payload, m.value);
            encode_u8(payload, m.metadata.has_value() ? 1 : 0);
            if (m.metadata) {
                encode_metadata(payload, *m.metadata);
            }
            encode_string(payload, m.message);
            encode_string(payload, m.owner);
        }
        else if constexpr (std::is_same_v<T, SetMessage>) {
            encode_string(payload, m.key.view());
            encode_bytes(payload, m.value);
        }
        else if constexpr (std::is_same_v<T, SetResponseMessage> ||
                           std::is_same_v<T, DeleteResponseMessage>) {
            encode_u32(payload, static_cast<uint32_t>(m.code));
            encode_string(payload, m.message);
            encode_string(payload, m.owner);
        }
        else if constexpr (std::is_same_v<T, ErrorMessage>) {
            encode_u32(payload, static_cast<uint32_t>(m.code));
            encode_string(payload, m.message);
            encode_u32(payload, m.original_request_id);
        }
    }, msg);

    ByteBuffer result;
    result.reserve(MessageHeader::SIZE + payload.size());
    encode_header(result, message_type(msg), static_cast<uint32_t>(payload.size()), request_id);
    result.insert(result.end(), payload.begin(), payload.end());

    return result;
}

std::pair<Message, MessageHeader> Codec::decode(ByteView data) {
    auto header = parse_header(data);
    data = data.subspan(MessageHeader::SIZE);
    if (data.size() < header.length) {
        throw std::runtime_error("Truncated payload");
    }
    data = data.subspan(0, header.length);

    auto type = static_cast<MessageType>(header.type);
    Message msg;

    switch (type) {
        case MessageType::Join: {
            JoinMessage m;
            m.sender = decode_node_info(data);
            msg = std::move(m);
            break;
        }

        case MessageType::JoinAck: {
            JoinAckMessage m;
            m.sender = decode_node_info(data);
            m.accepted = decode_u8(data) != 0;
            m.reject_reason = decode_string(data);
            m.members = decode_members(data);
            msg = std::move(m);
            break;
        }

        case MessageType::Ping: {
            PingMessage m;
            m.sender = decode_node_info(data);
            m.members = decode_members(data);
            msg = std::move(m);
            break;
        }

        case MessageType::Ack: {
            AckMessage m;
            m.sender = decode_node_info(data);
            m.members = decode_members(data);
            msg = std::move(m);
            break;
        }

        case MessageType::Get: {
            GetMessage m;
            m.key = CacheKey(decode_string(data));
            msg = std::move(m);
            break;
        }

        case MessageType::GetResponse: {
            GetResponseMessage m;
            m.code = decode_code(data);
            m.found = decode_u8(data) != 0;
            m.value = decode_bytes(data);
            if (decode_u8(data) != 0) {
                m.metadata = decode_metadata(data);
            }
            m.message = decode_string(data);
            m.owner = decode_string(data);
            msg = std::move(m);
            break;
        }

        case MessageType::Set: {
            SetMessage m;
            m.key = CacheKey(decode_string(data));
            m.value = decode_bytes(data);
            msg = std::move(m);
            break;
        }

        case MessageType::SetResponse: {
            SetResponseMessage m;
            m.code = decode_code(data);
            m.message = decode_string(data);
            m.owner = decode_string(data);
            msg = std::move(m);
            break;
        }

        case MessageType::Delete: {
            DeleteMessage m;
            m.key = CacheKey(decode_string(data));
            msg = std::move(m);
            break;
        }

        case MessageType::DeleteResponse: {
            DeleteResponseMessage m;
            m.code = decode_code(data);
            m.message = decode_string(data);
            m.owner = decode_string(data);
            msg = std::move(m);
            break;
        }

        case MessageType::Error: {
            ErrorMessage m;
            m.code = decode_code(data);
            m.message = decode_string(data);
            m.original_request_id = decode_u32(data);
            msg = std::move(m);
            break;
        }

        default:
            throw std::runtime_error("Unknown message type");
    }

    return {std::move(msg), header};
}

}  // namespace fastbu::protocol
