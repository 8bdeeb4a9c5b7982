#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <span>
#include <chrono>
#include <optional>
#include <functional>

namespace fastbu {

// Constants
constexpr size_t MAX_KEY_SIZE = 8 * 1024;                 // 8KB
constexpr size_t MAX_VALUE_SIZE = 512ULL * 1024 * 1024;   // 512MB

// Time types
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = Clock::duration;
using SystemClock = std::chrono::system_clock;
using Timestamp = SystemClock::time_point;

// Buffer types
using ByteBuffer = std::vector<uint8_t>;
using ByteView = std::span<const uint8_t>;

// Stable 64-bit hash (XXH3)
uint64_t hash64(std::string_view data) noexcept;

// Milliseconds since the Unix epoch
uint64_t to_unix_millis(Timestamp ts) noexcept;
Timestamp from_unix_millis(uint64_t ms) noexcept;

// Cache key with precomputed hash
class CacheKey {
public:
    CacheKey() = default;
    explicit CacheKey(std::string_view key);

    std::string_view view() const noexcept { return data_; }
    const std::string& str() const noexcept { return data_; }
    size_t size() const noexcept { return data_.size(); }
    bool empty() const noexcept { return data_.empty(); }

    uint64_t hash() const noexcept { return hash_; }

    bool operator==(const CacheKey& other) const noexcept {
        return hash_ == other.hash_ && data_ == other.data_;
    }

private:
    std::string data_;
    uint64_t hash_ = 0;
};

// Entry metadata kept in the index and in each on-disk record
struct EntryMetadata {
    Timestamp created_at;
    Timestamp updated_at;
    uint64_t size_bytes = 0;
};

enum class CacheResult {
    Hit,
    Miss,
    Error
};

// Error codes
enum class ErrorCode {
    Ok = 0,
    NotFound,
    DiskError,
    NetworkError,
    Timeout,
    Misrouted,
    Corrupted,
    InvalidArgument,
    KeyTooLarge,
    ValueTooLarge,
    InternalError
};

const char* error_code_string(ErrorCode code);

// Status wrapper
class Status {
public:
    Status() : code_(ErrorCode::Ok) {}
    explicit Status(ErrorCode code, std::string msg = {})
        : code_(code), message_(std::move(msg)) {}

    static Status make_ok() { return Status(); }
    static Status error(ErrorCode code, std::string msg = {}) {
        return Status(code, std::move(msg));
    }

    bool ok() const noexcept { return code_ == ErrorCode::Ok; }
    bool is_ok() const noexcept { return code_ == ErrorCode::Ok; }
    bool is_error() const noexcept { return code_ != ErrorCode::Ok; }
    explicit operator bool() const noexcept { return is_ok(); }

    ErrorCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }

    // "<code>: <message>" for logs
    std::string to_string() const;

private:
    ErrorCode code_;
    std::string message_;
};

// Result of a cache read
struct ReadResult {
    CacheResult result = CacheResult::Miss;
    ByteBuffer data;
    std::optional<EntryMetadata> metadata;
    Status status;

    bool is_hit() const noexcept { return result == CacheResult::Hit; }
    bool is_miss() const noexcept { return result == CacheResult::Miss; }

    static ReadResult miss() { return {}; }
    static ReadResult failure(Status s) {
        ReadResult r;
        r.result = CacheResult::Error;
        r.status = std::move(s);
        return r;
    }
};

}  // namespace fastbu

namespace std {

template<>
struct hash<fastbu::CacheKey> {
    size_t operator()(const fastbu::CacheKey& k) const noexcept {
        return k.hash();
    }
};

}  // namespace std
