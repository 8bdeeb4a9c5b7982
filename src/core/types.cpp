#include "fastbu/types.hpp"
#include <xxhash.h>

namespace fastbu {

uint64_t hash64(std::string_view data) noexcept {
    return XXH3_64bits(data.data(), data.size());
}

uint64_t to_unix_millis(Timestamp ts) noexcept {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            ts.time_since_epoch()).count());
}

Timestamp from_unix_millis(uint64_t ms) noexcept {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::milliseconds(ms)));
}

// CacheKey implementation
CacheKey::CacheKey(std::string_view key)
    : data_(key)
    , hash_(hash64(key))
{}

// Status helpers
const char* error_code_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::DiskError: return "Storage I/O error";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::Timeout: return "Network timeout";
        case ErrorCode::Misrouted: return "Misrouted";
        case ErrorCode::Corrupted: return "Corrupted record";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::KeyTooLarge: return "Key too large";
        case ErrorCode::ValueTooLarge: return "Value too large";
        case ErrorCode::InternalError: return "Internal error";
        default: return "Unknown error";
    }
}

std::string Status::to_string() const {
    if (message_.empty()) {
        return error_code_string(code_);
    }
    return std::string(error_code_string(code_)) + ": " + message_;
}

}  // namespace fastbu
