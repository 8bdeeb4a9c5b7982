#include "fastbu/index.hpp"
#include "fastbu/protocol.hpp"
#include <xxhash.h>
#include <algorithm>
#include <mutex>
#include <stdexcept>

namespace fastbu {

using protocol::Codec;

std::optional<IndexRecord> Index::find(const std::string& key) const {
    std::shared_lock lock(mutex_);
    auto it = records_.find(key);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<IndexRecord> Index::install(const std::string& key, IndexRecord record) {
    observe_generation(record.generation);

    std::lock_guard lock(mutex_);
    ++version_;

    auto it = records_.find(key);
    if (it == records_.end()) {
        total_bytes_ += record.metadata.size_bytes;
        records_.emplace(key, std::move(record));
        return std::nullopt;
    }

    auto previous = std::move(it->second);
    record.metadata.created_at = previous.metadata.created_at;
    total_bytes_ -= previous.metadata.size_bytes;
    total_bytes_ += record.metadata.size_bytes;
    it->second = std::move(record);
    return previous;
}

std::optional<IndexRecord> Index::erase(const std::string& key) {
    std::lock_guard lock(mutex_);
    auto it = records_.find(key);
    if (it == records_.end()) {
        return std::nullopt;
    }
    ++version_;
    auto previous = std::move(it->second);
    total_bytes_ -= previous.metadata.size_bytes;
    records_.erase(it);
    return previous;
}

bool Index::erase_if(const std::string& key, const std::string& file) {
    return replace_if(key, file, std::nullopt);
}

bool Index::replace_if(const std::string& key, const std::string& expected_file,
                       const std::optional<IndexRecord>& replacement) {
    std::lock_guard lock(mutex_);
    auto it = records_.find(key);

    if (expected_file.empty()) {
        if (it != records_.end()) {
            return false;
        }
    } else if (it == records_.end() || it->second.file != expected_file) {
        return false;
    }

    ++version_;
    if (it != records_.end()) {
        total_bytes_ -= it->second.metadata.size_bytes;
        records_.erase(it);
    }
    if (replacement) {
        total_bytes_ += replacement->metadata.size_bytes;
        records_.emplace(key, *replacement);
    }
    return true;
}

std::vector<std::pair<std::string, IndexRecord>> Index::entries() const {
    std::shared_lock lock(mutex_);
    return {records_.begin(), records_.end()};
}

size_t Index::size() const {
    std::shared_lock lock(mutex_);
    return records_.size();
}

uint64_t Index::total_bytes() const {
    std::shared_lock lock(mutex_);
    return total_bytes_;
}

uint64_t Index::version() const {
    std::shared_lock lock(mutex_);
    return version_;
}

void Index::observe_generation(uint64_t generation) {
    uint64_t current = generation_.load();
    while (current < generation && !generation_.compare_exchange_weak(current, generation)) {
    }
}

Index::Snapshot Index::snapshot() const {
    Snapshot snap;
    auto& buf = snap.data;

    std::shared_lock lock(mutex_);
    snap.version = version_;

    Codec::encode_u32(buf, INDEX_MAGIC);
    Codec::encode_u16(buf, INDEX_VERSION);
    Codec::encode_u16(buf, 0);
    Codec::encode_u64(buf, version_);
    Codec::encode_u32(buf, static_cast<uint32_t>(records_.size()));
    for (const auto& [key, rec] : records_) {
        Codec::encode_string(buf, key);
        Codec::encode_string(buf, rec.file);
        Codec::encode_u64(buf, rec.generation);
        Codec::encode_metadata(buf, rec.metadata);
    }
    lock.unlock();

    Codec::encode_u64(buf, XXH3_64bits(buf.data(), buf.size()));
    return snap;
}

void Index::load(ByteView data) {
    if (data.size() < 8) {
        throw std::runtime_error("Truncated index");
    }
    auto body = data.subspan(0, data.size() - 8);
    auto tail = data.subspan(data.size() - 8);
    if (Codec::decode_u64(tail) != XXH3_64bits(body.data(), body.size())) {
        throw std::runtime_error("Index checksum mismatch");
    }

    if (Codec::decode_u32(body) != INDEX_MAGIC) {
        throw std::runtime_error("Invalid index magic");
    }
    uint16_t format = Codec::decode_u16(body);
    if (format != INDEX_VERSION) {
        throw std::runtime_error("Unsupported index version " + std::to_string(format));
    }
    Codec::decode_u16(body);
    uint64_t version = Codec::decode_u64(body);
    uint32_t count = Codec::decode_u32(body);

    std::unordered_map<std::string, IndexRecord> loaded;
    uint64_t bytes = 0;
    uint64_t max_generation = 0;
    for (uint32_t i = 0; i < count; ++i) {
        auto key = Codec::decode_string(body);
        IndexRecord rec;
        rec.file = Codec::decode_string(body);
        rec.generation = Codec::decode_u64(body);
        rec.metadata = Codec::decode_metadata(body);
        bytes += rec.metadata.size_bytes;
        max_generation = std::max(max_generation, rec.generation);
        loaded[std::move(key)] = std::move(rec);
    }

    {
        std::lock_guard lock(mutex_);
        records_ = std::move(loaded);
        total_bytes_ = bytes;
        version_ = version;
    }
    observe_generation(max_generation);
}

}  // namespace fastbu
