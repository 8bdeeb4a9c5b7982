#pragma once

#include "types.hpp"
#include <atomic>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fastbu {

constexpr uint32_t INDEX_MAGIC = 0x46424958;  // "FBIX"
constexpr uint16_t INDEX_VERSION = 1;

// Where a key lives on disk
struct IndexRecord {
    std::string file;
    uint64_t generation = 0;
    EntryMetadata metadata;
};

// In-memory key -> record map, the authoritative lookup for local keys.
//
// Readers take a shared lock, mutations an exclusive one. No disk I/O
// happens under the lock. Every mutation bumps version() so index checkpoints
// snapshots can be ordered.
class Index {
public:
    std::optional<IndexRecord> find(const std::string& key) const;

    // Install or replace. An existing entry keeps its created_at.
    // Returns the replaced record, if any.
    std::optional<IndexRecord> install(const std::string& key, IndexRecord record);

    std::optional<IndexRecord> erase(const std::string& key);

    // Erase only while `key` still points at `file`
    bool erase_if(const std::string& key, const std::string& file);

    // Compare-and-swap on the file the key points at. An empty
    // `expected_file` requires the key to be absent; an empty `replacement`
    // erases the key.
    bool replace_if(const std::string& key, const std::string& expected_file,
                    const std::optional<IndexRecord>& replacement);

    std::vector<std::pair<std::string, IndexRecord>> entries() const;

    size_t size() const;
    uint64_t total_bytes() const;
    uint64_t version() const;

    // Generations for new record files
    uint64_t next_generation() { return generation_.fetch_add(1) + 1; }
    void observe_generation(uint64_t generation);

    struct Snapshot {
        uint64_t version = 0;
        ByteBuffer data;
    };

    // Serialized copy taken under the shared lock
    Snapshot snapshot() const;

    // Replace the contents from a serialized snapshot. Throws
    // std::runtime_error on a malformed input.
    void load(ByteView data);

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, IndexRecord> records_;
    uint64_t total_bytes_ = 0;
    uint64_t version_ = 0;
    std::atomic<uint64_t> generation_{0};
};

}  // namespace fastbu
