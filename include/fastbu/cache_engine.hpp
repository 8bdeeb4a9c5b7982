#pragma once

#include "config.hpp"
#include "index.hpp"
#include "storage.hpp"
#include <atomic>
#include <mutex>

namespace fastbu {

// Result of a verification pass. Nothing is repaired.
struct ConsistencyReport {
    size_t indexed_entries = 0;
    size_t verified_entries = 0;
    size_t missing_backing = 0;   // Index entries without a readable record
    size_t orphan_records = 0;    // Record files no index entry points at
    size_t temp_files = 0;        // Leftovers of interrupted writes

    std::vector<std::string> missing_keys;
    std::vector<std::string> orphan_files;
    std::vector<std::string> temp_file_names;

    bool consistent() const {
        return missing_backing == 0 && orphan_records == 0;
    }
};

// Local key-value store: Index over one-file-per-entry storage.
//
// A record is written and renamed into place before the index points at
// it, and an old record is removed only after the index stops pointing at
// it, so readers never see a partially written value.
//
// Record files are the durable state. Writes never touch the index file;
// it is a checkpoint taken at start and stop, and start() reconciles it
// against the records on disk.
class CacheEngine {
public:
    explicit CacheEngine(const StorageConfig& config);

    CacheEngine(const CacheEngine&) = delete;
    CacheEngine& operator=(const CacheEngine&) = delete;

    // Create the directory, drop temp leftovers, load the checkpoint and
    // recover records written after it
    Status start();
    bool started() const { return started_; }

    Status set(const CacheKey& key, ByteView value);

    // Miss when absent. A record that cannot be read back while the index
    // still points at it is treated as absent and dropped from the index.
    // DiskError is returned as a failure.
    ReadResult get(const CacheKey& key);

    // Ok whether or not the key existed; `existed` reports which
    Status remove(const CacheKey& key, bool* existed = nullptr);

    ConsistencyReport verify() const;

    // Write the index to `index_file`
    Status checkpoint();

    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t sets = 0;
        uint64_t deletes = 0;
        uint64_t bytes_read = 0;
        uint64_t bytes_written = 0;
        uint64_t consistency_faults = 0;
        uint64_t disk_errors = 0;
        size_t entry_count = 0;
        uint64_t size_bytes = 0;
    };

    Stats stats() const;
    size_t size() const { return index_.size(); }

    const StorageConfig& config() const { return config_; }

private:
    StorageConfig config_;
    StorageUnit storage_;
    Index index_;
    bool started_ = false;

    // Serializes checkpoints; older snapshots are skipped
    std::mutex checkpoint_mutex_;
    uint64_t checkpoint_version_ = 0;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> sets_{0};
    std::atomic<uint64_t> deletes_{0};
    std::atomic<uint64_t> bytes_read_{0};
    std::atomic<uint64_t> bytes_written_{0};
    std::atomic<uint64_t> consistency_faults_{0};
    mutable std::atomic<uint64_t> disk_errors_{0};

    Status validate_key(const CacheKey& key) const;
    void load_checkpoint();
    void recover_records();
    void reclaim(const std::string& file);
};

}  // namespace fastbu
