#pragma once

#include "types.hpp"
#include <atomic>
#include <filesystem>
#include <string>
#include <vector>

namespace fastbu {

// On-disk record format
constexpr uint32_t RECORD_MAGIC = 0x46425243;  // "FBRC"
constexpr uint16_t RECORD_VERSION = 1;

constexpr const char* RECORD_EXTENSION = ".cache";
constexpr const char* TEMP_EXTENSION = ".tmp";

// A record as read back from disk
struct StoredRecord {
    std::string key;
    EntryMetadata metadata;
    ByteBuffer value;
};

// Durable single-entry persistence.
//
// Every entry lives in its own file named after the key hash and a
// generation number, so a new version of a key never overwrites the file a
// concurrent reader may be using. Files are written to a temp name and
// renamed into place.
class StorageUnit {
public:
    StorageUnit(std::filesystem::path dir, bool sync_writes);

    // Create the storage directory
    Status init();

    const std::filesystem::path& directory() const { return dir_; }

    // "<16 hex digits of key hash>-<generation>.cache"
    static std::string record_file_name(const CacheKey& key, uint64_t generation);

    // Inverse of record_file_name; false for foreign files
    static bool parse_record_file_name(std::string_view name,
                                       uint64_t& key_hash, uint64_t& generation);

    static ByteBuffer encode_record(std::string_view key, const EntryMetadata& meta,
                                    ByteView value);

    // Returns Corrupted on a bad magic, version, checksum or truncation
    static Status decode_record(ByteView data, StoredRecord& out);

    Status write_record(const std::string& file, const CacheKey& key,
                        const EntryMetadata& meta, ByteView value);

    // NotFound if the file is gone, Corrupted if it does not decode,
    // DiskError on an I/O failure
    Status read_record(const std::string& file, StoredRecord& out) const;

    Status remove_record(const std::string& file);

    // File names (not paths) of complete records in the directory
    std::vector<std::string> list_records() const;

    // Leftovers of interrupted writes
    std::vector<std::string> list_temp_files() const;
    size_t remove_temp_files();

    // Whole-file helpers used for the index
    Status write_file_atomic(const std::string& name, ByteView data);
    Status read_file(const std::string& name, ByteBuffer& out) const;

private:
    std::filesystem::path dir_;
    bool sync_writes_;
    std::atomic<uint64_t> temp_seq_{0};

    std::vector<std::string> list_with_extension(const char* ext) const;
};

}  // namespace fastbu
