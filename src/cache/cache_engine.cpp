#include "fastbu/cache_engine.hpp"
#include "fastbu/logging.hpp"
#include <unordered_set>

namespace fastbu {

namespace {

// A reader can lose a race with an overwrite that reclaims the file it
// looked up; it retries against the new index entry.
constexpr int MAX_READ_ATTEMPTS = 16;

}  // namespace

CacheEngine::CacheEngine(const StorageConfig& config)
    : config_(config)
    , storage_(config.path, config.sync_writes)
{}

Status CacheEngine::start() {
    auto status = storage_.init();
    if (!status) {
        return status;
    }

    size_t temps = storage_.remove_temp_files();
    if (temps > 0) {
        FASTBU_LOG_INFO("Removed " << temps << " incomplete writes from " << config_.path);
    }

    load_checkpoint();
    recover_records();

    status = checkpoint();
    if (!status) {
        return status;
    }

    started_ = true;
    FASTBU_LOG_INFO("Cache engine started at " << config_.path << " with "
                    << index_.size() << " entries");
    return Status::make_ok();
}

void CacheEngine::load_checkpoint() {
    ByteBuffer data;
    auto status = storage_.read_file(config_.index_file, data);
    if (!status) {
        if (status.code() != ErrorCode::NotFound) {
            FASTBU_LOG_WARN("Cannot read " << config_.index_file << ": " << status.to_string());
        }
        return;
    }

    try {
        index_.load(data);
    } catch (const std::exception& e) {
        FASTBU_LOG_WARN("Index " << config_.index_file << " is unreadable (" << e.what()
                        << "), rebuilding from records");
    }
}

void CacheEngine::recover_records() {
    auto records = storage_.list_records();
    std::unordered_set<std::string> on_disk(records.begin(), records.end());

    // Entries whose record is gone were deleted after the checkpoint
    size_t dropped = 0;
    std::unordered_set<std::string> referenced;
    for (const auto& [key, record] : index_.entries()) {
        if (on_disk.count(record.file)) {
            referenced.insert(record.file);
        } else if (index_.erase_if(key, record.file)) {
            ++dropped;
        }
    }

    size_t adopted = 0;
    size_t stale = 0;
    for (const auto& name : records) {
        uint64_t hash, generation;
        if (!StorageUnit::parse_record_file_name(name, hash, generation)) {
            continue;
        }
        // Never reuse a generation that is still on disk
        index_.observe_generation(generation);
        if (referenced.count(name)) {
            continue;
        }

        StoredRecord stored;
        auto status = storage_.read_record(name, stored);
        if (!status || CacheKey(stored.key).hash() != hash) {
            FASTBU_LOG_WARN("Skipping unreadable record " << name << ": "
                            << (status ? std::string("key mismatch") : status.to_string()));
            continue;
        }

        // Highest generation wins
        auto current = index_.find(stored.key);
        if (current && current->generation > generation) {
            reclaim(name);
            ++stale;
            continue;
        }

        IndexRecord record;
        record.file = name;
        record.generation = generation;
        record.metadata = stored.metadata;
        index_.install(stored.key, record);
        if (current) {
            reclaim(current->file);
            ++stale;
        }
        ++adopted;
    }

    if (dropped > 0 || adopted > 0 || stale > 0) {
        FASTBU_LOG_INFO("Recovered " << adopted << " records, dropped " << dropped
                        << " deleted entries, reclaimed " << stale << " stale records");
    }
}

Status CacheEngine::validate_key(const CacheKey& key) const {
    if (key.empty()) {
        return Status::error(ErrorCode::InvalidArgument, "Empty key");
    }
    if (key.size() > MAX_KEY_SIZE) {
        return Status::error(ErrorCode::KeyTooLarge);
    }
    return Status::make_ok();
}

Status CacheEngine::set(const CacheKey& key, ByteView value) {
    auto status = validate_key(key);
    if (!status) {
        return status;
    }
    if (value.size() > MAX_VALUE_SIZE) {
        return Status::error(ErrorCode::ValueTooLarge);
    }

    IndexRecord record;
    record.generation = index_.next_generation();
    record.file = StorageUnit::record_file_name(key, record.generation);
    auto now = SystemClock::now();
    record.metadata = {now, now, value.size()};
    if (auto existing = index_.find(key.str())) {
        record.metadata.created_at = existing->metadata.created_at;
    }

    status = storage_.write_record(record.file, key, record.metadata, value);
    if (!status) {
        disk_errors_++;
        FASTBU_LOG_ERROR("Write of " << record.file << " failed: " << status.to_string());
        return status;
    }

    auto previous = index_.install(key.str(), record);
    if (previous) {
        reclaim(previous->file);
    }

    sets_++;
    bytes_written_ += value.size();
    return Status::make_ok();
}

ReadResult CacheEngine::get(const CacheKey& key) {
    auto status = validate_key(key);
    if (!status) {
        return ReadResult::failure(status);
    }

    for (int attempt = 0; attempt < MAX_READ_ATTEMPTS; ++attempt) {
        auto record = index_.find(key.str());
        if (!record) {
            misses_++;
            return ReadResult::miss();
        }

        StoredRecord stored;
        status = storage_.read_record(record->file, stored);
        if (status && stored.key == key.str()) {
            hits_++;
            bytes_read_ += stored.value.size();

            ReadResult result;
            result.result = CacheResult::Hit;
            result.data = std::move(stored.value);
            result.metadata = record->metadata;
            return result;
        }

        if (status.code() == ErrorCode::DiskError) {
            disk_errors_++;
            return ReadResult::failure(status);
        }

        // Consistency fault, unless the entry moved on while we were reading
        if (index_.erase_if(key.str(), record->file)) {
            consistency_faults_++;
            FASTBU_LOG_WARN("Consistency fault on " << record->file << ": "
                            << (status ? std::string("key mismatch") : status.to_string())
                            << "; dropping index entry");
            misses_++;
            return ReadResult::miss();
        }
    }

    misses_++;
    return ReadResult::miss();
}

Status CacheEngine::remove(const CacheKey& key, bool* existed) {
    auto status = validate_key(key);
    if (!status) {
        return status;
    }

    auto previous = index_.erase(key.str());
    if (existed) {
        *existed = previous.has_value();
    }
    if (!previous) {
        return Status::make_ok();
    }

    // Removing the record is what makes the delete durable
    status = storage_.remove_record(previous->file);
    if (!status && status.code() != ErrorCode::NotFound) {
        disk_errors_++;
        FASTBU_LOG_ERROR("Delete of " << previous->file << " failed: " << status.to_string());
        // Restore unless a concurrent set already installed a new record
        index_.replace_if(key.str(), std::string{}, previous);
        return status;
    }

    deletes_++;
    return Status::make_ok();
}

ConsistencyReport CacheEngine::verify() const {
    ConsistencyReport report;

    auto entries = index_.entries();
    report.indexed_entries = entries.size();

    std::unordered_set<std::string> referenced;
    for (const auto& [key, record] : entries) {
        referenced.insert(record.file);

        StoredRecord stored;
        auto status = storage_.read_record(record.file, stored);
        if (status && stored.key == key) {
            report.verified_entries++;
        } else {
            if (status.code() == ErrorCode::DiskError) {
                disk_errors_++;
            }
            report.missing_backing++;
            report.missing_keys.push_back(key);
        }
    }

    for (auto& name : storage_.list_records()) {
        if (!referenced.count(name)) {
            report.orphan_records++;
            report.orphan_files.push_back(std::move(name));
        }
    }

    report.temp_file_names = storage_.list_temp_files();
    report.temp_files = report.temp_file_names.size();

    FASTBU_LOG_INFO("Verify: " << report.verified_entries << "/" << report.indexed_entries
                    << " verified, " << report.missing_backing << " missing, "
                    << report.orphan_records << " orphans, " << report.temp_files << " temp files");
    return report;
}

CacheEngine::Stats CacheEngine::stats() const {
    Stats s;
    s.hits = hits_.load();
    s.misses = misses_.load();
    s.sets = sets_.load();
    s.deletes = deletes_.load();
    s.bytes_read = bytes_read_.load();
    s.bytes_written = bytes_written_.load();
    s.consistency_faults = consistency_faults_.load();
    s.disk_errors = disk_errors_.load();
    s.entry_count = index_.size();
    s.size_bytes = index_.total_bytes();
    return s;
}

Status CacheEngine::checkpoint() {
    std::lock_guard lock(checkpoint_mutex_);

    auto snap = index_.snapshot();
    if (snap.version <= checkpoint_version_ && checkpoint_version_ > 0) {
        return Status::make_ok();  // A newer snapshot is already on disk
    }

    auto status = storage_.write_file_atomic(config_.index_file, snap.data);
    if (!status) {
        disk_errors_++;
        FASTBU_LOG_ERROR("Failed to write index checkpoint: " << status.to_string());
        return status;
    }
    checkpoint_version_ = snap.version;
    return Status::make_ok();
}

void CacheEngine::reclaim(const std::string& file) {
    auto status = storage_.remove_record(file);
    if (!status && status.code() != ErrorCode::NotFound) {
        FASTBU_LOG_WARN("Failed to reclaim " << file << ": " << status.to_string());
    }
}

}  // namespace fastbu
