#include "fastbu/storage.hpp"
#include "fastbu/protocol.hpp"
#include "fastbu/logging.hpp"
#include <xxhash.h>
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

namespace fastbu {

using protocol::Codec;

namespace {

std::string errno_message(const char* what, const std::filesystem::path& path) {
    return std::string(what) + " " + path.string() + ": " + std::strerror(errno);
}

Status write_all(int fd, ByteView data, const std::filesystem::path& path) {
    size_t total_written = 0;
    while (total_written < data.size()) {
        ssize_t n = ::write(fd, data.data() + total_written, data.size() - total_written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return Status::error(ErrorCode::DiskError, errno_message("Write failed", path));
        }
        total_written += static_cast<size_t>(n);
    }
    return Status::make_ok();
}

void sync_directory(const std::filesystem::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return;
    }
    ::fsync(fd);
    ::close(fd);
}

}  // namespace

StorageUnit::StorageUnit(std::filesystem::path dir, bool sync_writes)
    : dir_(std::move(dir))
    , sync_writes_(sync_writes)
{}

Status StorageUnit::init() {
    std::error_code ec;
    if (!std::filesystem::exists(dir_, ec)) {
        std::filesystem::create_directories(dir_, ec);
        if (ec) {
            return Status::error(ErrorCode::DiskError,
                "Failed to create directory " + dir_.string() + ": " + ec.message());
        }
    }
    if (!std::filesystem::is_directory(dir_, ec)) {
        return Status::error(ErrorCode::DiskError, dir_.string() + " is not a directory");
    }
    return Status::make_ok();
}

std::string StorageUnit::record_file_name(const CacheKey& key, uint64_t generation) {
    char name[64];
    std::snprintf(name, sizeof(name), "%016llx-%llu%s",
                  static_cast<unsigned long long>(key.hash()),
                  static_cast<unsigned long long>(generation),
                  RECORD_EXTENSION);
    return name;
}

bool StorageUnit::parse_record_file_name(std::string_view name,
                                         uint64_t& key_hash, uint64_t& generation) {
    std::string_view ext(RECORD_EXTENSION);
    if (name.size() <= 17 + ext.size() || !name.ends_with(ext) || name[16] != '-') {
        return false;
    }

    auto hex = name.substr(0, 16);
    auto gen = name.substr(17, name.size() - 17 - ext.size());
    if (gen.empty()) {
        return false;
    }

    uint64_t h = 0;
    for (char c : hex) {
        h <<= 4;
        if (c >= '0' && c <= '9') h |= static_cast<uint64_t>(c - '0');
        else if (c >= 'a' && c <= 'f') h |= static_cast<uint64_t>(c - 'a' + 10);
        else return false;
    }

    uint64_t g = 0;
    for (char c : gen) {
        if (c < '0' || c > '9') return false;
        g = g * 10 + static_cast<uint64_t>(c - '0');
    }

    key_hash = h;
    generation = g;
    return true;
}

ByteBuffer StorageUnit::encode_record(std::string_view key, const EntryMetadata& meta,
                                      ByteView value) {
    ByteBuffer buf;
    buf.reserve(4 + 2 + 2 + 4 + key.size() + 16 + 4 + value.size() + 8);

    Codec::encode_u32(buf, RECORD_MAGIC);
    Codec::encode_u16(buf, RECORD_VERSION);
    Codec::encode_u16(buf, 0);  // flags
    Codec::encode_string(buf, key);
    Codec::encode_u64(buf, to_unix_millis(meta.created_at));
    Codec::encode_u64(buf, to_unix_millis(meta.updated_at));
    Codec::encode_bytes(buf, value);
    Codec::encode_u64(buf, XXH3_64bits(buf.data(), buf.size()));
    return buf;
}

Status StorageUnit::decode_record(ByteView data, StoredRecord& out) {
    if (data.size() < 8) {
        return Status::error(ErrorCode::Corrupted, "Record too short");
    }

    auto body = data.subspan(0, data.size() - 8);
    auto tail = data.subspan(data.size() - 8);
    try {
        uint64_t checksum = Codec::decode_u64(tail);
        if (checksum != XXH3_64bits(body.data(), body.size())) {
            return Status::error(ErrorCode::Corrupted, "Checksum mismatch");
        }

        if (Codec::decode_u32(body) != RECORD_MAGIC) {
            return Status::error(ErrorCode::Corrupted, "Invalid record magic");
        }
        uint16_t version = Codec::decode_u16(body);
        if (version != RECORD_VERSION) {
            return Status::error(ErrorCode::Corrupted,
                "Unsupported record version " + std::to_string(version));
        }
        Codec::decode_u16(body);  // flags

        out.key = Codec::decode_string(body);
        out.metadata.created_at = from_unix_millis(Codec::decode_u64(body));
        out.metadata.updated_at = from_unix_millis(Codec::decode_u64(body));
        out.value = Codec::decode_bytes(body);
        out.metadata.size_bytes = out.value.size();
    } catch (const std::exception& e) {
        return Status::error(ErrorCode::Corrupted, e.what());
    }
    return Status::make_ok();
}

Status StorageUnit::write_record(const std::string& file, const CacheKey& key,
                                 const EntryMetadata& meta, ByteView value) {
    auto data = encode_record(key.view(), meta, value);
    return write_file_atomic(file, data);
}

Status StorageUnit::read_record(const std::string& file, StoredRecord& out) const {
    ByteBuffer data;
    auto status = read_file(file, data);
    if (!status) {
        return status;
    }
    return decode_record(data, out);
}

Status StorageUnit::remove_record(const std::string& file) {
    auto path = dir_ / file;
    if (::unlink(path.c_str()) != 0) {
        if (errno == ENOENT) {
            return Status::error(ErrorCode::NotFound, path.string());
        }
        return Status::error(ErrorCode::DiskError, errno_message("Failed to delete", path));
    }
    return Status::make_ok();
}

std::vector<std::string> StorageUnit::list_with_extension(const char* ext) const {
    std::vector<std::string> names;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(dir_, ec)) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        auto name = entry.path().filename().string();
        if (name.ends_with(ext)) {
            names.push_back(std::move(name));
        }
    }
    if (ec) {
        FASTBU_LOG_WARN("Failed to list " << dir_.string() << ": " << ec.message());
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> StorageUnit::list_records() const {
    std::vector<std::string> records;
    for (auto& name : list_with_extension(RECORD_EXTENSION)) {
        uint64_t hash, generation;
        if (parse_record_file_name(name, hash, generation)) {
            records.push_back(std::move(name));
        }
    }
    return records;
}

std::vector<std::string> StorageUnit::list_temp_files() const {
    return list_with_extension(TEMP_EXTENSION);
}

size_t StorageUnit::remove_temp_files() {
    size_t removed = 0;
    for (const auto& name : list_temp_files()) {
        auto path = dir_ / name;
        if (::unlink(path.c_str()) == 0) {
            ++removed;
        } else {
            FASTBU_LOG_WARN(errno_message("Failed to remove temp file", path));
        }
    }
    return removed;
}

Status StorageUnit::write_file_atomic(const std::string& name, ByteView data) {
    auto final_path = dir_ / name;
    auto temp_path = dir_ / (name + "." + std::to_string(temp_seq_.fetch_add(1)) + TEMP_EXTENSION);

    int fd = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        return Status::error(ErrorCode::DiskError,
            errno_message("Failed to open file for writing", temp_path));
    }

    auto status = write_all(fd, data, temp_path);
    if (status && sync_writes_ && ::fsync(fd) != 0) {
        status = Status::error(ErrorCode::DiskError, errno_message("fsync failed", temp_path));
    }
    if (::close(fd) != 0 && status) {
        status = Status::error(ErrorCode::DiskError, errno_message("close failed", temp_path));
    }

    if (status && ::rename(temp_path.c_str(), final_path.c_str()) != 0) {
        status = Status::error(ErrorCode::DiskError, errno_message("rename failed", final_path));
    }

    if (!status) {
        ::unlink(temp_path.c_str());
        return status;
    }

    if (sync_writes_) {
        sync_directory(dir_);
    }
    return Status::make_ok();
}

Status StorageUnit::read_file(const std::string& name, ByteBuffer& out) const {
    auto path = dir_ / name;
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        if (errno == ENOENT) {
            return Status::error(ErrorCode::NotFound, path.string());
        }
        return Status::error(ErrorCode::DiskError, errno_message("Failed to open", path));
    }

    struct stat st;
    if (::fstat(fd, &st) != 0) {
        auto status = Status::error(ErrorCode::DiskError, errno_message("fstat failed", path));
        ::close(fd);
        return status;
    }

    out.resize(static_cast<size_t>(st.st_size));
    size_t total_read = 0;
    while (total_read < out.size()) {
        ssize_t n = ::read(fd, out.data() + total_read, out.size() - total_read);
        if (n < 0) {
            if (errno == EINTR) continue;
            auto status = Status::error(ErrorCode::DiskError, errno_message("Read failed", path));
            ::close(fd);
            return status;
        }
        if (n == 0) {
            break;
        }
        total_read += static_cast<size_t>(n);
    }
    ::close(fd);

    out.resize(total_read);
    return Status::make_ok();
}

}  // namespace fastbu
