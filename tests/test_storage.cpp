#include <catch2/catch_test_macros.hpp>
#include "fastbu/storage.hpp"
#include "fastbu/index.hpp"
#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>

using namespace fastbu;

// Helper to create a temp directory
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("fastbu_test_" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

namespace {

ByteBuffer bytes(const std::string& s) {
    return ByteBuffer(s.begin(), s.end());
}

EntryMetadata make_meta(uint64_t created_ms, uint64_t updated_ms, uint64_t size) {
    EntryMetadata meta;
    meta.created_at = from_unix_millis(created_ms);
    meta.updated_at = from_unix_millis(updated_ms);
    meta.size_bytes = size;
    return meta;
}

IndexRecord make_record(const std::string& file, uint64_t generation, uint64_t size) {
    IndexRecord rec;
    rec.file = file;
    rec.generation = generation;
    rec.metadata = make_meta(1000, 2000, size);
    return rec;
}

}  // namespace

TEST_CASE("Record file names", "[storage]") {
    CacheKey key("user:42");
    auto name = StorageUnit::record_file_name(key, 7);

    REQUIRE(name.size() == 16 + 1 + 1 + 6);
    REQUIRE(name.ends_with(".cache"));

    uint64_t hash = 0, generation = 0;
    REQUIRE(StorageUnit::parse_record_file_name(name, hash, generation));
    REQUIRE(hash == key.hash());
    REQUIRE(generation == 7);

    REQUIRE(!StorageUnit::parse_record_file_name("cache_index.bin", hash, generation));
    REQUIRE(!StorageUnit::parse_record_file_name("0123456789abcdef-.cache", hash, generation));
    REQUIRE(!StorageUnit::parse_record_file_name("0123456789ABCDEF-1.cache", hash, generation));
    REQUIRE(!StorageUnit::parse_record_file_name("0123456789abcdef-1x.cache", hash, generation));
}

TEST_CASE("Record encoding", "[storage]") {
    auto value = bytes("hello world");
    auto meta = make_meta(1700000000000ULL, 1700000000500ULL, value.size());
    auto data = StorageUnit::encode_record("greeting", meta, value);

    SECTION("Decodes what was encoded") {
        StoredRecord rec;
        REQUIRE(StorageUnit::decode_record(data, rec).ok());
        REQUIRE(rec.key == "greeting");
        REQUIRE(rec.value == value);
        REQUIRE(to_unix_millis(rec.metadata.created_at) == 1700000000000ULL);
        REQUIRE(to_unix_millis(rec.metadata.updated_at) == 1700000000500ULL);
        REQUIRE(rec.metadata.size_bytes == value.size());
    }

    SECTION("Flipped byte is detected") {
        data[data.size() / 2] ^= 0xFF;
        StoredRecord rec;
        REQUIRE(StorageUnit::decode_record(data, rec).code() == ErrorCode::Corrupted);
    }

    SECTION("Truncated record is detected") {
        data.resize(data.size() - 3);
        StoredRecord rec;
        REQUIRE(StorageUnit::decode_record(data, rec).code() == ErrorCode::Corrupted);
    }

    SECTION("Tiny input is detected") {
        ByteBuffer tiny{1, 2, 3};
        StoredRecord rec;
        REQUIRE(StorageUnit::decode_record(tiny, rec).code() == ErrorCode::Corrupted);
    }
}

TEST_CASE("StorageUnit file operations", "[storage]") {
    TempDir tmp;
    StorageUnit storage(tmp.path() / "data", false);
    REQUIRE(storage.init().ok());
    REQUIRE(std::filesystem::is_directory(tmp.path() / "data"));

    CacheKey key("k1");
    auto file = StorageUnit::record_file_name(key, 1);
    auto value = bytes("v1");
    auto meta = make_meta(10, 10, value.size());

    SECTION("Write then read") {
        REQUIRE(storage.write_record(file, key, meta, value).ok());

        StoredRecord rec;
        REQUIRE(storage.read_record(file, rec).ok());
        REQUIRE(rec.key == "k1");
        REQUIRE(rec.value == value);

        // No temp file left behind
        REQUIRE(storage.list_temp_files().empty());
        REQUIRE(storage.list_records() == std::vector<std::string>{file});
    }

    SECTION("Missing record") {
        StoredRecord rec;
        REQUIRE(storage.read_record(file, rec).code() == ErrorCode::NotFound);
        REQUIRE(storage.remove_record(file).code() == ErrorCode::NotFound);
    }

    SECTION("Corrupted record on disk") {
        REQUIRE(storage.write_record(file, key, meta, value).ok());
        {
            std::ofstream out(tmp.path() / "data" / file, std::ios::binary | std::ios::trunc);
            out << "garbage";
        }
        StoredRecord rec;
        REQUIRE(storage.read_record(file, rec).code() == ErrorCode::Corrupted);
    }

    SECTION("Remove record") {
        REQUIRE(storage.write_record(file, key, meta, value).ok());
        REQUIRE(storage.remove_record(file).ok());
        REQUIRE(storage.list_records().empty());
    }

    SECTION("Temp files are listed and removed") {
        {
            std::ofstream out(tmp.path() / "data" / (file + ".3.tmp"));
            out << "partial";
        }
        {
            std::ofstream out(tmp.path() / "data" / "unrelated.txt");
            out << "x";
        }
        REQUIRE(storage.list_temp_files().size() == 1);
        REQUIRE(storage.list_records().empty());
        REQUIRE(storage.remove_temp_files() == 1);
        REQUIRE(storage.list_temp_files().empty());
        REQUIRE(std::filesystem::exists(tmp.path() / "data" / "unrelated.txt"));
    }

    SECTION("Atomic whole-file write replaces content") {
        REQUIRE(storage.write_file_atomic("blob.bin", bytes("first")).ok());
        REQUIRE(storage.write_file_atomic("blob.bin", bytes("second")).ok());

        ByteBuffer out;
        REQUIRE(storage.read_file("blob.bin", out).ok());
        REQUIRE(out == bytes("second"));
    }
}

TEST_CASE("StorageUnit init on a file path fails", "[storage]") {
    TempDir tmp;
    auto path = tmp.path() / "not_a_dir";
    {
        std::ofstream out(path);
        out << "x";
    }
    StorageUnit storage(path, false);
    REQUIRE(storage.init().code() == ErrorCode::DiskError);
}

TEST_CASE("Index operations", "[index]") {
    Index index;

    SECTION("Install and find") {
        REQUIRE(!index.install("a", make_record("a-1", 1, 10)));
        auto found = index.find("a");
        REQUIRE(found);
        REQUIRE(found->file == "a-1");
        REQUIRE(index.size() == 1);
        REQUIRE(index.total_bytes() == 10);
    }

    SECTION("Replacing keeps created_at and returns the previous record") {
        index.install("a", make_record("a-1", 1, 10));

        auto next = make_record("a-2", 2, 4);
        next.metadata.created_at = from_unix_millis(5000);
        auto previous = index.install("a", next);

        REQUIRE(previous);
        REQUIRE(previous->file == "a-1");
        auto found = index.find("a");
        REQUIRE(found->file == "a-2");
        REQUIRE(to_unix_millis(found->metadata.created_at) == 1000);
        REQUIRE(index.total_bytes() == 4);
    }

    SECTION("Erase") {
        index.install("a", make_record("a-1", 1, 10));
        REQUIRE(index.erase("a"));
        REQUIRE(!index.erase("a"));
        REQUIRE(index.size() == 0);
        REQUIRE(index.total_bytes() == 0);
    }

    SECTION("Conditional erase only matches the current file") {
        index.install("a", make_record("a-2", 2, 10));
        REQUIRE(!index.erase_if("a", "a-1"));
        REQUIRE(index.find("a"));
        REQUIRE(index.erase_if("a", "a-2"));
        REQUIRE(!index.find("a"));
    }

    SECTION("Compare-and-swap rollback") {
        index.install("a", make_record("a-2", 2, 10));

        // Roll back to the previous record
        REQUIRE(index.replace_if("a", "a-2", make_record("a-1", 1, 5)));
        REQUIRE(index.find("a")->file == "a-1");

        // Stale expectation is refused
        REQUIRE(!index.replace_if("a", "a-2", std::nullopt));

        // Empty expectation requires absence
        REQUIRE(!index.replace_if("a", "", make_record("a-3", 3, 1)));
        REQUIRE(index.replace_if("b", "", make_record("b-1", 4, 1)));
        REQUIRE(index.size() == 2);
        REQUIRE(index.total_bytes() == 6);
    }

    SECTION("Versions increase with every mutation") {
        auto v0 = index.version();
        index.install("a", make_record("a-1", 1, 1));
        auto v1 = index.version();
        index.erase("a");
        auto v2 = index.version();
        REQUIRE(v0 < v1);
        REQUIRE(v1 < v2);

        // A miss does not count
        index.erase("a");
        REQUIRE(index.version() == v2);
    }

    SECTION("Generations stay ahead of installed records") {
        index.install("a", make_record("a-40", 40, 1));
        REQUIRE(index.next_generation() == 41);
        index.observe_generation(10);
        REQUIRE(index.next_generation() == 42);
    }
}

TEST_CASE("Index snapshot and load", "[index]") {
    Index index;
    index.install("alpha", make_record("f-1", 1, 100));
    index.install("beta", make_record("f-9", 9, 50));
    auto snap = index.snapshot();
    REQUIRE(snap.version == index.version());

    SECTION("Loads into an empty index") {
        Index restored;
        restored.load(snap.data);

        REQUIRE(restored.size() == 2);
        REQUIRE(restored.total_bytes() == 150);
        REQUIRE(restored.version() == index.version());
        REQUIRE(restored.find("beta")->file == "f-9");
        REQUIRE(to_unix_millis(restored.find("alpha")->metadata.updated_at) == 2000);
        REQUIRE(restored.next_generation() == 10);
    }

    SECTION("Corrupted snapshot throws") {
        snap.data[12] ^= 0x01;
        Index restored;
        REQUIRE_THROWS_AS(restored.load(snap.data), std::runtime_error);
        REQUIRE(restored.size() == 0);
    }

    SECTION("Truncated snapshot throws") {
        Index restored;
        ByteBuffer cut(snap.data.begin(), snap.data.begin() + 4);
        REQUIRE_THROWS_AS(restored.load(cut), std::runtime_error);
    }
}
