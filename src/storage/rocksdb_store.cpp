#include "storage/rocksdb_store.h"
#include "utils/logger.h"
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/iterator.h>
#include <rocksdb/table.h>
#include <rocksdb/filter_policy.h>
#include <rocksdb/cache.h>
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace kvindex {

RocksDBStore::RocksDBStore(const Config& config) : config_(config) {
    options_ = std::make_unique<rocksdb::Options>();
    read_options_ = std::make_unique<rocksdb::ReadOptions>();
    write_options_ = std::make_unique<rocksdb::WriteOptions>();
    configureOptions();
}

RocksDBStore::~RocksDBStore() {
    close();
}

void RocksDBStore::configureOptions() {
    options_->create_if_missing = true;

    // Memtable (write buffer)
    options_->write_buffer_size = config_.memtable_size_mb * 1024 * 1024;

    // Block cache + Bloom filter for point lookups
    rocksdb::BlockBasedTableOptions table_options;
    table_options.block_cache = rocksdb::NewLRUCache(config_.block_cache_size_mb * 1024 * 1024);
    table_options.filter_policy.reset(rocksdb::NewBloomFilterPolicy(config_.bloom_bits_per_key, false));
    options_->table_factory.reset(rocksdb::NewBlockBasedTableFactory(table_options));

    options_->max_background_jobs = config_.max_background_jobs;

    auto toCompression = [](const std::string& s) {
        std::string v = s;
        std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        if (v == "lz4") return rocksdb::kLZ4Compression;
        if (v == "zstd") return rocksdb::kZSTD;
        if (v == "snappy") return rocksdb::kSnappyCompression;
        if (v == "zlib") return rocksdb::kZlibCompression;
        return rocksdb::kNoCompression;
    };
    options_->compression = toCompression(config_.compression);

    write_options_->sync = config_.enable_wal;
}

bool RocksDBStore::open() {
    if (db_) return true;

    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(config_.db_path), ec);
    if (ec) {
        KVINDEX_ERROR("Failed to create DB directory '{}': {}", config_.db_path, ec.message());
        return false;
    }

    rocksdb::DB* raw = nullptr;
    rocksdb::Status status = rocksdb::DB::Open(*options_, config_.db_path, &raw);
    if (!status.ok()) {
        KVINDEX_ERROR("Failed to open RocksDB at {}: {}", config_.db_path, status.ToString());
        return false;
    }

    db_.reset(raw);
    KVINDEX_INFO("Opened RocksDB at: {}", config_.db_path);
    return true;
}

void RocksDBStore::close() {
    if (db_) {
        KVINDEX_INFO("Closing RocksDB");
        db_.reset();
    }
}

bool RocksDBStore::isOpen() const {
    return db_ != nullptr;
}

Status RocksDBStore::write(std::string_view key, const std::vector<uint8_t>& value) {
    if (!db_) return Status::Error(ErrorCode::StoreError, "write: Datenbank ist nicht geöffnet");

    rocksdb::Status status = db_->Put(
        *write_options_,
        rocksdb::Slice(key.data(), key.size()),
        rocksdb::Slice(reinterpret_cast<const char*>(value.data()), value.size())
    );
    if (!status.ok()) {
        return Status::Error(ErrorCode::StoreError, "write '" + std::string(key) + "': " + status.ToString());
    }
    return Status::OK();
}

std::pair<Status, std::vector<KVRecord>> RocksDBStore::read(std::string_view key, const ReadOptions& opts) {
    std::vector<KVRecord> out;
    if (!db_) return {Status::Error(ErrorCode::StoreError, "read: Datenbank ist nicht geöffnet"), {}};

    if (!opts.prefix) {
        std::string value;
        rocksdb::Status status = db_->Get(*read_options_, rocksdb::Slice(key.data(), key.size()), &value);
        if (status.IsNotFound()) return {Status::OK(), {}};
        if (!status.ok()) {
            return {Status::Error(ErrorCode::StoreError, "read '" + std::string(key) + "': " + status.ToString()), {}};
        }
        if (opts.offset <= 0) {
            out.push_back(KVRecord{std::string(key), std::vector<uint8_t>(value.begin(), value.end())});
        }
        return {Status::OK(), std::move(out)};
    }

    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(*read_options_));
    rocksdb::Slice prefix_slice(key.data(), key.size());
    int64_t skipped = 0;

    for (it->Seek(prefix_slice); it->Valid() && it->key().starts_with(prefix_slice); it->Next()) {
        if (skipped < opts.offset) {
            ++skipped;
            continue;
        }
        const rocksdb::Slice k = it->key();
        const rocksdb::Slice v = it->value();
        out.push_back(KVRecord{k.ToString(), std::vector<uint8_t>(v.data(), v.data() + v.size())});
        if (opts.limit > 0 && static_cast<int64_t>(out.size()) >= opts.limit) break;
    }
    if (!it->status().ok()) {
        return {Status::Error(ErrorCode::StoreError, "scan '" + std::string(key) + "': " + it->status().ToString()), {}};
    }
    return {Status::OK(), std::move(out)};
}

Status RocksDBStore::del(std::string_view key) {
    if (!db_) return Status::Error(ErrorCode::StoreError, "del: Datenbank ist nicht geöffnet");

    rocksdb::Status status = db_->Delete(*write_options_, rocksdb::Slice(key.data(), key.size()));
    if (!status.ok()) {
        return Status::Error(ErrorCode::StoreError, "del '" + std::string(key) + "': " + status.ToString());
    }
    return Status::OK();
}

void RocksDBStore::flush() {
    if (!db_) return;

    rocksdb::FlushOptions options;
    rocksdb::Status status = db_->Flush(options);
    if (!status.ok()) {
        KVINDEX_WARN("RocksDB flush failed: {}", status.ToString());
    }
}

} // namespace kvindex
