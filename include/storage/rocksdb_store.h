#pragma once

#include "storage/kv_store.h"

#include <memory>
#include <string>

namespace rocksdb {
    class DB;
    class Options;
    class ReadOptions;
    class WriteOptions;
}

namespace kvindex {

/// Persistent KVStore backed by RocksDB.
/// Keys are kept in RocksDB's default bytewise order, which the index key
/// encoding relies on for ordered prefix scans.
class RocksDBStore : public KVStore {
public:
    struct Config {
        std::string db_path = "./data/kvindex";

        size_t memtable_size_mb = 64;
        size_t block_cache_size_mb = 256;
        int bloom_bits_per_key = 10;
        bool enable_wal = true;       // sync writes through the WAL
        int max_background_jobs = 2;

        // Values: "none", "lz4", "zstd", "snappy", "zlib" (best-effort; depends on RocksDB build)
        std::string compression = "none";
    };

    explicit RocksDBStore(const Config& config);
    ~RocksDBStore() override;

    RocksDBStore(const RocksDBStore&) = delete;
    RocksDBStore& operator=(const RocksDBStore&) = delete;

    /// Open the database (creates directories as needed)
    bool open();

    /// Close the database
    void close();

    bool isOpen() const;

    using KVStore::read;

    Status write(std::string_view key, const std::vector<uint8_t>& value) override;
    std::pair<Status, std::vector<KVRecord>> read(std::string_view key, const ReadOptions& opts) override;
    Status del(std::string_view key) override;

    /// Flush memtable to disk
    void flush();

    const Config& getConfig() const { return config_; }

private:
    Config config_;
    std::unique_ptr<rocksdb::DB> db_;
    std::unique_ptr<rocksdb::Options> options_;
    std::unique_ptr<rocksdb::ReadOptions> read_options_;
    std::unique_ptr<rocksdb::WriteOptions> write_options_;

    void configureOptions();
};

} // namespace kvindex
