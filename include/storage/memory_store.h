#pragma once

#include "storage/kv_store.h"

#include <map>
#include <mutex>
#include <string>

namespace kvindex {

/// In-memory KVStore on an ordered std::map (byte-wise key order).
/// Thread-safe; used for tests, benchmarks and embedded use without persistence.
class MemoryStore : public KVStore {
public:
    MemoryStore() = default;

    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    using KVStore::read;

    Status write(std::string_view key, const std::vector<uint8_t>& value) override;
    std::pair<Status, std::vector<KVRecord>> read(std::string_view key, const ReadOptions& opts) override;
    Status del(std::string_view key) override;

    size_t size() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<uint8_t>, std::less<>> data_;
};

} // namespace kvindex
