#pragma once

#include "utils/status.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kvindex {

/// One stored key/value pair as returned by KVStore::read
struct KVRecord {
    std::string key;
    std::vector<uint8_t> value;
};

/// Abstract ordered key-value store the index model is built on.
/// Implementations must return scan results in ascending byte order of the key.
class KVStore {
public:
    struct ReadOptions {
        bool prefix = false;   // false: exakter Key, true: Prefix-Scan
        int64_t offset = 0;    // Anzahl zu überspringender Treffer
        int64_t limit = 0;     // 0 = unbegrenzt
    };

    virtual ~KVStore() = default;

    /// Upsert
    virtual Status write(std::string_view key, const std::vector<uint8_t>& value) = 0;

    /// Exact lookup or prefix scan; an exact miss is an empty list, not an error
    virtual std::pair<Status, std::vector<KVRecord>> read(std::string_view key, const ReadOptions& opts) = 0;

    /// Deleting a missing key is not an error
    virtual Status del(std::string_view key) = 0;

    std::pair<Status, std::vector<KVRecord>> read(std::string_view key) {
        return read(key, ReadOptions{});
    }

    std::pair<Status, std::vector<KVRecord>> scanPrefix(std::string_view prefix, int64_t offset = 0, int64_t limit = 0) {
        ReadOptions opts;
        opts.prefix = true;
        opts.offset = offset;
        opts.limit = limit;
        return read(prefix, opts);
    }
};

} // namespace kvindex
