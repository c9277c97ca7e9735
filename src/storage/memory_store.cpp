#include "storage/memory_store.h"

namespace kvindex {

Status MemoryStore::write(std::string_view key, const std::vector<uint8_t>& value) {
    if (key.empty()) return Status::Error(ErrorCode::StoreError, "write: key darf nicht leer sein");
    std::lock_guard<std::mutex> lock(mutex_);
    data_.insert_or_assign(std::string(key), value);
    return Status::OK();
}

std::pair<Status, std::vector<KVRecord>> MemoryStore::read(std::string_view key, const ReadOptions& opts) {
    std::vector<KVRecord> out;
    std::lock_guard<std::mutex> lock(mutex_);

    if (!opts.prefix) {
        auto it = data_.find(key);
        if (it != data_.end() && opts.offset <= 0) {
            out.push_back(KVRecord{it->first, it->second});
        }
        return {Status::OK(), std::move(out)};
    }

    int64_t skipped = 0;
    for (auto it = data_.lower_bound(key); it != data_.end(); ++it) {
        if (it->first.compare(0, key.size(), key) != 0) break;
        if (skipped < opts.offset) {
            ++skipped;
            continue;
        }
        out.push_back(KVRecord{it->first, it->second});
        if (opts.limit > 0 && static_cast<int64_t>(out.size()) >= opts.limit) break;
    }
    return {Status::OK(), std::move(out)};
}

Status MemoryStore::del(std::string_view key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key);
    if (it != data_.end()) data_.erase(it);
    return Status::OK();
}

size_t MemoryStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.size();
}

void MemoryStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.clear();
}

} // namespace kvindex
