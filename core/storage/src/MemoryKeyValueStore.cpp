#include "MemoryKeyValueStore.h"

namespace Signet {

Result<std::optional<std::string>> MemoryKeyValueStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::optional<std::string>{};
    }
    return std::optional<std::string>{it->second};
}

Result<void> MemoryKeyValueStore::put(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = value;
    return Ok();
}

Result<void> MemoryKeyValueStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(key);
    return Ok();
}

Result<std::vector<std::string>> MemoryKeyValueStore::list(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    for (auto it = entries_.lower_bound(prefix); it != entries_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) break;
        keys.push_back(it->first);
    }
    return keys;
}

size_t MemoryKeyValueStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace Signet
