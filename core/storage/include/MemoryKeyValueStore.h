#pragma once

#include "IKeyValueStore.h"
#include <map>
#include <mutex>

namespace Signet {

/**
 * @brief In-process key-value store backed by an ordered map
 */
class MemoryKeyValueStore : public IKeyValueStore {
public:
    Result<std::optional<std::string>> get(const std::string& key) override;
    Result<void> put(const std::string& key, const std::string& value) override;
    Result<void> remove(const std::string& key) override;
    Result<std::vector<std::string>> list(const std::string& prefix) override;

    size_t size() const;

private:
    std::map<std::string, std::string> entries_;
    mutable std::mutex mutex_;
};

} // namespace Signet
