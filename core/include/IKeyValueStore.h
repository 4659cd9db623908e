#pragma once

#include "Result.h"
#include <optional>
#include <string>
#include <vector>

namespace Signet {

/**
 * @brief Storage collaborator used for all persisted records
 *
 * Reads and writes are synchronous and strongly consistent for a single
 * key. Implementations must be safe to call from several threads.
 */
class IKeyValueStore {
public:
    virtual ~IKeyValueStore() = default;

    /**
     * @brief Read a value
     * @return std::nullopt inside the result when the key is absent
     */
    virtual Result<std::optional<std::string>> get(const std::string& key) = 0;

    /**
     * @brief Insert or replace a value
     */
    virtual Result<void> put(const std::string& key, const std::string& value) = 0;

    /**
     * @brief Delete a key; deleting an absent key succeeds
     */
    virtual Result<void> remove(const std::string& key) = 0;

    /**
     * @brief Keys starting with prefix, in ascending byte order
     */
    virtual Result<std::vector<std::string>> list(const std::string& prefix) = 0;
};

} // namespace Signet
