#pragma once

#include "IIdentityResolver.h"
#include <map>
#include <mutex>
#include <string>

namespace Signet {

/**
 * @brief Resolver backed by a fixed accessor table
 *
 * Used by signet_cli, where identities come from the command line, and by
 * tests.
 */
class StaticIdentityResolver : public IIdentityResolver {
public:
    void add(const std::string& accessor, ResolvedIdentity identity);
    void remove(const std::string& accessor);

    std::optional<ResolvedIdentity> resolve(const CallerCredential& credential) override;

private:
    std::map<std::string, ResolvedIdentity> identities_;
    std::mutex mutex_;
};

} // namespace Signet
