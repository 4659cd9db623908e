#include "StaticIdentityResolver.h"

namespace Signet {

void StaticIdentityResolver::add(const std::string& accessor, ResolvedIdentity identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    identities_[accessor] = std::move(identity);
}

void StaticIdentityResolver::remove(const std::string& accessor) {
    std::lock_guard<std::mutex> lock(mutex_);
    identities_.erase(accessor);
}

std::optional<ResolvedIdentity> StaticIdentityResolver::resolve(const CallerCredential& credential) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = identities_.find(credential.accessor);
    if (it == identities_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace Signet
