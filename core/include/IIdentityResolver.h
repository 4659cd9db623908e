#pragma once

#include <optional>
#include <string>
#include <vector>

namespace Signet {

/**
 * @brief Credential presented by the caller of issue-token
 */
struct CallerCredential {
    std::string accessor;           // Token accessor used for lookup
};

/**
 * @brief Identity the credential resolves to
 *
 * entityId is the token subject. A credential that is not bound to an
 * entity (root or anonymous tokens) resolves to an empty entityId.
 */
struct ResolvedIdentity {
    std::string entityId;
    std::string displayName;
    std::vector<std::string> policies;
    std::string authPath;
    std::string namespaceId;
};

/**
 * @brief Identity-resolution collaborator
 */
class IIdentityResolver {
public:
    virtual ~IIdentityResolver() = default;

    /**
     * @return std::nullopt if the credential is unknown
     */
    virtual std::optional<ResolvedIdentity> resolve(const CallerCredential& credential) = 0;
};

} // namespace Signet
