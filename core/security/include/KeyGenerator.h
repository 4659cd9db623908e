#pragma once

#include "OperationContext.h"
#include "Result.h"
#include "SigningKey.h"
#include <memory>
#include <string>

namespace Signet {

/**
 * @brief Freshly generated key pair and its identifier
 */
struct GeneratedKey {
    std::string keyId;
    std::shared_ptr<const SigningKey> key;
};

/**
 * @brief Source of new signing keys
 */
class IKeyGenerator {
public:
    virtual ~IKeyGenerator() = default;

    /**
     * @brief Generate a key pair and a globally unique key ID
     * @return GenerationFailed if key construction fails or ctx is done
     */
    virtual Result<GeneratedKey> generate(const OperationContext& ctx) = 0;
};

/**
 * @brief RSA key generator backed by OpenSSL
 *
 * Generation observes the caller's context through the OpenSSL progress
 * callback, so a cancelled or expired context aborts prime search instead
 * of running to completion.
 */
class RsaKeyGenerator : public IKeyGenerator {
public:
    explicit RsaKeyGenerator(int bits = 2048);

    Result<GeneratedKey> generate(const OperationContext& ctx) override;

    int bits() const { return bits_; }

    /**
     * @brief Random UUIDv4 string
     */
    static Result<std::string> generateKeyId();

private:
    int bits_;
};

} // namespace Signet
