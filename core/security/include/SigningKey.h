#pragma once

#include "Result.h"
#include "SigningAlgorithm.h"
#include <openssl/evp.h>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace Signet {

struct EvpPkeyDeleter {
    void operator()(EVP_PKEY* pkey) const { EVP_PKEY_free(pkey); }
};

using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;

/**
 * @brief Public half of an RSA key as big-endian modulus and exponent
 */
struct RsaPublicNumbers {
    std::vector<uint8_t> modulus;
    std::vector<uint8_t> exponent;
};

/**
 * @brief Owned RSA private key
 *
 * Instances are immutable and shared between ring snapshots. The private
 * key only leaves the object as PEM for the named-key record.
 */
class SigningKey {
public:
    explicit SigningKey(EvpPkeyPtr pkey);

    SigningKey(const SigningKey&) = delete;
    SigningKey& operator=(const SigningKey&) = delete;

    /**
     * @brief Load a PKCS#8 / traditional RSA private key PEM
     */
    static Result<std::shared_ptr<const SigningKey>> fromPrivatePem(const std::string& pem);

    Result<std::string> privatePem() const;

    Result<RsaPublicNumbers> publicNumbers() const;

    /**
     * @brief Sign data with the digest the algorithm names
     * @return SigningFailed on any OpenSSL error
     */
    Result<std::vector<uint8_t>> sign(const std::string& data, SigningAlgorithm algorithm) const;

    int bits() const;

    EVP_PKEY* get() const { return pkey_.get(); }

private:
    EvpPkeyPtr pkey_;
};

/**
 * @brief Build an RSA public key from modulus and exponent
 */
Result<EvpPkeyPtr> rsaPublicKeyFromNumbers(const RsaPublicNumbers& numbers);

/**
 * @brief Verify a signature made by SigningKey::sign
 * @return false on mismatch or malformed input
 */
bool verifySignature(EVP_PKEY* publicKey, const std::string& data,
                     const std::vector<uint8_t>& signature, SigningAlgorithm algorithm);

/**
 * @brief Most recent OpenSSL error as text, clearing the queue
 */
std::string lastOpenSslError();

} // namespace Signet
