/**
 * @file RsaKeyGenerator.cpp
 * @brief RSA key pair and key ID generation
 */

#include "KeyGenerator.h"
#include "Constants.h"
#include "Logger.h"
#include "LoggerMacros.h"
#include <openssl/err.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>
#include <cstdio>

namespace Signet {

namespace {

struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};

using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

// Returning 0 from the progress callback makes OpenSSL abandon generation
int keygenProgress(EVP_PKEY_CTX* pctx) {
    const auto* ctx = static_cast<const OperationContext*>(EVP_PKEY_CTX_get_app_data(pctx));
    if (ctx && ctx->done()) {
        return 0;
    }
    return 1;
}

} // namespace

RsaKeyGenerator::RsaKeyGenerator(int bits) : bits_(bits) {}

Result<std::string> RsaKeyGenerator::generateKeyId() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        return Error{ErrorCode::GenerationFailed, "random source failed: " + lastOpenSslError()};
    }

    // RFC 4122 version 4, variant 10
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);

    char buf[37];
    std::snprintf(buf, sizeof(buf),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7],
                  bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14], bytes[15]);
    return std::string(buf);
}

Result<GeneratedKey> RsaKeyGenerator::generate(const OperationContext& ctx) {
    auto& logger = Logger::instance();

    if (bits_ < defaults::RSA_MIN_KEY_BITS) {
        return Error{ErrorCode::GenerationFailed,
                     "RSA key size " + std::to_string(bits_) + " is below the minimum of "
                     + std::to_string(defaults::RSA_MIN_KEY_BITS)};
    }
    if (ctx.done()) {
        return Error{ErrorCode::GenerationFailed, "key generation aborted before start"};
    }
    SCOPED_TIMER_COMP("RSA-" + std::to_string(bits_) + " key generation", "KeyGenerator");

    PkeyCtxPtr pctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
    if (!pctx) {
        return Error{ErrorCode::GenerationFailed, "unable to create key context: " + lastOpenSslError()};
    }
    if (EVP_PKEY_keygen_init(pctx.get()) <= 0) {
        return Error{ErrorCode::GenerationFailed, "keygen init: " + lastOpenSslError()};
    }
    if (EVP_PKEY_CTX_set_rsa_keygen_bits(pctx.get(), bits_) <= 0) {
        return Error{ErrorCode::GenerationFailed, "keygen bits: " + lastOpenSslError()};
    }

    EVP_PKEY_CTX_set_app_data(pctx.get(), const_cast<OperationContext*>(&ctx));
    EVP_PKEY_CTX_set_cb(pctx.get(), keygenProgress);

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(pctx.get(), &raw) <= 0 || !raw) {
        if (ctx.done()) {
            ERR_clear_error();
            logger.log(LogLevel::WARN, "RSA key generation aborted by caller", "KeyGenerator");
            return Error{ErrorCode::GenerationFailed, "key generation aborted"};
        }
        std::string reason = lastOpenSslError();
        logger.log(LogLevel::ERROR, "RSA key generation failed: " + reason, "KeyGenerator");
        return Error{ErrorCode::GenerationFailed, "RSA key generation failed: " + reason};
    }
    EvpPkeyPtr pkey(raw);

    auto keyId = generateKeyId();
    if (!keyId) {
        return keyId.error();
    }

    GeneratedKey generated;
    generated.keyId = std::move(*keyId);
    generated.key = std::make_shared<const SigningKey>(std::move(pkey));
    return generated;
}

} // namespace Signet
