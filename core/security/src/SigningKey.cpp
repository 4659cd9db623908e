/**
 * @file SigningKey.cpp
 * @brief RSA key handling on top of the OpenSSL 3 EVP API
 */

#include "SigningKey.h"
#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/param_build.h>
#include <openssl/pem.h>

namespace Signet {

namespace {

const EVP_MD* digestFor(SigningAlgorithm algorithm) {
    switch (algorithm) {
        case SigningAlgorithm::RS256: return EVP_sha256();
        default: return nullptr;
    }
}

struct BioDeleter {
    void operator()(BIO* bio) const { BIO_free(bio); }
};

struct BnDeleter {
    void operator()(BIGNUM* bn) const { BN_free(bn); }
};

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using BioPtr = std::unique_ptr<BIO, BioDeleter>;
using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

Result<std::vector<uint8_t>> bnParam(EVP_PKEY* pkey, const char* name) {
    BIGNUM* raw = nullptr;
    if (EVP_PKEY_get_bn_param(pkey, name, &raw) <= 0 || !raw) {
        return Error{ErrorCode::InternalError, "unable to read RSA parameter: " + lastOpenSslError()};
    }
    BnPtr bn(raw);
    std::vector<uint8_t> out(static_cast<size_t>(BN_num_bytes(bn.get())));
    BN_bn2bin(bn.get(), out.data());
    return out;
}

} // namespace

std::string lastOpenSslError() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown OpenSSL error";
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    ERR_clear_error();
    return buf;
}

SigningKey::SigningKey(EvpPkeyPtr pkey) : pkey_(std::move(pkey)) {}

Result<std::shared_ptr<const SigningKey>> SigningKey::fromPrivatePem(const std::string& pem) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return Error{ErrorCode::InternalError, "unable to allocate BIO"};
    }

    EVP_PKEY* raw = PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);
    if (!raw) {
        ERR_clear_error();
        return Error{ErrorCode::SerializationFailed, "stored private key is not a valid PEM key"};
    }
    EvpPkeyPtr pkey(raw);
    if (EVP_PKEY_get_base_id(pkey.get()) != EVP_PKEY_RSA) {
        return Error{ErrorCode::SerializationFailed, "stored private key is not an RSA key"};
    }
    return std::shared_ptr<const SigningKey>(std::make_shared<SigningKey>(std::move(pkey)));
}

Result<std::string> SigningKey::privatePem() const {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        return Error{ErrorCode::InternalError, "unable to allocate BIO"};
    }
    if (PEM_write_bio_PrivateKey(bio.get(), pkey_.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        return Error{ErrorCode::SerializationFailed, "unable to encode private key: " + lastOpenSslError()};
    }
    char* data = nullptr;
    long len = BIO_get_mem_data(bio.get(), &data);
    if (len <= 0 || !data) {
        return Error{ErrorCode::SerializationFailed, "empty private key encoding"};
    }
    return std::string(data, static_cast<size_t>(len));
}

Result<RsaPublicNumbers> SigningKey::publicNumbers() const {
    auto n = bnParam(pkey_.get(), OSSL_PKEY_PARAM_RSA_N);
    if (!n) return n.error();
    auto e = bnParam(pkey_.get(), OSSL_PKEY_PARAM_RSA_E);
    if (!e) return e.error();

    RsaPublicNumbers numbers;
    numbers.modulus = std::move(*n);
    numbers.exponent = std::move(*e);
    return numbers;
}

Result<std::vector<uint8_t>> SigningKey::sign(const std::string& data, SigningAlgorithm algorithm) const {
    const EVP_MD* md = digestFor(algorithm);
    if (!md) {
        return Error{ErrorCode::UnsupportedAlgorithm, signingAlgorithmName(algorithm)};
    }

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return Error{ErrorCode::SigningFailed, "unable to allocate digest context"};
    }

    if (EVP_DigestSignInit(ctx.get(), nullptr, md, nullptr, pkey_.get()) != 1) {
        return Error{ErrorCode::SigningFailed, "sign init: " + lastOpenSslError()};
    }

    const auto* in = reinterpret_cast<const unsigned char*>(data.data());
    size_t sigLen = 0;
    if (EVP_DigestSign(ctx.get(), nullptr, &sigLen, in, data.size()) != 1) {
        return Error{ErrorCode::SigningFailed, "sign size: " + lastOpenSslError()};
    }

    std::vector<uint8_t> signature(sigLen);
    if (EVP_DigestSign(ctx.get(), signature.data(), &sigLen, in, data.size()) != 1) {
        return Error{ErrorCode::SigningFailed, "sign: " + lastOpenSslError()};
    }
    signature.resize(sigLen);
    return signature;
}

int SigningKey::bits() const {
    return EVP_PKEY_get_bits(pkey_.get());
}

Result<EvpPkeyPtr> rsaPublicKeyFromNumbers(const RsaPublicNumbers& numbers) {
    if (numbers.modulus.empty() || numbers.exponent.empty()) {
        return Error{ErrorCode::InvalidInput, "RSA public key is missing n or e"};
    }

    BnPtr n(BN_bin2bn(numbers.modulus.data(), static_cast<int>(numbers.modulus.size()), nullptr));
    BnPtr e(BN_bin2bn(numbers.exponent.data(), static_cast<int>(numbers.exponent.size()), nullptr));
    if (!n || !e) {
        return Error{ErrorCode::InternalError, "unable to allocate RSA parameters"};
    }

    OSSL_PARAM_BLD* bld = OSSL_PARAM_BLD_new();
    if (!bld) {
        return Error{ErrorCode::InternalError, "unable to allocate parameter builder"};
    }
    OSSL_PARAM_BLD_push_BN(bld, OSSL_PKEY_PARAM_RSA_N, n.get());
    OSSL_PARAM_BLD_push_BN(bld, OSSL_PKEY_PARAM_RSA_E, e.get());
    OSSL_PARAM* params = OSSL_PARAM_BLD_to_param(bld);
    OSSL_PARAM_BLD_free(bld);
    if (!params) {
        return Error{ErrorCode::InternalError, "unable to build RSA parameters"};
    }

    EVP_PKEY* raw = nullptr;
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_from_name(nullptr, "RSA", nullptr);
    bool built = ctx
        && EVP_PKEY_fromdata_init(ctx) == 1
        && EVP_PKEY_fromdata(ctx, &raw, EVP_PKEY_PUBLIC_KEY, params) == 1;
    EVP_PKEY_CTX_free(ctx);
    OSSL_PARAM_free(params);

    if (!built || !raw) {
        return Error{ErrorCode::InvalidInput, "invalid RSA public key: " + lastOpenSslError()};
    }
    return EvpPkeyPtr(raw);
}

bool verifySignature(EVP_PKEY* publicKey, const std::string& data,
                     const std::vector<uint8_t>& signature, SigningAlgorithm algorithm) {
    const EVP_MD* md = digestFor(algorithm);
    if (!md || !publicKey) {
        return false;
    }

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return false;
    }
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, md, nullptr, publicKey) != 1) {
        ERR_clear_error();
        return false;
    }
    int rc = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                              reinterpret_cast<const unsigned char*>(data.data()), data.size());
    if (rc != 1) {
        ERR_clear_error();
        return false;
    }
    return true;
}

} // namespace Signet
