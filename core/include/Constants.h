#pragma once

/**
 * @file Constants.h
 * @brief Defaults and storage layout shared across Signet
 */

#include <chrono>
#include <cstddef>

namespace Signet::defaults {

// =============================================================================
// Key rings
// =============================================================================

/// Keys retained per ring unless the verification window needs more
constexpr std::size_t RING_CAPACITY = 4;

/// Largest ring create-key will size; longer windows must rotate less often
constexpr std::size_t RING_MAX_CAPACITY = 1024;

/// RSA modulus size for generated signing keys
constexpr int RSA_KEY_BITS = 2048;

/// Smallest RSA modulus accepted for signing keys
constexpr int RSA_MIN_KEY_BITS = 2048;

/// Rotation period applied when create-key omits one
constexpr const char* ROTATION_PERIOD = "6h";

/// Algorithm applied when create-key omits one
constexpr const char* SIGNING_ALGORITHM = "RS256";

/// Longest accepted rotation period, verification TTL or token TTL (100
/// years of 365 days). Keeps createdAt + duration well inside TimePoint.
constexpr std::chrono::seconds MAX_DURATION{100LL * 365 * 24 * 3600};

// =============================================================================
// Tokens
// =============================================================================

constexpr const char* TOKEN_ISSUER = "signet";
constexpr const char* TOKEN_AUDIENCE = "client_id_of_relying_party";
constexpr std::chrono::seconds TOKEN_TTL{120};

// =============================================================================
// Storage layout
// =============================================================================

constexpr const char* NAMED_KEY_PREFIX = "oidc-config/namedKey/";
constexpr const char* PUBLIC_KEYS_PATH = "oidc-config/publicKeys/";

} // namespace Signet::defaults
