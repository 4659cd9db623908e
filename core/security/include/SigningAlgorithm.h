#pragma once

#include "Result.h"
#include <string>

namespace Signet {

/**
 * @brief Signing algorithms a named key may use
 *
 * RS256 (RSASSA-PKCS1-v1_5 with SHA-256) is currently the only member.
 */
enum class SigningAlgorithm {
    RS256 = 0
};

const char* signingAlgorithmName(SigningAlgorithm algorithm);

/**
 * @brief Parse a JOSE algorithm name ("RS256")
 * @return UnsupportedAlgorithm for anything not in the enumeration
 */
Result<SigningAlgorithm> parseSigningAlgorithm(const std::string& name);

} // namespace Signet
