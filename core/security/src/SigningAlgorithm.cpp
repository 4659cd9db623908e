#include "SigningAlgorithm.h"

namespace Signet {

const char* signingAlgorithmName(SigningAlgorithm algorithm) {
    switch (algorithm) {
        case SigningAlgorithm::RS256: return "RS256";
        default: return "unknown";
    }
}

Result<SigningAlgorithm> parseSigningAlgorithm(const std::string& name) {
    if (name == "RS256") {
        return SigningAlgorithm::RS256;
    }
    return Error{ErrorCode::UnsupportedAlgorithm, "unknown signing algorithm \"" + name + "\""};
}

} // namespace Signet
