// Copyright (c) 2025 The XFactory developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <chain/revert.h>

namespace chain {

std::string RevertCodeToString(RevertCode code)
{
    switch (code) {
        case RevertCode::NONE: return "none";
        case RevertCode::DEPLOYMENT_COLLISION: return "deployment-collision";
        case RevertCode::UNAUTHORIZED: return "unauthorized";
        case RevertCode::INVALID_OWNER: return "invalid-owner";
        case RevertCode::BAD_TOKEN_ADDRESS: return "bad-token-address";
        case RevertCode::INVALID_LENGTH: return "invalid-length";
        case RevertCode::CONTRACT_NOT_FOUND: return "contract-not-found";
    }
    return "unknown";
}

Revert::Revert(RevertCode code, const std::string& message)
    : std::runtime_error(message)
    , code_(code)
{
}

} // namespace chain
