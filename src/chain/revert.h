// Copyright (c) 2025 The XFactory developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef XFACTORY_CHAIN_REVERT_H
#define XFACTORY_CHAIN_REVERT_H

#include <cstdint>
#include <stdexcept>
#include <string>

namespace chain {

/**
 * Reasons a transaction is reverted.
 *
 * A revert discards every pending effect of the enclosing atomic
 * operation; none of these conditions is retried.
 */
enum class RevertCode : uint8_t {
    NONE = 0x00,
    DEPLOYMENT_COLLISION = 0x01,  // Target address already occupied
    UNAUTHORIZED = 0x02,          // Caller is not the contract owner
    INVALID_OWNER = 0x03,         // Ownership handed to the zero address
    BAD_TOKEN_ADDRESS = 0x04,     // Base asset and native flag disagree
    INVALID_LENGTH = 0x05,        // Parallel arrays differ in length
    CONTRACT_NOT_FOUND = 0x06,    // No contract of the expected kind at address
};

/** Stable identifier of a revert code, e.g. "deployment-collision" */
std::string RevertCodeToString(RevertCode code);

/**
 * Thrown by contract code and the chain model to abort the current
 * transaction. Caught at the transaction boundary.
 */
class Revert : public std::runtime_error {
public:
    Revert(RevertCode code, const std::string& message);

    RevertCode GetCode() const { return code_; }

private:
    RevertCode code_;
};

} // namespace chain

#endif // XFACTORY_CHAIN_REVERT_H
