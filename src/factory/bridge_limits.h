// Copyright (c) 2025 The XFactory developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef XFACTORY_FACTORY_BRIDGE_LIMITS_H
#define XFACTORY_FACTORY_BRIDGE_LIMITS_H

#include <chain/world_state.h>
#include <uint256.h>

#include <vector>

namespace xerc20 {
class XERC20Token;
}

namespace factory {

/**
 * (bridge, mint limit) pair applied to a freshly created token. The
 * burn limit is always provisioned as zero.
 */
struct BridgeLimitEntry {
    uint160 bridge;
    uint256 mintLimit;
};

/**
 * Check that minterLimits and bridges pair up one to one.
 * @throws chain::Revert INVALID_LENGTH on a length mismatch
 */
void CheckBridgeLimits(const std::vector<uint256>& minterLimits, const std::vector<uint160>& bridges);

/**
 * Zip the parallel arrays into entries, preserving order and duplicates.
 * @throws chain::Revert INVALID_LENGTH on a length mismatch
 */
std::vector<BridgeLimitEntry> MakeBridgeLimitEntries(const std::vector<uint256>& minterLimits,
                                                     const std::vector<uint160>& bridges);

/**
 * Apply every (bridge, limit) pair to the token as an independent
 * SetLimits(bridge, limit, 0) call, in order. A bridge listed twice ends
 * up with its last limit. Nothing is applied on a length mismatch.
 *
 * ctx must carry the token owner as sender.
 */
void ProvisionBridgeLimits(const chain::ExecutionContext& ctx, xerc20::XERC20Token& token,
                           const std::vector<uint256>& minterLimits, const std::vector<uint160>& bridges);

} // namespace factory

#endif // XFACTORY_FACTORY_BRIDGE_LIMITS_H
