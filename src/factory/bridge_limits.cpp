// Copyright (c) 2025 The XFactory developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <factory/bridge_limits.h>

#include <chain/revert.h>
#include <util.h>
#include <xerc20/token.h>

namespace factory {

void CheckBridgeLimits(const std::vector<uint256>& minterLimits, const std::vector<uint160>& bridges)
{
    if (minterLimits.size() != bridges.size()) {
        throw chain::Revert(chain::RevertCode::INVALID_LENGTH,
                            strprintf("length mismatch: %u minter limits for %u bridges",
                                      minterLimits.size(), bridges.size()));
    }
}

std::vector<BridgeLimitEntry> MakeBridgeLimitEntries(const std::vector<uint256>& minterLimits,
                                                     const std::vector<uint160>& bridges)
{
    CheckBridgeLimits(minterLimits, bridges);

    std::vector<BridgeLimitEntry> entries;
    entries.reserve(bridges.size());
    for (size_t i = 0; i < bridges.size(); i++) {
        entries.push_back({bridges[i], minterLimits[i]});
    }
    return entries;
}

void ProvisionBridgeLimits(const chain::ExecutionContext& ctx, xerc20::XERC20Token& token,
                           const std::vector<uint256>& minterLimits, const std::vector<uint160>& bridges)
{
    const std::vector<BridgeLimitEntry> entries = MakeBridgeLimitEntries(minterLimits, bridges);

    for (const BridgeLimitEntry& entry : entries) {
        token.SetLimits(ctx, entry.bridge, entry.mintLimit, uint256());
    }

    LogPrint(BCLog::FACTORY, "Provisioned %u bridge limits on token %s\n",
             entries.size(), token.GetAddress().ToString());
}

} // namespace factory
