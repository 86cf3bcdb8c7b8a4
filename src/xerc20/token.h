// Copyright (c) 2025 The XFactory developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef XFACTORY_XERC20_TOKEN_H
#define XFACTORY_XERC20_TOKEN_H

/**
 * @file token.h
 * @brief XERC20 token, modelled at its administrative interface
 *
 * The token is a bridge-mintable ERC20. Only the parts the factory
 * drives are modelled here: identity, a single administrative owner,
 * per-bridge limit records and the active lockbox slot. The mint/burn
 * rate-limiting state machine lives elsewhere.
 */

#include <chain/contract.h>
#include <chain/world_state.h>
#include <uint256.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace xerc20 {

/** Event signatures emitted by the token */
static const char* const EVENT_OWNERSHIP_TRANSFERRED = "OwnershipTransferred(address,address)";
static const char* const EVENT_BRIDGE_LIMITS_SET = "BridgeLimitsSet(uint256,uint256,address)";
static const char* const EVENT_LOCKBOX_SET = "LockboxSet(address)";

/**
 * @brief Limit record of one bridge
 *
 * A single mutable record per bridge; every SetLimits call overwrites
 * both fields.
 */
struct BridgeParameters {
    /** Maximum outstanding amount the bridge may mint */
    uint256 mintLimit;

    /** Maximum amount the bridge may burn */
    uint256 burnLimit;

    bool operator==(const BridgeParameters& other) const {
        return mintLimit == other.mintLimit && burnLimit == other.burnLimit;
    }
};

/**
 * @brief XERC20 token contract
 *
 * Constructed with the deploying factory as owner. Every mutating call
 * is owner-only and reverts with UNAUTHORIZED otherwise.
 */
class XERC20Token : public chain::Contract {
public:
    XERC20Token(const uint160& address, const std::string& name,
                const std::string& symbol, const uint160& factory);

    /** Fingerprint of the token's creation bytecode */
    static const std::vector<unsigned char>& CreationCode();

    /** Creation bytecode followed by the ABI-encoded constructor arguments */
    static std::vector<unsigned char> InitCode(const std::string& name,
                                               const std::string& symbol,
                                               const uint160& factory);

    chain::ContractType GetType() const override { return chain::ContractType::XERC20_TOKEN; }
    std::unique_ptr<chain::Contract> Clone() const override;

    const std::string& GetName() const { return name_; }
    const std::string& GetSymbol() const { return symbol_; }
    const uint160& GetOwner() const { return owner_; }
    const uint160& GetFactory() const { return factory_; }

    /** Active lockbox, null if none linked */
    const uint160& GetLockbox() const { return lockbox_; }

    /** Limit record of a bridge; both limits are zero for unknown bridges */
    BridgeParameters GetBridge(const uint160& bridge) const;

    uint256 MintingMaxLimitOf(const uint160& bridge) const;
    uint256 BurningMaxLimitOf(const uint160& bridge) const;

    /** Bridges with a limit record, in address order */
    std::vector<uint160> GetBridges() const;

    /**
     * @brief Hand administrative rights to a new owner
     * @throws chain::Revert UNAUTHORIZED, INVALID_OWNER for the zero address
     */
    void TransferOwnership(const chain::ExecutionContext& ctx, const uint160& newOwner);

    /**
     * @brief Overwrite the limit record of a bridge
     * @throws chain::Revert UNAUTHORIZED
     */
    void SetLimits(const chain::ExecutionContext& ctx, const uint160& bridge,
                   const uint256& mintLimit, const uint256& burnLimit);

    /**
     * @brief Replace the active lockbox
     * @throws chain::Revert UNAUTHORIZED
     */
    void SetLockbox(const chain::ExecutionContext& ctx, const uint160& lockbox);

private:
    void CheckOwner(const chain::ExecutionContext& ctx, const char* function) const;

    std::string name_;
    std::string symbol_;
    uint160 factory_;
    uint160 owner_;
    uint160 lockbox_;
    std::map<uint160, BridgeParameters> bridges_;
};

} // namespace xerc20

#endif // XFACTORY_XERC20_TOKEN_H
