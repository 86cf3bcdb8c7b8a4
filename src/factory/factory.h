// Copyright (c) 2025 The XFactory developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef XFACTORY_FACTORY_FACTORY_H
#define XFACTORY_FACTORY_FACTORY_H

/**
 * @file factory.h
 * @brief XERC20 deployment orchestrator
 *
 * The factory creates XERC20 tokens and lockboxes at deterministic
 * addresses and wires them together. It is stateless: its only
 * contribution to the address scheme is its own address, which must be
 * the same on every chain for the cross-chain guarantee to hold.
 *
 * Each entry point runs as one atomic operation on the world state. The
 * factory owns a new token from construction until the final
 * TransferOwnership step, so limit provisioning and lockbox linkage run
 * with the factory as sender.
 */

#include <chain/contract.h>
#include <chain/revert.h>
#include <chain/world_state.h>
#include <uint256.h>

#include <string>
#include <vector>

namespace factory {

/** Event signatures emitted by the factory */
static const char* const EVENT_TOKEN_DEPLOYED = "TokenDeployed(address)";
static const char* const EVENT_LOCKBOX_DEPLOYED = "LockboxDeployed(address)";

/**
 * Progress of one workflow invocation.
 *
 * START -> VALIDATED -> TOKEN_CREATED -> LIMITS_APPLIED? ->
 * LOCKBOX_CREATED? -> LINKED? -> OWNERSHIP_TRANSFERRED -> DONE
 */
enum class DeployStage : uint8_t {
    START,
    VALIDATED,
    TOKEN_CREATED,
    LIMITS_APPLIED,
    LOCKBOX_CREATED,
    LINKED,
    OWNERSHIP_TRANSFERRED,
    DONE,
};

std::string DeployStageToString(DeployStage stage);

/**
 * @brief Result of a factory workflow
 *
 * On failure, stage is the last stage reached before the revert and no
 * effect of the workflow is visible in the world state.
 */
struct DeployResult {
    /** Whether the workflow committed */
    bool success;

    /** Revert reason if failed */
    chain::RevertCode code;

    /** Error message if failed */
    std::string error;

    DeployStage stage;

    /** Created token (null for lockbox-only workflows) */
    uint160 token;

    /** Created lockbox (null for token-only workflows) */
    uint160 lockbox;

    /** Logs committed by the workflow, in emission order */
    std::vector<chain::LogEntry> logs;

    DeployResult() : success(false), code(chain::RevertCode::NONE), stage(DeployStage::START) {}

    static DeployResult Success(const uint160& tokenAddr, const uint160& lockboxAddr,
                                std::vector<chain::LogEntry> committedLogs) {
        DeployResult result;
        result.success = true;
        result.stage = DeployStage::DONE;
        result.token = tokenAddr;
        result.lockbox = lockboxAddr;
        result.logs = std::move(committedLogs);
        return result;
    }

    static DeployResult Failure(chain::RevertCode revertCode, const std::string& err, DeployStage reached) {
        DeployResult result;
        result.success = false;
        result.code = revertCode;
        result.error = err;
        result.stage = reached;
        return result;
    }
};

/**
 * @brief XERC20 Factory
 *
 * Four workflows: token only, token with bridge limits, lockbox only,
 * and token with limits and a linked lockbox. All arguments arrive as
 * direct call arguments; `caller` is the message sender.
 */
class XERC20Factory {
public:
    /**
     * @param world The chain the factory is deployed on
     * @param address The factory's own address, identical on every chain
     */
    XERC20Factory(chain::WorldState& world, const uint160& address);

    const uint160& GetAddress() const { return address_; }

    /**
     * @brief Deploy a token for an explicit (owner, salt) pair
     *
     * The address is derived from (owner, salt, name, symbol) and the
     * token is handed to `owner` once created. Reverts with
     * DEPLOYMENT_COLLISION when the same arguments were used before.
     */
    DeployResult DeployToken(const uint160& caller, const std::string& name, const std::string& symbol,
                             const uint160& owner, const uint96& salt);

    /**
     * @brief Deploy a token owned by the caller and provision bridge limits
     *
     * Uses the zero discriminator with the caller as salt owner, so each
     * (caller, name, symbol) maps to one canonical address.
     */
    DeployResult DeployToken(const uint160& caller, const std::string& name, const std::string& symbol,
                             const std::vector<uint256>& minterLimits, const std::vector<uint160>& bridges);

    /**
     * @brief Deploy a lockbox for a token without linking it
     *
     * Reverts with BAD_TOKEN_ADDRESS unless exactly one of
     * {baseAsset is null, isNative} holds.
     */
    DeployResult DeployLockbox(const uint160& caller, const uint160& token,
                               const uint160& baseAsset, bool isNative);

    /**
     * @brief Deploy a token with limits and a linked lockbox
     *
     * Order: validate, create token, provision limits, emit
     * TokenDeployed, create lockbox, emit LockboxDeployed, link lockbox,
     * transfer ownership to the caller.
     */
    DeployResult DeployTokenWithLockbox(const uint160& caller, const std::string& name, const std::string& symbol,
                                        const std::vector<uint256>& minterLimits, const std::vector<uint160>& bridges,
                                        const uint160& baseAsset, bool isNative);

    /** Address DeployToken(.., owner, salt) would create, without deploying */
    uint160 GetDeployedTokenAddress(const uint160& owner, const uint96& salt,
                                    const std::string& name, const std::string& symbol) const;

    /** Address DeployLockbox(.., token, baseAsset, isNative) would create, without deploying */
    uint160 GetDeployedLockboxAddress(const uint160& token, const uint160& baseAsset, bool isNative) const;

    /** Whether (baseAsset, isNative) describes a valid lockbox mode */
    static bool IsValidLockboxMode(const uint160& baseAsset, bool isNative);

private:
    uint160 CreateToken(const chain::ExecutionContext& ctx, const std::string& name, const std::string& symbol,
                        const uint160& owner, const uint96& salt);
    uint160 CreateLockbox(const chain::ExecutionContext& ctx, const uint160& token,
                          const uint160& baseAsset, bool isNative);

    void EmitTokenDeployed(const chain::ExecutionContext& ctx, const uint160& token);
    void EmitLockboxDeployed(const chain::ExecutionContext& ctx, const uint160& lockbox);

    static void CheckLockboxMode(const uint160& baseAsset, bool isNative);

    void Advance(DeployStage& stage, DeployStage next, const char* workflow) const;

    chain::WorldState& world_;
    const uint160 address_;
};

} // namespace factory

#endif // XFACTORY_FACTORY_FACTORY_H
