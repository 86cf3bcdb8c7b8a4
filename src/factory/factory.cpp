// Copyright (c) 2025 The XFactory developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <factory/factory.h>

#include <chain/abi.h>
#include <factory/address.h>
#include <factory/bridge_limits.h>
#include <factory/lockbox_linker.h>
#include <util.h>
#include <xerc20/lockbox.h>
#include <xerc20/token.h>

#include <memory>

namespace factory {

std::string DeployStageToString(DeployStage stage)
{
    switch (stage) {
        case DeployStage::START: return "start";
        case DeployStage::VALIDATED: return "validated";
        case DeployStage::TOKEN_CREATED: return "token-created";
        case DeployStage::LIMITS_APPLIED: return "limits-applied";
        case DeployStage::LOCKBOX_CREATED: return "lockbox-created";
        case DeployStage::LINKED: return "linked";
        case DeployStage::OWNERSHIP_TRANSFERRED: return "ownership-transferred";
        case DeployStage::DONE: return "done";
    }
    return "unknown";
}

// ============================================================================
// Constructor
// ============================================================================

XERC20Factory::XERC20Factory(chain::WorldState& world, const uint160& address)
    : world_(world)
    , address_(address)
{
}

// ============================================================================
// Workflows
// ============================================================================

DeployResult XERC20Factory::DeployToken(const uint160& caller, const std::string& name, const std::string& symbol,
                                        const uint160& owner, const uint96& salt)
{
    DeployStage stage = DeployStage::START;
    try {
        chain::AtomicOperation op(world_);
        const chain::ExecutionContext ctx(world_, address_);
        Advance(stage, DeployStage::VALIDATED, "DeployToken");

        const uint160 token = CreateToken(ctx, name, symbol, owner, salt);
        Advance(stage, DeployStage::TOKEN_CREATED, "DeployToken");

        world_.GetContractForWrite<xerc20::XERC20Token>(token).TransferOwnership(ctx, owner);
        Advance(stage, DeployStage::OWNERSHIP_TRANSFERRED, "DeployToken");

        EmitTokenDeployed(ctx, token);

        std::vector<chain::LogEntry> logs = op.Commit();
        Advance(stage, DeployStage::DONE, "DeployToken");

        LogPrint(BCLog::FACTORY, "XERC20Factory: %s deployed token %s (%s) for owner %s\n",
                 caller.ToString(), token.ToString(), symbol, owner.ToString());
        return DeployResult::Success(token, uint160(), std::move(logs));
    } catch (const chain::Revert& e) {
        LogPrintf("XERC20Factory: DeployToken by %s reverted at %s: %s (%s)\n",
                  caller.ToString(), DeployStageToString(stage), e.what(), chain::RevertCodeToString(e.GetCode()));
        return DeployResult::Failure(e.GetCode(), e.what(), stage);
    }
}

DeployResult XERC20Factory::DeployToken(const uint160& caller, const std::string& name, const std::string& symbol,
                                        const std::vector<uint256>& minterLimits, const std::vector<uint160>& bridges)
{
    DeployStage stage = DeployStage::START;
    try {
        chain::AtomicOperation op(world_);
        const chain::ExecutionContext ctx(world_, address_);

        CheckBridgeLimits(minterLimits, bridges);
        Advance(stage, DeployStage::VALIDATED, "DeployToken");

        const uint160 token = CreateToken(ctx, name, symbol, caller, uint96());
        Advance(stage, DeployStage::TOKEN_CREATED, "DeployToken");

        xerc20::XERC20Token& tokenContract = world_.GetContractForWrite<xerc20::XERC20Token>(token);
        ProvisionBridgeLimits(ctx, tokenContract, minterLimits, bridges);
        Advance(stage, DeployStage::LIMITS_APPLIED, "DeployToken");

        tokenContract.TransferOwnership(ctx, caller);
        Advance(stage, DeployStage::OWNERSHIP_TRANSFERRED, "DeployToken");

        EmitTokenDeployed(ctx, token);

        std::vector<chain::LogEntry> logs = op.Commit();
        Advance(stage, DeployStage::DONE, "DeployToken");

        LogPrint(BCLog::FACTORY, "XERC20Factory: %s deployed token %s (%s) with %u bridges\n",
                 caller.ToString(), token.ToString(), symbol, bridges.size());
        return DeployResult::Success(token, uint160(), std::move(logs));
    } catch (const chain::Revert& e) {
        LogPrintf("XERC20Factory: DeployToken by %s reverted at %s: %s (%s)\n",
                  caller.ToString(), DeployStageToString(stage), e.what(), chain::RevertCodeToString(e.GetCode()));
        return DeployResult::Failure(e.GetCode(), e.what(), stage);
    }
}

DeployResult XERC20Factory::DeployLockbox(const uint160& caller, const uint160& token,
                                          const uint160& baseAsset, bool isNative)
{
    DeployStage stage = DeployStage::START;
    try {
        chain::AtomicOperation op(world_);
        const chain::ExecutionContext ctx(world_, address_);

        CheckLockboxMode(baseAsset, isNative);
        Advance(stage, DeployStage::VALIDATED, "DeployLockbox");

        const uint160 lockbox = CreateLockbox(ctx, token, baseAsset, isNative);
        Advance(stage, DeployStage::LOCKBOX_CREATED, "DeployLockbox");

        EmitLockboxDeployed(ctx, lockbox);

        std::vector<chain::LogEntry> logs = op.Commit();
        Advance(stage, DeployStage::DONE, "DeployLockbox");

        LogPrint(BCLog::FACTORY, "XERC20Factory: %s deployed lockbox %s for token %s\n",
                 caller.ToString(), lockbox.ToString(), token.ToString());
        return DeployResult::Success(uint160(), lockbox, std::move(logs));
    } catch (const chain::Revert& e) {
        LogPrintf("XERC20Factory: DeployLockbox by %s reverted at %s: %s (%s)\n",
                  caller.ToString(), DeployStageToString(stage), e.what(), chain::RevertCodeToString(e.GetCode()));
        return DeployResult::Failure(e.GetCode(), e.what(), stage);
    }
}

DeployResult XERC20Factory::DeployTokenWithLockbox(const uint160& caller, const std::string& name,
                                                   const std::string& symbol,
                                                   const std::vector<uint256>& minterLimits,
                                                   const std::vector<uint160>& bridges,
                                                   const uint160& baseAsset, bool isNative)
{
    DeployStage stage = DeployStage::START;
    try {
        chain::AtomicOperation op(world_);
        const chain::ExecutionContext ctx(world_, address_);

        // Fail fast before anything is created
        CheckLockboxMode(baseAsset, isNative);
        CheckBridgeLimits(minterLimits, bridges);
        Advance(stage, DeployStage::VALIDATED, "DeployTokenWithLockbox");

        const uint160 token = CreateToken(ctx, name, symbol, caller, uint96());
        Advance(stage, DeployStage::TOKEN_CREATED, "DeployTokenWithLockbox");

        xerc20::XERC20Token& tokenContract = world_.GetContractForWrite<xerc20::XERC20Token>(token);
        ProvisionBridgeLimits(ctx, tokenContract, minterLimits, bridges);
        Advance(stage, DeployStage::LIMITS_APPLIED, "DeployTokenWithLockbox");

        EmitTokenDeployed(ctx, token);

        const uint160 lockbox = CreateLockbox(ctx, token, baseAsset, isNative);
        Advance(stage, DeployStage::LOCKBOX_CREATED, "DeployTokenWithLockbox");

        EmitLockboxDeployed(ctx, lockbox);

        LinkLockbox(ctx, tokenContract, lockbox);
        Advance(stage, DeployStage::LINKED, "DeployTokenWithLockbox");

        // Ownership goes last; the factory needs it for the steps above
        tokenContract.TransferOwnership(ctx, caller);
        Advance(stage, DeployStage::OWNERSHIP_TRANSFERRED, "DeployTokenWithLockbox");

        std::vector<chain::LogEntry> logs = op.Commit();
        Advance(stage, DeployStage::DONE, "DeployTokenWithLockbox");

        LogPrint(BCLog::FACTORY, "XERC20Factory: %s deployed token %s (%s) with lockbox %s\n",
                 caller.ToString(), token.ToString(), symbol, lockbox.ToString());
        return DeployResult::Success(token, lockbox, std::move(logs));
    } catch (const chain::Revert& e) {
        LogPrintf("XERC20Factory: DeployTokenWithLockbox by %s reverted at %s: %s (%s)\n",
                  caller.ToString(), DeployStageToString(stage), e.what(), chain::RevertCodeToString(e.GetCode()));
        return DeployResult::Failure(e.GetCode(), e.what(), stage);
    }
}

// ============================================================================
// Dry-run queries
// ============================================================================

uint160 XERC20Factory::GetDeployedTokenAddress(const uint160& owner, const uint96& salt,
                                               const std::string& name, const std::string& symbol) const
{
    return ComputeTokenAddress(address_, owner, salt, name, symbol);
}

uint160 XERC20Factory::GetDeployedLockboxAddress(const uint160& token, const uint160& baseAsset, bool isNative) const
{
    return ComputeLockboxAddress(address_, token, baseAsset, isNative);
}

bool XERC20Factory::IsValidLockboxMode(const uint160& baseAsset, bool isNative)
{
    return baseAsset.IsNull() == isNative;
}

// ============================================================================
// Internal steps
// ============================================================================

uint160 XERC20Factory::CreateToken(const chain::ExecutionContext& ctx, const std::string& name,
                                   const std::string& symbol, const uint160& owner, const uint96& salt)
{
    const uint160 token = ComputeTokenAddress(address_, owner, salt, name, symbol);
    ctx.GetWorld().CreateContract(std::make_unique<xerc20::XERC20Token>(token, name, symbol, address_));
    return token;
}

uint160 XERC20Factory::CreateLockbox(const chain::ExecutionContext& ctx, const uint160& token,
                                     const uint160& baseAsset, bool isNative)
{
    const uint160 lockbox = ComputeLockboxAddress(address_, token, baseAsset, isNative);
    ctx.GetWorld().CreateContract(std::make_unique<xerc20::XERC20Lockbox>(lockbox, token, baseAsset, isNative));
    return lockbox;
}

void XERC20Factory::EmitTokenDeployed(const chain::ExecutionContext& ctx, const uint160& token)
{
    ctx.EmitLog(address_, {chain::EventTopic(EVENT_TOKEN_DEPLOYED)},
                chain::AbiEncoder().Address(token).Encode());
}

void XERC20Factory::EmitLockboxDeployed(const chain::ExecutionContext& ctx, const uint160& lockbox)
{
    ctx.EmitLog(address_, {chain::EventTopic(EVENT_LOCKBOX_DEPLOYED)},
                chain::AbiEncoder().Address(lockbox).Encode());
}

void XERC20Factory::CheckLockboxMode(const uint160& baseAsset, bool isNative)
{
    if (!IsValidLockboxMode(baseAsset, isNative)) {
        throw chain::Revert(chain::RevertCode::BAD_TOKEN_ADDRESS,
                            strprintf("bad base asset configuration: baseAsset=%s isNative=%d",
                                      baseAsset.ToString(), isNative));
    }
}

void XERC20Factory::Advance(DeployStage& stage, DeployStage next, const char* workflow) const
{
    LogPrint(BCLog::FACTORY, "XERC20Factory: %s %s -> %s\n",
             workflow, DeployStageToString(stage), DeployStageToString(next));
    stage = next;
}

} // namespace factory
