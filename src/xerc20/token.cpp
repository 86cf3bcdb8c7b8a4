// Copyright (c) 2025 The XFactory developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <xerc20/token.h>

#include <chain/abi.h>
#include <chain/revert.h>
#include <hash.h>
#include <util.h>

namespace xerc20 {

XERC20Token::XERC20Token(const uint160& address, const std::string& name,
                         const std::string& symbol, const uint160& factory)
    : chain::Contract(address, Hash(InitCode(name, symbol, factory)))
    , name_(name)
    , symbol_(symbol)
    , factory_(factory)
    , owner_(factory)
{
}

const std::vector<unsigned char>& XERC20Token::CreationCode()
{
    static const std::string tag = "XERC20/token/v1";
    static const std::vector<unsigned char> code(tag.begin(), tag.end());
    return code;
}

std::vector<unsigned char> XERC20Token::InitCode(const std::string& name,
                                                 const std::string& symbol,
                                                 const uint160& factory)
{
    std::vector<unsigned char> initCode = CreationCode();
    std::vector<unsigned char> args = chain::AbiEncoder()
        .String(name)
        .String(symbol)
        .Address(factory)
        .Encode();
    initCode.insert(initCode.end(), args.begin(), args.end());
    return initCode;
}

std::unique_ptr<chain::Contract> XERC20Token::Clone() const
{
    return std::make_unique<XERC20Token>(*this);
}

BridgeParameters XERC20Token::GetBridge(const uint160& bridge) const
{
    auto it = bridges_.find(bridge);
    if (it != bridges_.end()) {
        return it->second;
    }
    return BridgeParameters();
}

uint256 XERC20Token::MintingMaxLimitOf(const uint160& bridge) const
{
    return GetBridge(bridge).mintLimit;
}

uint256 XERC20Token::BurningMaxLimitOf(const uint160& bridge) const
{
    return GetBridge(bridge).burnLimit;
}

std::vector<uint160> XERC20Token::GetBridges() const
{
    std::vector<uint160> result;
    result.reserve(bridges_.size());
    for (const auto& entry : bridges_) {
        result.push_back(entry.first);
    }
    return result;
}

void XERC20Token::CheckOwner(const chain::ExecutionContext& ctx, const char* function) const
{
    if (ctx.GetSender() != owner_) {
        LogPrint(BCLog::TOKEN, "XERC20Token %s: %s rejected, caller %s is not owner %s\n",
                 GetAddress().ToString(), function, ctx.GetSender().ToString(), owner_.ToString());
        throw chain::Revert(chain::RevertCode::UNAUTHORIZED,
                            strprintf("%s: caller %s is not the owner", function, ctx.GetSender().ToString()));
    }
}

void XERC20Token::TransferOwnership(const chain::ExecutionContext& ctx, const uint160& newOwner)
{
    CheckOwner(ctx, "TransferOwnership");
    if (newOwner.IsNull()) {
        throw chain::Revert(chain::RevertCode::INVALID_OWNER, "TransferOwnership: new owner is the zero address");
    }

    const uint160 previousOwner = owner_;
    owner_ = newOwner;

    ctx.EmitLog(GetAddress(),
                {chain::EventTopic(EVENT_OWNERSHIP_TRANSFERRED)},
                chain::AbiEncoder().Address(previousOwner).Address(newOwner).Encode());

    LogPrint(BCLog::TOKEN, "XERC20Token %s: ownership %s -> %s\n",
             GetAddress().ToString(), previousOwner.ToString(), newOwner.ToString());
}

void XERC20Token::SetLimits(const chain::ExecutionContext& ctx, const uint160& bridge,
                            const uint256& mintLimit, const uint256& burnLimit)
{
    CheckOwner(ctx, "SetLimits");

    BridgeParameters& params = bridges_[bridge];
    params.mintLimit = mintLimit;
    params.burnLimit = burnLimit;

    ctx.EmitLog(GetAddress(),
                {chain::EventTopic(EVENT_BRIDGE_LIMITS_SET)},
                chain::AbiEncoder().Uint(mintLimit).Uint(burnLimit).Address(bridge).Encode());

    LogPrint(BCLog::TOKEN, "XERC20Token %s: limits for bridge %s set to mint=%s burn=%s\n",
             GetAddress().ToString(), bridge.ToString(), mintLimit.ToString(), burnLimit.ToString());
}

void XERC20Token::SetLockbox(const chain::ExecutionContext& ctx, const uint160& lockbox)
{
    CheckOwner(ctx, "SetLockbox");

    lockbox_ = lockbox;

    ctx.EmitLog(GetAddress(),
                {chain::EventTopic(EVENT_LOCKBOX_SET)},
                chain::AbiEncoder().Address(lockbox).Encode());

    LogPrint(BCLog::TOKEN, "XERC20Token %s: lockbox set to %s\n",
             GetAddress().ToString(), lockbox.ToString());
}

} // namespace xerc20
