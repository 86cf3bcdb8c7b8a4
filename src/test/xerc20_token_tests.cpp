// Copyright (c) 2025 The XFactory developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <chain/abi.h>
#include <chain/revert.h>
#include <chain/world_state.h>
#include <hash.h>
#include <test/test_xfactory.h>
#include <xerc20/lockbox.h>
#include <xerc20/token.h>

#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <memory>
#include <vector>

using namespace chain;
using namespace xerc20;

namespace {

const uint160 FACTORY = TestAddress(0xfac7);
const uint160 TOKEN = TestAddress(0x70);
const uint160 ALICE = TestAddress(0xa11ce);
const uint160 BRIDGE = TestAddress(0xb1);

/** A committed token owned by the factory */
struct TokenTestingSetup : public BasicTestingSetup {
    WorldState world;

    TokenTestingSetup() : world(1)
    {
        AtomicOperation op(world);
        world.CreateContract(std::make_unique<XERC20Token>(TOKEN, "Cat", "CAT", FACTORY));
        op.Commit();
    }

    std::shared_ptr<const XERC20Token> Token() const
    {
        return world.GetContract<XERC20Token>(TOKEN);
    }
};

bool IsUnauthorized(const Revert& e) { return e.GetCode() == RevertCode::UNAUTHORIZED; }
bool IsInvalidOwner(const Revert& e) { return e.GetCode() == RevertCode::INVALID_OWNER; }

} // namespace

BOOST_FIXTURE_TEST_SUITE(xerc20_token_tests, TokenTestingSetup)

BOOST_AUTO_TEST_CASE(construction)
{
    std::shared_ptr<const XERC20Token> token = Token();
    BOOST_REQUIRE(token);
    BOOST_CHECK(token->GetType() == ContractType::XERC20_TOKEN);
    BOOST_CHECK_EQUAL(token->GetName(), "Cat");
    BOOST_CHECK_EQUAL(token->GetSymbol(), "CAT");
    BOOST_CHECK(token->GetOwner() == FACTORY);
    BOOST_CHECK(token->GetFactory() == FACTORY);
    BOOST_CHECK(token->GetLockbox().IsNull());
    BOOST_CHECK(token->GetBridges().empty());
    BOOST_CHECK(token->GetCodeHash() == Hash(XERC20Token::InitCode("Cat", "CAT", FACTORY)));

    // Unknown bridges read as zero limits
    BOOST_CHECK(token->GetBridge(BRIDGE) == BridgeParameters());
}

BOOST_AUTO_TEST_CASE(init_code_starts_with_creation_code)
{
    const std::vector<unsigned char>& creation = XERC20Token::CreationCode();
    std::vector<unsigned char> init = XERC20Token::InitCode("Cat", "CAT", FACTORY);
    BOOST_REQUIRE(init.size() > creation.size());
    BOOST_CHECK(std::equal(creation.begin(), creation.end(), init.begin()));

    BOOST_CHECK(XERC20Token::CreationCode() != XERC20Lockbox::CreationCode());
}

BOOST_AUTO_TEST_CASE(owner_sets_limits)
{
    AtomicOperation op(world);
    ExecutionContext ctx(world, FACTORY);
    XERC20Token& token = world.GetContractForWrite<XERC20Token>(TOKEN);

    token.SetLimits(ctx, BRIDGE, uint256::FromUint64(100), uint256::FromUint64(7));
    BOOST_CHECK_EQUAL(token.MintingMaxLimitOf(BRIDGE).GetLow64(), 100U);
    BOOST_CHECK_EQUAL(token.BurningMaxLimitOf(BRIDGE).GetLow64(), 7U);

    // Every call overwrites both fields
    token.SetLimits(ctx, BRIDGE, uint256::FromUint64(200), uint256());
    BOOST_CHECK_EQUAL(token.MintingMaxLimitOf(BRIDGE).GetLow64(), 200U);
    BOOST_CHECK(token.BurningMaxLimitOf(BRIDGE).IsNull());
    BOOST_CHECK_EQUAL(token.GetBridges().size(), 1U);

    std::vector<LogEntry> logs = op.Commit();
    BOOST_REQUIRE_EQUAL(logs.size(), 2U);
    BOOST_CHECK(logs[1].contractAddress == TOKEN);
    BOOST_CHECK(logs[1].topics[0] == EventTopic(EVENT_BRIDGE_LIMITS_SET));

    uint256 mint;
    uint160 bridge;
    BOOST_CHECK(DecodeUintWord(logs[1].data, 0, mint));
    BOOST_CHECK(DecodeAddressWord(logs[1].data, 2, bridge));
    BOOST_CHECK_EQUAL(mint.GetLow64(), 200U);
    BOOST_CHECK(bridge == BRIDGE);
}

BOOST_AUTO_TEST_CASE(non_owner_is_rejected)
{
    AtomicOperation op(world);
    ExecutionContext ctx(world, ALICE);
    XERC20Token& token = world.GetContractForWrite<XERC20Token>(TOKEN);

    BOOST_CHECK_EXCEPTION(token.SetLimits(ctx, BRIDGE, uint256::FromUint64(1), uint256()), Revert, IsUnauthorized);
    BOOST_CHECK_EXCEPTION(token.SetLockbox(ctx, TestAddress(0x10c)), Revert, IsUnauthorized);
    BOOST_CHECK_EXCEPTION(token.TransferOwnership(ctx, ALICE), Revert, IsUnauthorized);

    BOOST_CHECK(token.GetOwner() == FACTORY);
    BOOST_CHECK(token.GetLockbox().IsNull());
    BOOST_CHECK(token.GetBridges().empty());
}

BOOST_AUTO_TEST_CASE(ownership_transfer)
{
    {
        AtomicOperation op(world);
        ExecutionContext ctx(world, FACTORY);
        XERC20Token& token = world.GetContractForWrite<XERC20Token>(TOKEN);

        BOOST_CHECK_EXCEPTION(token.TransferOwnership(ctx, uint160()), Revert, IsInvalidOwner);
        token.TransferOwnership(ctx, ALICE);
        BOOST_CHECK(token.GetOwner() == ALICE);

        // The factory lost its rights
        BOOST_CHECK_EXCEPTION(token.SetLockbox(ctx, TestAddress(0x10c)), Revert, IsUnauthorized);

        std::vector<LogEntry> logs = op.Commit();
        BOOST_REQUIRE_EQUAL(logs.size(), 1U);
        uint160 previous, next;
        BOOST_CHECK(DecodeAddressWord(logs[0].data, 0, previous));
        BOOST_CHECK(DecodeAddressWord(logs[0].data, 1, next));
        BOOST_CHECK(previous == FACTORY);
        BOOST_CHECK(next == ALICE);
    }

    BOOST_CHECK(Token()->GetOwner() == ALICE);

    AtomicOperation op(world);
    ExecutionContext ctx(world, ALICE);
    world.GetContractForWrite<XERC20Token>(TOKEN).SetLockbox(ctx, TestAddress(0x10c));
    op.Commit();
    BOOST_CHECK(Token()->GetLockbox() == TestAddress(0x10c));
}

BOOST_AUTO_TEST_CASE(lockbox_slot_holds_one_value)
{
    AtomicOperation op(world);
    ExecutionContext ctx(world, FACTORY);
    XERC20Token& token = world.GetContractForWrite<XERC20Token>(TOKEN);

    token.SetLockbox(ctx, TestAddress(0x10c));
    token.SetLockbox(ctx, TestAddress(0x10d));
    BOOST_CHECK(token.GetLockbox() == TestAddress(0x10d));

    std::vector<LogEntry> logs = op.Commit();
    BOOST_REQUIRE_EQUAL(logs.size(), 2U);
    BOOST_CHECK(logs[0].topics[0] == EventTopic(EVENT_LOCKBOX_SET));
}

BOOST_AUTO_TEST_CASE(lockbox_contract)
{
    XERC20Lockbox erc20Box(TestAddress(1), TOKEN, TestAddress(0xba), false);
    BOOST_CHECK(erc20Box.GetType() == ContractType::XERC20_LOCKBOX);
    BOOST_CHECK(erc20Box.GetToken() == TOKEN);
    BOOST_CHECK(erc20Box.GetBaseAsset() == TestAddress(0xba));
    BOOST_CHECK(!erc20Box.IsNative());

    std::unique_ptr<Contract> copy = erc20Box.Clone();
    BOOST_CHECK(copy->GetAddress() == erc20Box.GetAddress());
    BOOST_CHECK(copy->GetCodeHash() == Hash(XERC20Lockbox::InitCode(TOKEN, TestAddress(0xba), false)));
    BOOST_CHECK_EQUAL(ContractTypeToString(copy->GetType()), ContractTypeToString(ContractType::XERC20_LOCKBOX));
}

BOOST_AUTO_TEST_SUITE_END()
