// Copyright (c) 2025 The XFactory developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <factory/address.h>
#include <hash.h>
#include <test/test_xfactory.h>
#include <xerc20/lockbox.h>
#include <xerc20/token.h>

#include <boost/test/unit_test.hpp>

#include <set>
#include <string>
#include <vector>

using namespace factory;

BOOST_FIXTURE_TEST_SUITE(address_tests, BasicTestingSetup)

static const uint160 FACTORY = TestAddress(0xfac7);

BOOST_AUTO_TEST_CASE(token_salt_layout)
{
    const uint160 owner = uint160S("0x1111111111111111111111111111111111111111");
    const uint96 disc = uint96S("0x000000000000000000000001");

    uint256 salt = MakeTokenSalt(owner, disc);
    BOOST_CHECK_EQUAL(salt.GetHex(), "1111111111111111111111111111111111111111" "000000000000000000000001");

    // Zero discriminator leaves the low-order bytes empty
    uint256 canonical = MakeTokenSalt(owner, uint96());
    for (unsigned int i = uint160::size(); i < uint256::size(); i++) {
        BOOST_CHECK_EQUAL(canonical.begin()[i], 0);
    }
}

BOOST_AUTO_TEST_CASE(lockbox_salt_is_packed_hash)
{
    const uint160 token = TestAddress(0x70);
    const uint160 base = TestAddress(0xba);

    CHashWriter expected;
    expected << token << base << false;
    BOOST_CHECK(MakeLockboxSalt(token, base, false) == expected.GetHash());

    BOOST_CHECK(MakeLockboxSalt(token, uint160(), true) != MakeLockboxSalt(token, uint160(), false));
}

BOOST_AUTO_TEST_CASE(create2_formula)
{
    const uint256 salt = InsecureRand256();
    const std::vector<unsigned char> initCode = {0x60, 0x80, 0x60, 0x40};

    std::vector<unsigned char> preimage;
    preimage.push_back(0xff);
    preimage.insert(preimage.end(), FACTORY.begin(), FACTORY.end());
    preimage.insert(preimage.end(), salt.begin(), salt.end());
    const uint256 codeHash = Hash(initCode);
    preimage.insert(preimage.end(), codeHash.begin(), codeHash.end());
    BOOST_CHECK_EQUAL(preimage.size(), 85U);

    const uint256 hash = Hash(preimage);
    const uint160 expected(std::vector<unsigned char>(hash.begin() + 12, hash.end()));
    BOOST_CHECK(ComputeCreate2Address(FACTORY, salt, initCode) == expected);
}

BOOST_AUTO_TEST_CASE(token_address_is_deterministic)
{
    for (int i = 0; i < 50; i++) {
        const uint160 factory = InsecureRandAddress();
        const uint160 owner = InsecureRandAddress();
        const uint96 disc = InsecureRandSalt();

        uint160 first = ComputeTokenAddress(factory, owner, disc, "Cat", "CAT");
        uint160 second = ComputeTokenAddress(factory, owner, disc, "Cat", "CAT");
        BOOST_CHECK(first == second);
        BOOST_CHECK(!first.IsNull());
        BOOST_CHECK(first == ComputeCreate2Address(factory, MakeTokenSalt(owner, disc),
                                                   xerc20::XERC20Token::InitCode("Cat", "CAT", factory)));
    }
}

BOOST_AUTO_TEST_CASE(every_token_input_changes_the_address)
{
    const uint160 owner = TestAddress(0xa11ce);
    const uint96 disc = uint96S("0x01");

    std::set<uint160> seen;
    seen.insert(ComputeTokenAddress(FACTORY, owner, disc, "Cat", "CAT"));
    seen.insert(ComputeTokenAddress(TestAddress(0xfac8), owner, disc, "Cat", "CAT"));
    seen.insert(ComputeTokenAddress(FACTORY, TestAddress(0xb0b), disc, "Cat", "CAT"));
    seen.insert(ComputeTokenAddress(FACTORY, owner, uint96S("0x02"), "Cat", "CAT"));
    seen.insert(ComputeTokenAddress(FACTORY, owner, disc, "Dog", "CAT"));
    seen.insert(ComputeTokenAddress(FACTORY, owner, disc, "Cat", "DOG"));
    // Swapping name and symbol is a different init code
    seen.insert(ComputeTokenAddress(FACTORY, owner, disc, "CAT", "Cat"));
    BOOST_CHECK_EQUAL(seen.size(), 7U);
}

BOOST_AUTO_TEST_CASE(lockbox_address_has_no_owner_component)
{
    const uint160 token = TestAddress(0x70);
    const uint160 base = TestAddress(0xba);

    uint160 lockbox = ComputeLockboxAddress(FACTORY, token, base, false);
    BOOST_CHECK(lockbox == ComputeLockboxAddress(FACTORY, token, base, false));
    BOOST_CHECK(lockbox == ComputeCreate2Address(FACTORY, MakeLockboxSalt(token, base, false),
                                                 xerc20::XERC20Lockbox::InitCode(token, base, false)));

    std::set<uint160> seen;
    seen.insert(lockbox);
    seen.insert(ComputeLockboxAddress(FACTORY, TestAddress(0x71), base, false));
    seen.insert(ComputeLockboxAddress(FACTORY, token, TestAddress(0xbb), false));
    seen.insert(ComputeLockboxAddress(FACTORY, token, uint160(), true));
    seen.insert(ComputeLockboxAddress(TestAddress(0xfac8), token, base, false));
    BOOST_CHECK_EQUAL(seen.size(), 5U);
}

BOOST_AUTO_TEST_SUITE_END()
