// Copyright (c) 2025 The XFactory developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <test/test_xfactory.h>
#include <uint256.h>
#include <utilstrencodings.h>

#include <boost/test/unit_test.hpp>

#include <string>
#include <vector>

BOOST_FIXTURE_TEST_SUITE(uint256_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(blob_sizes)
{
    BOOST_CHECK_EQUAL(uint96::size(), 12U);
    BOOST_CHECK_EQUAL(uint160::size(), 20U);
    BOOST_CHECK_EQUAL(uint256::size(), 32U);
}

BOOST_AUTO_TEST_CASE(sethex_left_pads)
{
    uint160 addr = uint160S("0xb1");
    BOOST_CHECK(!addr.IsNull());
    BOOST_CHECK_EQUAL(addr.GetHex(), "00000000000000000000000000000000000000b1");
    BOOST_CHECK_EQUAL(addr.ToString(), "0x00000000000000000000000000000000000000b1");
    BOOST_CHECK(addr == TestAddress(0xb1));

    // Prefix is optional
    BOOST_CHECK(uint160S("b1") == addr);

    uint256 full = uint256S("0x0102030405060708091011121314151617181920212223242526272829303132");
    BOOST_CHECK_EQUAL(full.begin()[0], 0x01);
    BOOST_CHECK_EQUAL(full.begin()[31], 0x32);
}

BOOST_AUTO_TEST_CASE(null_and_ordering)
{
    uint160 zero;
    BOOST_CHECK(zero.IsNull());
    BOOST_CHECK(zero == uint160S("0x0"));

    uint160 a = TestAddress(1);
    uint160 b = TestAddress(2);
    BOOST_CHECK(a < b);
    BOOST_CHECK(!(b < a));
    BOOST_CHECK(a != b);

    a.SetNull();
    BOOST_CHECK(a.IsNull());
}

BOOST_AUTO_TEST_CASE(vector_constructor_right_aligns)
{
    std::vector<unsigned char> vch = {0xab, 0xcd};
    uint256 word(vch);
    BOOST_CHECK_EQUAL(word.begin()[30], 0xab);
    BOOST_CHECK_EQUAL(word.begin()[31], 0xcd);
    BOOST_CHECK_EQUAL(word.GetLow64(), 0xabcdU);
}

BOOST_AUTO_TEST_CASE(uint64_conversion)
{
    uint256 word = uint256::FromUint64(100);
    BOOST_CHECK_EQUAL(word.GetLow64(), 100U);
    BOOST_CHECK_EQUAL(word.GetHex(), std::string(62, '0') + "64");
    BOOST_CHECK(uint256::FromUint64(0).IsNull());

    for (int i = 0; i < 100; i++) {
        uint64_t n = g_insecure_rand_ctx();
        BOOST_CHECK_EQUAL(uint256::FromUint64(n).GetLow64(), n);
    }
}

BOOST_AUTO_TEST_CASE(hex_helpers)
{
    BOOST_CHECK(IsHex("0x00ff"));
    BOOST_CHECK(IsHex("abCD"));
    BOOST_CHECK(!IsHex(""));
    BOOST_CHECK(!IsHex("0x"));
    BOOST_CHECK(!IsHex("abc"));
    BOOST_CHECK(!IsHex("0xzz"));

    std::vector<unsigned char> expected = {0x00, 0xff, 0x10};
    BOOST_CHECK(ParseHex("0x00ff10") == expected);
    BOOST_CHECK_EQUAL(HexStr(expected), "00ff10");

    int64_t n = 0;
    BOOST_CHECK(ParseInt64("42", &n));
    BOOST_CHECK_EQUAL(n, 42);
    BOOST_CHECK(!ParseInt64("42x", &n));
    BOOST_CHECK(!ParseInt64("", &n));
    BOOST_CHECK(!ParseInt64("99999999999999999999", &n));

    // Bytes above 0x7f are rejected rather than classified as whitespace
    BOOST_CHECK(!ParseInt64("\xe9" "5", &n));
    BOOST_CHECK(!ParseInt64("5\xff", &n));
    BOOST_CHECK(ParseHex("\xa0" "ff").empty());
    BOOST_CHECK(uint160S("\xa0" "b1").IsNull());
    BOOST_CHECK(uint160S("\xff" "x" "b1").IsNull());
}

BOOST_AUTO_TEST_SUITE_END()
