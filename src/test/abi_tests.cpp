// Copyright (c) 2025 The XFactory developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <chain/abi.h>
#include <test/test_xfactory.h>

#include <boost/test/unit_test.hpp>

#include <string>
#include <vector>

using namespace chain;

BOOST_FIXTURE_TEST_SUITE(abi_tests, BasicTestingSetup)

/** Word `index` of encoded data as a uint256 */
static uint256 Word(const std::vector<unsigned char>& data, size_t index)
{
    uint256 value;
    BOOST_REQUIRE(DecodeUintWord(data, index, value));
    return value;
}

BOOST_AUTO_TEST_CASE(static_values_take_one_word)
{
    const uint160 addr = TestAddress(0xb1);
    std::vector<unsigned char> encoded = AbiEncoder()
        .Address(addr)
        .Uint(uint256::FromUint64(100))
        .Bool(true)
        .Encode();

    BOOST_CHECK_EQUAL(encoded.size(), 3 * ABI_WORD_SIZE);

    // Addresses are left-padded with zeros
    for (size_t i = 0; i < 12; i++) {
        BOOST_CHECK_EQUAL(encoded[i], 0);
    }
    uint160 decoded;
    BOOST_CHECK(DecodeAddressWord(encoded, 0, decoded));
    BOOST_CHECK(decoded == addr);

    BOOST_CHECK_EQUAL(Word(encoded, 1).GetLow64(), 100U);
    BOOST_CHECK_EQUAL(Word(encoded, 2).GetLow64(), 1U);
}

BOOST_AUTO_TEST_CASE(strings_go_to_the_tail)
{
    const uint160 factory = TestAddress(0xfac7);
    std::vector<unsigned char> encoded = AbiEncoder()
        .String("Cat")
        .String("CAT")
        .Address(factory)
        .Encode();

    // Head: two offsets and the address. Tail: length and padded contents per string.
    BOOST_CHECK_EQUAL(encoded.size(), 7 * ABI_WORD_SIZE);
    BOOST_CHECK_EQUAL(Word(encoded, 0).GetLow64(), 3 * ABI_WORD_SIZE);
    BOOST_CHECK_EQUAL(Word(encoded, 1).GetLow64(), 5 * ABI_WORD_SIZE);

    uint160 decoded;
    BOOST_CHECK(DecodeAddressWord(encoded, 2, decoded));
    BOOST_CHECK(decoded == factory);

    BOOST_CHECK_EQUAL(Word(encoded, 3).GetLow64(), 3U);
    BOOST_CHECK_EQUAL(std::string(encoded.begin() + 4 * ABI_WORD_SIZE, encoded.begin() + 4 * ABI_WORD_SIZE + 3), "Cat");
    for (size_t i = 4 * ABI_WORD_SIZE + 3; i < 5 * ABI_WORD_SIZE; i++) {
        BOOST_CHECK_EQUAL(encoded[i], 0);
    }
    BOOST_CHECK_EQUAL(Word(encoded, 5).GetLow64(), 3U);
}

BOOST_AUTO_TEST_CASE(empty_and_word_sized_strings)
{
    std::vector<unsigned char> empty = AbiEncoder().String("").Encode();
    BOOST_CHECK_EQUAL(empty.size(), 2 * ABI_WORD_SIZE);
    BOOST_CHECK(Word(empty, 1).IsNull());

    std::vector<unsigned char> exact = AbiEncoder().String(std::string(32, 'x')).Encode();
    BOOST_CHECK_EQUAL(exact.size(), 3 * ABI_WORD_SIZE);
    BOOST_CHECK_EQUAL(Word(exact, 1).GetLow64(), 32U);
}

BOOST_AUTO_TEST_CASE(decode_out_of_range)
{
    std::vector<unsigned char> encoded = AbiEncoder().Bool(false).Encode();
    uint256 value;
    uint160 addr;
    BOOST_CHECK(DecodeUintWord(encoded, 0, value));
    BOOST_CHECK(!DecodeUintWord(encoded, 1, value));
    BOOST_CHECK(!DecodeAddressWord(encoded, 1, addr));
    BOOST_CHECK_EQUAL(AbiEncoder().Bool(false).Uint(uint256()).GetParamCount(), 2U);
}

BOOST_AUTO_TEST_SUITE_END()
