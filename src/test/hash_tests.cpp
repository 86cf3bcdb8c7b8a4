// Copyright (c) 2025 The XFactory developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <hash.h>
#include <test/test_xfactory.h>
#include <utilstrencodings.h>

#include <boost/test/unit_test.hpp>

#include <string>
#include <vector>

BOOST_FIXTURE_TEST_SUITE(hash_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(sha256_known_vectors)
{
    unsigned char out[CSHA256::OUTPUT_SIZE];
    const std::string abc = "abc";

    CSHA256().Write((const unsigned char*)abc.data(), abc.size()).Finalize(out);
    BOOST_CHECK_EQUAL(HexStr(out, out + sizeof(out)),
                      "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    CSHA256().Finalize(out);
    BOOST_CHECK_EQUAL(HexStr(out, out + sizeof(out)),
                      "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

BOOST_AUTO_TEST_CASE(sha256_reset)
{
    unsigned char first[CSHA256::OUTPUT_SIZE];
    unsigned char second[CSHA256::OUTPUT_SIZE];
    const std::string junk = "junk";
    const std::string abc = "abc";

    CSHA256 sha;
    sha.Write((const unsigned char*)abc.data(), abc.size()).Finalize(first);
    sha.Reset().Write((const unsigned char*)junk.data(), junk.size());
    sha.Reset().Write((const unsigned char*)abc.data(), abc.size()).Finalize(second);
    BOOST_CHECK_EQUAL(HexStr(first, first + sizeof(first)), HexStr(second, second + sizeof(second)));
}

BOOST_AUTO_TEST_CASE(double_sha256)
{
    std::vector<unsigned char> empty;
    BOOST_CHECK_EQUAL(Hash(empty).GetHex(),
                      "5df6e0e2761359d30a8275058e299fcc0381534545f55cf43e41983f5d4c9456");
}

BOOST_AUTO_TEST_CASE(hashwriter_is_packed)
{
    uint160 addr = TestAddress(0xb1);
    uint256 word = uint256::FromUint64(7);

    CHashWriter ss;
    ss << uint8_t(0xff) << addr << word << true << std::string("Cat");

    std::vector<unsigned char> packed;
    packed.push_back(0xff);
    packed.insert(packed.end(), addr.begin(), addr.end());
    packed.insert(packed.end(), word.begin(), word.end());
    packed.push_back(0x01);
    packed.push_back('C');
    packed.push_back('a');
    packed.push_back('t');
    BOOST_CHECK_EQUAL(packed.size(), 1U + 20U + 32U + 1U + 3U);

    BOOST_CHECK(ss.GetHash() == Hash(packed));
}

BOOST_AUTO_TEST_SUITE_END()
