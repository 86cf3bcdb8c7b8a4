// Copyright (c) 2025 The XFactory developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef XFACTORY_CHAIN_ABI_H
#define XFACTORY_CHAIN_ABI_H

#include <uint256.h>

#include <cstdint>
#include <string>
#include <vector>

namespace chain {

/** Size of one ABI word */
static constexpr size_t ABI_WORD_SIZE = 32;

/**
 * Encoder for the standard contract ABI argument layout.
 *
 * Static values take one 32-byte word in the head. Dynamic values
 * (strings) place an offset in the head and their length-prefixed,
 * zero-padded contents in the tail.
 */
class AbiEncoder {
public:
    AbiEncoder& Address(const uint160& address);
    AbiEncoder& Uint(const uint256& value);
    AbiEncoder& Bool(bool value);
    AbiEncoder& String(const std::string& value);

    std::vector<unsigned char> Encode() const;

    size_t GetParamCount() const { return params_.size(); }

private:
    struct Param {
        bool dynamic;
        std::vector<unsigned char> data;
    };
    std::vector<Param> params_;
};

/** Reads the address held in word `index` of ABI-encoded data */
bool DecodeAddressWord(const std::vector<unsigned char>& data, size_t index, uint160& address);

/** Reads the uint256 held in word `index` of ABI-encoded data */
bool DecodeUintWord(const std::vector<unsigned char>& data, size_t index, uint256& value);

} // namespace chain

#endif // XFACTORY_CHAIN_ABI_H
