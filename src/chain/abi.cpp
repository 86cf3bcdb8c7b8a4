// Copyright (c) 2025 The XFactory developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <chain/abi.h>

#include <algorithm>

namespace chain {

namespace {

std::vector<unsigned char> LeftPaddedWord(const unsigned char* begin, size_t size)
{
    std::vector<unsigned char> word(ABI_WORD_SIZE, 0);
    std::copy(begin, begin + size, word.end() - size);
    return word;
}

std::vector<unsigned char> UintWord(uint64_t n)
{
    const uint256 word = uint256::FromUint64(n);
    return std::vector<unsigned char>(word.begin(), word.end());
}

} // anonymous namespace

AbiEncoder& AbiEncoder::Address(const uint160& address)
{
    params_.push_back({false, LeftPaddedWord(address.begin(), address.size())});
    return *this;
}

AbiEncoder& AbiEncoder::Uint(const uint256& value)
{
    params_.push_back({false, std::vector<unsigned char>(value.begin(), value.end())});
    return *this;
}

AbiEncoder& AbiEncoder::Bool(bool value)
{
    params_.push_back({false, UintWord(value ? 1 : 0)});
    return *this;
}

AbiEncoder& AbiEncoder::String(const std::string& value)
{
    std::vector<unsigned char> tail = UintWord(value.size());
    tail.insert(tail.end(), value.begin(), value.end());
    // Pad contents to a word boundary
    size_t remainder = value.size() % ABI_WORD_SIZE;
    if (remainder != 0) {
        tail.insert(tail.end(), ABI_WORD_SIZE - remainder, 0);
    }
    params_.push_back({true, std::move(tail)});
    return *this;
}

std::vector<unsigned char> AbiEncoder::Encode() const
{
    std::vector<unsigned char> head;
    std::vector<unsigned char> tail;
    const size_t headSize = params_.size() * ABI_WORD_SIZE;

    for (const Param& param : params_) {
        if (param.dynamic) {
            std::vector<unsigned char> offset = UintWord(headSize + tail.size());
            head.insert(head.end(), offset.begin(), offset.end());
            tail.insert(tail.end(), param.data.begin(), param.data.end());
        } else {
            head.insert(head.end(), param.data.begin(), param.data.end());
        }
    }

    head.insert(head.end(), tail.begin(), tail.end());
    return head;
}

bool DecodeAddressWord(const std::vector<unsigned char>& data, size_t index, uint160& address)
{
    const size_t start = index * ABI_WORD_SIZE;
    if (data.size() < start + ABI_WORD_SIZE) {
        return false;
    }
    const size_t padding = ABI_WORD_SIZE - address.size();
    for (size_t i = 0; i < padding; i++) {
        if (data[start + i] != 0) {
            return false;
        }
    }
    std::copy(data.begin() + start + padding, data.begin() + start + ABI_WORD_SIZE, address.begin());
    return true;
}

bool DecodeUintWord(const std::vector<unsigned char>& data, size_t index, uint256& value)
{
    const size_t start = index * ABI_WORD_SIZE;
    if (data.size() < start + ABI_WORD_SIZE) {
        return false;
    }
    std::copy(data.begin() + start, data.begin() + start + ABI_WORD_SIZE, value.begin());
    return true;
}

} // namespace chain
