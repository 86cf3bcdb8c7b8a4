// Copyright (c) 2025 The XFactory developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <uint256.h>

#include <utilstrencodings.h>

#include <cctype>
#include <cstdio>
#include <cstring>
#include <iterator>

template <unsigned int BITS>
base_blob<BITS>::base_blob(const std::vector<unsigned char>& vch)
{
    memset(data, 0, sizeof(data));
    // Right-align shorter input, keep the low-order bytes of longer input
    if (vch.size() >= sizeof(data)) {
        memcpy(data, vch.data() + (vch.size() - sizeof(data)), sizeof(data));
    } else {
        memcpy(data + (sizeof(data) - vch.size()), vch.data(), vch.size());
    }
}

template <unsigned int BITS>
std::string base_blob<BITS>::GetHex() const
{
    return HexStr(std::begin(data), std::end(data));
}

template <unsigned int BITS>
void base_blob<BITS>::SetHex(const char* psz)
{
    memset(data, 0, sizeof(data));

    // skip leading spaces
    while (isspace((unsigned char)*psz))
        psz++;

    // skip 0x
    if (psz[0] == '0' && tolower((unsigned char)psz[1]) == 'x')
        psz += 2;

    // hex string to uint, filling from the least significant end
    const char* pbegin = psz;
    while (::HexDigit(*psz) != -1)
        psz++;
    psz--;
    int i = WIDTH - 1;
    while (psz >= pbegin && i >= 0) {
        data[i] = ::HexDigit(*psz--);
        if (psz >= pbegin) {
            data[i] |= ((unsigned char)::HexDigit(*psz--) << 4);
        }
        i--;
    }
}

template <unsigned int BITS>
void base_blob<BITS>::SetHex(const std::string& str)
{
    SetHex(str.c_str());
}

template <unsigned int BITS>
std::string base_blob<BITS>::ToString() const
{
    return "0x" + GetHex();
}

// Explicit instantiations for base_blob<96>
template base_blob<96>::base_blob(const std::vector<unsigned char>&);
template std::string base_blob<96>::GetHex() const;
template std::string base_blob<96>::ToString() const;
template void base_blob<96>::SetHex(const char*);
template void base_blob<96>::SetHex(const std::string&);

// Explicit instantiations for base_blob<160>
template base_blob<160>::base_blob(const std::vector<unsigned char>&);
template std::string base_blob<160>::GetHex() const;
template std::string base_blob<160>::ToString() const;
template void base_blob<160>::SetHex(const char*);
template void base_blob<160>::SetHex(const std::string&);

// Explicit instantiations for base_blob<256>
template base_blob<256>::base_blob(const std::vector<unsigned char>&);
template std::string base_blob<256>::GetHex() const;
template std::string base_blob<256>::ToString() const;
template void base_blob<256>::SetHex(const char*);
template void base_blob<256>::SetHex(const std::string&);

uint256 uint256::FromUint64(uint64_t n)
{
    uint256 word;
    for (int i = 0; i < 8; i++) {
        word.data[WIDTH - 1 - i] = (uint8_t)(n >> (8 * i));
    }
    return word;
}

uint64_t uint256::GetLow64() const
{
    uint64_t n = 0;
    for (int i = WIDTH - 8; i < WIDTH; i++) {
        n = (n << 8) | data[i];
    }
    return n;
}
