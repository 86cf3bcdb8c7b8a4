// Copyright (c) 2025 The XFactory developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Utilities for converting data from/to strings.
 */
#ifndef XFACTORY_UTILSTRENCODINGS_H
#define XFACTORY_UTILSTRENCODINGS_H

#include <cstdint>
#include <string>
#include <vector>

signed char HexDigit(char c);
/** True if str is a non-empty, even-length string of hex digits (optional 0x prefix) */
bool IsHex(const std::string& str);
/** Parses hex digits, ignoring an 0x prefix and whitespace; stops at the first non-hex pair */
std::vector<unsigned char> ParseHex(const char* psz);
std::vector<unsigned char> ParseHex(const std::string& str);

template<typename T>
std::string HexStr(const T itbegin, const T itend)
{
    static const char hexmap[16] = { '0', '1', '2', '3', '4', '5', '6', '7',
                                     '8', '9', 'a', 'b', 'c', 'd', 'e', 'f' };
    std::string rv;
    rv.reserve((itend - itbegin) * 2);
    for (T it = itbegin; it < itend; ++it) {
        unsigned char val = (unsigned char)(*it);
        rv.push_back(hexmap[val >> 4]);
        rv.push_back(hexmap[val & 15]);
    }
    return rv;
}

template<typename T>
inline std::string HexStr(const T& vch)
{
    return HexStr(vch.begin(), vch.end());
}

/** Parses a base-10 signed 64-bit integer; fails on trailing garbage or overflow */
bool ParseInt64(const std::string& str, int64_t* out);

#endif // XFACTORY_UTILSTRENCODINGS_H
