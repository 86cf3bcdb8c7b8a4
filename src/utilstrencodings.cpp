// Copyright (c) 2025 The XFactory developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <utilstrencodings.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>

signed char HexDigit(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static const char* SkipHexPrefix(const char* psz)
{
    if (psz[0] == '0' && (psz[1] == 'x' || psz[1] == 'X'))
        return psz + 2;
    return psz;
}

bool IsHex(const std::string& str)
{
    const char* psz = SkipHexPrefix(str.c_str());
    size_t len = 0;
    for (; *psz; ++psz, ++len) {
        if (HexDigit(*psz) < 0)
            return false;
    }
    return len > 0 && (len % 2 == 0);
}

std::vector<unsigned char> ParseHex(const char* psz)
{
    std::vector<unsigned char> vch;
    psz = SkipHexPrefix(psz);
    while (true)
    {
        while (isspace((unsigned char)*psz))
            psz++;
        signed char c = HexDigit(*psz++);
        if (c == (signed char)-1)
            break;
        unsigned char n = (c << 4);
        c = HexDigit(*psz++);
        if (c == (signed char)-1)
            break;
        n |= c;
        vch.push_back(n);
    }
    return vch;
}

std::vector<unsigned char> ParseHex(const std::string& str)
{
    return ParseHex(str.c_str());
}

bool ParseInt64(const std::string& str, int64_t* out)
{
    if (str.empty() || isspace((unsigned char)str[0]) || isspace((unsigned char)str[str.size() - 1]))
        return false;
    char* endp = nullptr;
    errno = 0;
    long long n = strtoll(str.c_str(), &endp, 10);
    if (out) *out = (int64_t)n;
    return endp && *endp == 0 && !errno &&
        n >= std::numeric_limits<int64_t>::min() &&
        n <= std::numeric_limits<int64_t>::max();
}
