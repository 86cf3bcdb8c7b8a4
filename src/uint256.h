// Copyright (c) 2025 The XFactory developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef XFACTORY_UINT256_H
#define XFACTORY_UINT256_H

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

/**
 * Template base class for fixed-sized opaque blobs.
 *
 * Bytes are kept in big-endian (EVM word) order: data[0] is the most
 * significant byte and GetHex() prints the bytes as stored.
 */
template<unsigned int BITS>
class base_blob
{
protected:
    static constexpr int WIDTH = BITS / 8;
    uint8_t data[WIDTH];
public:
    base_blob()
    {
        memset(data, 0, sizeof(data));
    }

    explicit base_blob(const std::vector<unsigned char>& vch);

    bool IsNull() const
    {
        for (int i = 0; i < WIDTH; i++)
            if (data[i] != 0)
                return false;
        return true;
    }

    void SetNull()
    {
        memset(data, 0, sizeof(data));
    }

    inline int Compare(const base_blob& other) const { return memcmp(data, other.data, sizeof(data)); }

    friend inline bool operator==(const base_blob& a, const base_blob& b) { return a.Compare(b) == 0; }
    friend inline bool operator!=(const base_blob& a, const base_blob& b) { return a.Compare(b) != 0; }
    friend inline bool operator<(const base_blob& a, const base_blob& b) { return a.Compare(b) < 0; }

    /** Hex digits without prefix, most significant byte first */
    std::string GetHex() const;
    /** Accepts an optional 0x prefix; shorter input is left-padded with zeros */
    void SetHex(const char* psz);
    void SetHex(const std::string& str);
    /** 0x-prefixed hex */
    std::string ToString() const;

    unsigned char* begin()
    {
        return &data[0];
    }

    unsigned char* end()
    {
        return &data[WIDTH];
    }

    const unsigned char* begin() const
    {
        return &data[0];
    }

    const unsigned char* end() const
    {
        return &data[WIDTH];
    }

    static constexpr unsigned int size()
    {
        return WIDTH;
    }
};

/** 96-bit opaque blob, used for caller-chosen salt discriminators. */
class uint96 : public base_blob<96> {
public:
    uint96() {}
    explicit uint96(const std::vector<unsigned char>& vch) : base_blob<96>(vch) {}
};

/** 160-bit opaque blob, used for account and contract addresses. */
class uint160 : public base_blob<160> {
public:
    uint160() {}
    explicit uint160(const std::vector<unsigned char>& vch) : base_blob<160>(vch) {}
};

/**
 * 256-bit opaque blob. Also carries 256-bit unsigned magnitudes (limits),
 * encoded big-endian the same way the EVM stores a word.
 */
class uint256 : public base_blob<256> {
public:
    uint256() {}
    explicit uint256(const std::vector<unsigned char>& vch) : base_blob<256>(vch) {}

    /** Word holding the given integer in its low-order bytes */
    static uint256 FromUint64(uint64_t n);

    /** Low-order 64 bits of the word */
    uint64_t GetLow64() const;
};

/* uint256 from const char *.
 * This is a separate function because the constructor uint256(const char*) can result
 * in dangerously catching uint256(0).
 */
inline uint256 uint256S(const char *str)
{
    uint256 rv;
    rv.SetHex(str);
    return rv;
}

inline uint256 uint256S(const std::string& str)
{
    uint256 rv;
    rv.SetHex(str);
    return rv;
}

inline uint160 uint160S(const std::string& str)
{
    uint160 rv;
    rv.SetHex(str);
    return rv;
}

inline uint96 uint96S(const std::string& str)
{
    uint96 rv;
    rv.SetHex(str);
    return rv;
}

#endif // XFACTORY_UINT256_H
