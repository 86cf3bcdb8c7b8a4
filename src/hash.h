// Copyright (c) 2025 The XFactory developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef XFACTORY_HASH_H
#define XFACTORY_HASH_H

#include <uint256.h>

#include <cstdint>
#include <string>
#include <vector>

typedef struct evp_md_ctx_st EVP_MD_CTX;

/** A hasher class for single SHA-256, backed by OpenSSL's EVP interface. */
class CSHA256
{
public:
    static const size_t OUTPUT_SIZE = 32;

    CSHA256();
    ~CSHA256();
    CSHA256(const CSHA256&) = delete;
    CSHA256& operator=(const CSHA256&) = delete;

    CSHA256& Write(const unsigned char* data, size_t len);
    void Finalize(unsigned char hash[OUTPUT_SIZE]);
    CSHA256& Reset();

private:
    EVP_MD_CTX* ctx;
};

/** A hasher class for double SHA-256 (SHA-256d). */
class CHash256 {
private:
    CSHA256 sha;
public:
    static const size_t OUTPUT_SIZE = CSHA256::OUTPUT_SIZE;

    void Finalize(unsigned char hash[OUTPUT_SIZE]) {
        unsigned char buf[CSHA256::OUTPUT_SIZE];
        sha.Finalize(buf);
        sha.Reset().Write(buf, CSHA256::OUTPUT_SIZE).Finalize(hash);
    }

    CHash256& Write(const unsigned char *data, size_t len) {
        sha.Write(data, len);
        return *this;
    }

    CHash256& Reset() {
        sha.Reset();
        return *this;
    }
};

/** Compute the 256-bit hash of an object. */
template<typename T1>
inline uint256 Hash(const T1 pbegin, const T1 pend)
{
    static const unsigned char pblank[1] = {};
    uint256 result;
    CHash256().Write(pbegin == pend ? pblank : (const unsigned char*)&pbegin[0], (pend - pbegin) * sizeof(pbegin[0]))
              .Finalize((unsigned char*)&result);
    return result;
}

inline uint256 Hash(const std::vector<unsigned char>& vch)
{
    return Hash(vch.begin(), vch.end());
}

/**
 * A writer stream (for packed encoding) that computes a 256-bit hash.
 *
 * Values are appended without length prefixes or padding, the way
 * abi.encodePacked lays them out: blobs as their raw bytes, bool and
 * uint8_t as one byte, byte vectors and strings as their contents.
 */
class CHashWriter
{
private:
    CHash256 ctx;

public:
    CHashWriter& write(const unsigned char* pch, size_t size) {
        ctx.Write(pch, size);
        return (*this);
    }

    // invalidates the object
    uint256 GetHash() {
        uint256 result;
        ctx.Finalize((unsigned char*)&result);
        return result;
    }

    CHashWriter& operator<<(uint8_t n) {
        return write(&n, 1);
    }

    CHashWriter& operator<<(bool f) {
        uint8_t n = f ? 1 : 0;
        return write(&n, 1);
    }

    template<unsigned int BITS>
    CHashWriter& operator<<(const base_blob<BITS>& blob) {
        return write(blob.begin(), blob.size());
    }

    CHashWriter& operator<<(const std::vector<unsigned char>& vch) {
        return write(vch.data(), vch.size());
    }

    CHashWriter& operator<<(const std::string& str) {
        return write((const unsigned char*)str.data(), str.size());
    }
};

#endif // XFACTORY_HASH_H
