// Copyright (c) 2025 The XFactory developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <hash.h>

#include <openssl/evp.h>

#include <stdexcept>

CSHA256::CSHA256() : ctx(EVP_MD_CTX_new())
{
    if (!ctx) {
        throw std::runtime_error("CSHA256: EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("CSHA256: EVP_DigestInit_ex failed");
    }
}

CSHA256::~CSHA256()
{
    EVP_MD_CTX_free(ctx);
}

CSHA256& CSHA256::Write(const unsigned char* data, size_t len)
{
    if (EVP_DigestUpdate(ctx, data, len) != 1) {
        throw std::runtime_error("CSHA256: EVP_DigestUpdate failed");
    }
    return *this;
}

void CSHA256::Finalize(unsigned char hash[OUTPUT_SIZE])
{
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &len) != 1 || len != OUTPUT_SIZE) {
        throw std::runtime_error("CSHA256: EVP_DigestFinal_ex failed");
    }
}

CSHA256& CSHA256::Reset()
{
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("CSHA256: EVP_DigestInit_ex failed");
    }
    return *this;
}
