// Copyright (c) 2014-2016 The Bitcoin Core developers
// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <crypto/sha256.h>

#include <openssl/evp.h>

#include <stdexcept>

namespace {

EVP_MD_CTX* NewSHA256Context()
{
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx || EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("CSHA256: EVP_DigestInit_ex failed");
    }
    return ctx;
}

} // namespace

CSHA256::CSHA256() : ctx(NewSHA256Context())
{
}

CSHA256::~CSHA256()
{
    EVP_MD_CTX_free(ctx);
}

CSHA256::CSHA256(const CSHA256& other) : ctx(EVP_MD_CTX_new())
{
    if (!ctx || EVP_MD_CTX_copy_ex(ctx, other.ctx) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("CSHA256: EVP_MD_CTX_copy_ex failed");
    }
}

CSHA256& CSHA256::operator=(const CSHA256& other)
{
    if (this != &other && EVP_MD_CTX_copy_ex(ctx, other.ctx) != 1) {
        throw std::runtime_error("CSHA256: EVP_MD_CTX_copy_ex failed");
    }
    return *this;
}

CSHA256& CSHA256::Write(const unsigned char* data, size_t len)
{
    if (len > 0 && EVP_DigestUpdate(ctx, data, len) != 1) {
        throw std::runtime_error("CSHA256: EVP_DigestUpdate failed");
    }
    return *this;
}

void CSHA256::Finalize(unsigned char hash[OUTPUT_SIZE])
{
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &outLen) != 1 || outLen != OUTPUT_SIZE) {
        throw std::runtime_error("CSHA256: EVP_DigestFinal_ex failed");
    }
    // Leave the context ready for reuse, like the native implementation
    Reset();
}

CSHA256& CSHA256::Reset()
{
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("CSHA256: EVP_DigestInit_ex failed");
    }
    return *this;
}
