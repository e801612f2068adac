// Copyright (c) 2014-2016 The Bitcoin Core developers
// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QUORUM_CRYPTO_SHA256_H
#define QUORUM_CRYPTO_SHA256_H

#include <stdint.h>
#include <stdlib.h>

typedef struct evp_md_ctx_st EVP_MD_CTX;

/** A hasher class for SHA-256, backed by OpenSSL's EVP digest interface. */
class CSHA256
{
private:
    EVP_MD_CTX* ctx;

public:
    static const size_t OUTPUT_SIZE = 32;

    CSHA256();
    ~CSHA256();
    CSHA256(const CSHA256& other);
    CSHA256& operator=(const CSHA256& other);

    CSHA256& Write(const unsigned char* data, size_t len);
    void Finalize(unsigned char hash[OUTPUT_SIZE]);
    CSHA256& Reset();
};

#endif // QUORUM_CRYPTO_SHA256_H
