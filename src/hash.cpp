// Copyright (c) 2013-2016 The Bitcoin Core developers
// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <hash.h>

#include <openssl/evp.h>

#include <stdexcept>

uint160 Hash160(const unsigned char* data, size_t len)
{
    unsigned char sha[CSHA256::OUTPUT_SIZE];
    CSHA256().Write(data, len).Finalize(sha);

    uint160 result;
    unsigned int outLen = 0;
    if (EVP_Digest(sha, sizeof(sha), result.begin(), &outLen, EVP_ripemd160(), nullptr) != 1 ||
        outLen != result.size()) {
        throw std::runtime_error("Hash160: RIPEMD-160 digest unavailable");
    }
    return result;
}
