// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <random.h>

#include <util.h>

#include <openssl/err.h>
#include <openssl/rand.h>

#include <cstring>
#include <stdexcept>

[[noreturn]] static void RandFailure()
{
    LogPrintf("Failed to read randomness, aborting\n");
    throw std::runtime_error("Failed to read randomness");
}

void GetRandBytes(unsigned char* buf, int num)
{
    if (RAND_bytes(buf, num) != 1) {
        LogPrintf("%s: OpenSSL RAND_bytes() failed with error: %s\n", __func__, ERR_error_string(ERR_get_error(), nullptr));
        RandFailure();
    }
}

FastRandomContext::FastRandomContext(bool fDeterministic)
{
    if (fDeterministic) {
        // splitmix64 expansion of a fixed seed
        uint64_t seed = 0x5155'4f52'554d'0001ULL;
        for (int i = 0; i < 4; ++i) {
            uint64_t z = (seed += 0x9e3779b97f4a7c15ULL);
            z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
            z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
            state[i] = z ^ (z >> 31);
        }
    } else {
        GetRandBytes((unsigned char*)state, sizeof(state));
    }
}

uint256 FastRandomContext::rand256()
{
    uint256 ret;
    for (int i = 0; i < 4; ++i) {
        uint64_t v = rand64();
        memcpy(ret.begin() + i * 8, &v, 8);
    }
    return ret;
}
