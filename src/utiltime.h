// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QUORUM_UTILTIME_H
#define QUORUM_UTILTIME_H

#include <stdint.h>
#include <string>

/**
 * GetTime() returns the system time in seconds, but also supports mocktime,
 * where the time can be specified by the user, eg for testing.
 */
int64_t GetTime();
void SetMockTime(int64_t nMockTimeIn);

/** Format a unix timestamp as an ISO 8601 UTC date-time string. */
std::string FormatISO8601DateTime(int64_t nTime);

#endif // QUORUM_UTILTIME_H
