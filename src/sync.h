// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QUORUM_SYNC_H
#define QUORUM_SYNC_H

#include <mutex>

/**
 * Wrapped mutex: supports recursive locking, so a component may call its
 * own public accessors while holding its lock.
 */
class CCriticalSection : public std::recursive_mutex
{
};

typedef std::unique_lock<CCriticalSection> CCriticalBlock;

#define PASTE(x, y) x ## y
#define PASTE2(x, y) PASTE(x, y)

#define LOCK(cs) CCriticalBlock PASTE2(criticalblock, __COUNTER__)(cs)
#define LOCK2(cs1, cs2) CCriticalBlock criticalblock1(cs1), criticalblock2(cs2)

#endif // QUORUM_SYNC_H
