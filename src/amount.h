// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QUORUM_AMOUNT_H
#define QUORUM_AMOUNT_H

#include <stdint.h>
#include <string>

/** Amount in the smallest token unit (can be negative for deltas) */
typedef int64_t CAmount;

static const CAmount COIN = 100000000;
static const CAmount CENT = 1000000;

/** No amount larger than this (in base units) is valid.
 *
 * Any token balance, stake, fee or transfer above this is rejected as
 * malformed input before it reaches bridge arithmetic, which keeps
 * sums of a few such values inside int64.
 */
static const CAmount MAX_MONEY = 21000000000LL * COIN;
inline bool MoneyRange(const CAmount& nValue) { return (nValue >= 0 && nValue <= MAX_MONEY); }

/** Format an amount as a decimal string with eight fractional digits. */
std::string FormatMoney(const CAmount& n);

#endif //  QUORUM_AMOUNT_H
