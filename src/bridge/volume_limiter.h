// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QUORUM_BRIDGE_VOLUME_LIMITER_H
#define QUORUM_BRIDGE_VOLUME_LIMITER_H

/**
 * @file volume_limiter.h
 * @brief Daily transfer volume limits
 *
 * Volume is counted in fixed epochs aligned to multiples of the epoch
 * length (epoch index = now / epochLength). A counter resets the first
 * time it is touched in a later epoch. A limit of 0 disables the check.
 */

#include <bridge/bridge_common.h>
#include <amount.h>
#include <serialize.h>
#include <sync.h>

#include <cstdint>
#include <map>

namespace bridge {

/** Volume accumulated in one fixed epoch */
class EpochVolumeCounter {
public:
    EpochVolumeCounter() : epoch_(0), volume_(0) {}

    /** Volume in the epoch that contains now */
    CAmount GetVolume(uint64_t now, uint64_t epochLength) const;

    /** True if adding amount keeps the epoch volume within limit */
    bool CanAdd(CAmount amount, CAmount limit, uint64_t now, uint64_t epochLength) const;

    /** Add amount to the epoch that contains now, resetting on epoch change */
    void Add(CAmount amount, uint64_t now, uint64_t epochLength);

    uint64_t GetEpoch() const { return epoch_; }

    ADD_SERIALIZE_METHODS;

    template <typename Stream, typename Operation>
    inline void SerializationOp(Stream& s, Operation ser_action) {
        READWRITE(epoch_);
        READWRITE(volume_);
    }

private:
    uint64_t epoch_;
    CAmount volume_;
};

/**
 * @brief Global and per-user daily volume limits
 *
 * Check() and Record() are split so that callers can validate before any
 * token moves and record only once the transfer went through.
 */
class VolumeLimiter {
public:
    VolumeLimiter(CAmount globalLimit, CAmount userLimit, uint64_t epochLength);

    /** VOLUME_LIMIT_EXCEEDED if amount would break either limit */
    BridgeResult Check(const Address& user, CAmount amount, uint64_t now) const;

    void Record(const Address& user, CAmount amount, uint64_t now);

    CAmount GetGlobalVolume(uint64_t now) const;
    CAmount GetUserVolume(const Address& user, uint64_t now) const;

    /** Remaining capacity for a user, taking both limits into account */
    CAmount GetRemaining(const Address& user, uint64_t now) const;

    /** Start of the next epoch, when counters reset */
    uint64_t GetNextReset(uint64_t now) const;

    void Clear();

    ADD_SERIALIZE_METHODS;

    template <typename Stream, typename Operation>
    inline void SerializationOp(Stream& s, Operation ser_action) {
        LOCK(cs_volume_);
        READWRITE(global_);
        READWRITE(users_);
    }

private:
    const CAmount globalLimit_;
    const CAmount userLimit_;
    const uint64_t epochLength_;

    mutable CCriticalSection cs_volume_;
    EpochVolumeCounter global_;
    std::map<Address, EpochVolumeCounter> users_;
};

} // namespace bridge

#endif // QUORUM_BRIDGE_VOLUME_LIMITER_H
