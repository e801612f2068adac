// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <bridge/volume_limiter.h>

#include <util.h>

#include <algorithm>

namespace bridge {

namespace {

uint64_t EpochOf(uint64_t now, uint64_t epochLength)
{
    return epochLength == 0 ? 0 : now / epochLength;
}

} // namespace

CAmount EpochVolumeCounter::GetVolume(uint64_t now, uint64_t epochLength) const
{
    return EpochOf(now, epochLength) == epoch_ ? volume_ : 0;
}

bool EpochVolumeCounter::CanAdd(CAmount amount, CAmount limit, uint64_t now, uint64_t epochLength) const
{
    if (limit <= 0) {
        return true;
    }
    CAmount total;
    if (!CheckedAdd(GetVolume(now, epochLength), amount, total)) {
        return false;
    }
    return total <= limit;
}

void EpochVolumeCounter::Add(CAmount amount, uint64_t now, uint64_t epochLength)
{
    const uint64_t epoch = EpochOf(now, epochLength);
    if (epoch != epoch_) {
        epoch_ = epoch;
        volume_ = 0;
    }
    CAmount total;
    volume_ = CheckedAdd(volume_, amount, total) ? total : MAX_MONEY;
}

VolumeLimiter::VolumeLimiter(CAmount globalLimit, CAmount userLimit, uint64_t epochLength)
    : globalLimit_(globalLimit)
    , userLimit_(userLimit)
    , epochLength_(epochLength)
{
}

BridgeResult VolumeLimiter::Check(const Address& user, CAmount amount, uint64_t now) const
{
    LOCK(cs_volume_);

    if (!global_.CanAdd(amount, globalLimit_, now, epochLength_)) {
        return BridgeResult::Fail(BridgeError::VOLUME_LIMIT_EXCEEDED,
            strprintf("Global daily limit %s reached", FormatMoney(globalLimit_)));
    }

    auto it = users_.find(user);
    if (it != users_.end()) {
        if (!it->second.CanAdd(amount, userLimit_, now, epochLength_)) {
            return BridgeResult::Fail(BridgeError::VOLUME_LIMIT_EXCEEDED,
                strprintf("User daily limit %s reached", FormatMoney(userLimit_)));
        }
    } else if (userLimit_ > 0 && amount > userLimit_) {
        return BridgeResult::Fail(BridgeError::VOLUME_LIMIT_EXCEEDED,
            strprintf("User daily limit %s reached", FormatMoney(userLimit_)));
    }
    return BridgeResult::Ok();
}

void VolumeLimiter::Record(const Address& user, CAmount amount, uint64_t now)
{
    LOCK(cs_volume_);
    global_.Add(amount, now, epochLength_);
    users_[user].Add(amount, now, epochLength_);

    LogPrint(BCLog::BRIDGE, "VolumeLimiter: %s +%s (user %s, global %s)\n",
             user.ToString(), FormatMoney(amount),
             FormatMoney(users_[user].GetVolume(now, epochLength_)),
             FormatMoney(global_.GetVolume(now, epochLength_)));
}

CAmount VolumeLimiter::GetGlobalVolume(uint64_t now) const
{
    LOCK(cs_volume_);
    return global_.GetVolume(now, epochLength_);
}

CAmount VolumeLimiter::GetUserVolume(const Address& user, uint64_t now) const
{
    LOCK(cs_volume_);
    auto it = users_.find(user);
    return it == users_.end() ? 0 : it->second.GetVolume(now, epochLength_);
}

CAmount VolumeLimiter::GetRemaining(const Address& user, uint64_t now) const
{
    LOCK(cs_volume_);

    CAmount remaining = MAX_MONEY;
    if (globalLimit_ > 0) {
        remaining = std::min(remaining, std::max<CAmount>(0, globalLimit_ - global_.GetVolume(now, epochLength_)));
    }
    if (userLimit_ > 0) {
        auto it = users_.find(user);
        const CAmount used = it == users_.end() ? 0 : it->second.GetVolume(now, epochLength_);
        remaining = std::min(remaining, std::max<CAmount>(0, userLimit_ - used));
    }
    return remaining;
}

uint64_t VolumeLimiter::GetNextReset(uint64_t now) const
{
    if (epochLength_ == 0) return 0;
    return (EpochOf(now, epochLength_) + 1) * epochLength_;
}

void VolumeLimiter::Clear()
{
    LOCK(cs_volume_);
    global_ = EpochVolumeCounter();
    users_.clear();
}

} // namespace bridge
