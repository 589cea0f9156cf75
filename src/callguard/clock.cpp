// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <callguard/clock.h>
#include <utiltime.h>

namespace callguard {

int64_t SystemClock::NowMillis() const
{
    return GetSteadyTimeMillis();
}

int64_t SystemClock::WallTimeSeconds() const
{
    return GetTime();
}

MockClock::MockClock(int64_t startMillis, int64_t startWallSeconds)
    : millis_(startMillis)
    , wallSeconds_(startWallSeconds)
    , wallRemainderMs_(0)
{
}

void MockClock::AdvanceMillis(int64_t ms)
{
    millis_ += ms;
    int64_t carried = wallRemainderMs_.exchange(0) + ms;
    wallSeconds_ += carried / 1000;
    wallRemainderMs_ += carried % 1000;
}

} // namespace callguard
