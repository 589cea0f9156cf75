// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CALLGUARD_CLOCK_H
#define CALLGUARD_CLOCK_H

/**
 * @file clock.h
 * @brief Injectable time source
 *
 * Every timing decision in the resilience core (breaker recovery, rate
 * limit windows, cache expiry, drift windows, budget periods) reads time
 * through a Clock so that tests can drive it deterministically.
 */

#include <atomic>
#include <cstdint>

namespace callguard {

class Clock {
public:
    virtual ~Clock() {}

    /** Monotonic milliseconds. Only differences are meaningful. */
    virtual int64_t NowMillis() const = 0;

    /** Unix time in seconds, used for billing periods and event timestamps. */
    virtual int64_t WallTimeSeconds() const = 0;
};

/** Clock backed by the steady clock and the (mockable) system time. */
class SystemClock : public Clock {
public:
    int64_t NowMillis() const override;
    int64_t WallTimeSeconds() const override;
};

/**
 * @brief Manually advanced clock
 *
 * Starts at a non-zero instant so that "time zero" is never confused with
 * an unset timestamp.
 */
class MockClock : public Clock {
public:
    explicit MockClock(int64_t startMillis = 1000000, int64_t startWallSeconds = 1750000000);

    int64_t NowMillis() const override { return millis_.load(); }
    int64_t WallTimeSeconds() const override { return wallSeconds_.load(); }

    /** Advance both the monotonic and the wall clock. */
    void AdvanceMillis(int64_t ms);
    void AdvanceSeconds(int64_t seconds) { AdvanceMillis(seconds * 1000); }

    void SetWallTime(int64_t seconds) { wallSeconds_.store(seconds); }

private:
    std::atomic<int64_t> millis_;
    std::atomic<int64_t> wallSeconds_;
    /** Sub-second remainder carried into the wall clock */
    std::atomic<int64_t> wallRemainderMs_;
};

} // namespace callguard

#endif // CALLGUARD_CLOCK_H
