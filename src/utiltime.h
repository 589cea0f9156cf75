// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CALLGUARD_UTILTIME_H
#define CALLGUARD_UTILTIME_H

#include <stdint.h>
#include <string>

/**
 * GetTimeMicros() and GetTimeMillis() both return the system time, but in
 * different units. GetTime() returns the system time in seconds, but also
 * supports mocktime, where the time can be specified by the user, eg for
 * testing (eg with the -mocktime command line argument).
 *
 * Component timers (breaker cool-downs, rate windows, cache TTLs) do not use
 * these functions; they read an injected callguard::Clock instead.
 */
int64_t GetTime();
int64_t GetTimeMillis();
int64_t GetTimeMicros();
int64_t GetSystemTimeInSeconds(); // Like GetTime(), but not mockable

/** Milliseconds since an arbitrary, steadily increasing epoch. */
int64_t GetSteadyTimeMillis();

void SetMockTime(int64_t nMockTimeIn);
int64_t GetMockTime();

void MilliSleep(int64_t n);

std::string DateTimeStrFormat(const char* pszFormat, int64_t nTime);

#endif // CALLGUARD_UTILTIME_H
