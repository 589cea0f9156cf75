// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CALLGUARD_SYNC_H
#define CALLGUARD_SYNC_H

#include <condition_variable>
#include <mutex>

/**
 * Wrapped mutex types used throughout the code base.
 *
 * CCriticalSection is recursive so that a locked method may call another
 * locked method of the same object. CWaitableCriticalSection is a plain
 * mutex usable with CConditionVariable.
 */
class CCriticalSection : public std::recursive_mutex
{
};

typedef std::mutex CWaitableCriticalSection;
typedef std::condition_variable CConditionVariable;

/** RAII lock holder for the LOCK family of macros. */
template <typename Mutex>
class CMutexLock
{
private:
    std::unique_lock<Mutex> lock;

public:
    CMutexLock(Mutex& mutexIn, const char* pszName, const char* pszFile, int nLine, bool fTry = false)
        : lock(mutexIn, std::defer_lock)
    {
        if (fTry) {
            lock.try_lock();
        } else {
            lock.lock();
        }
    }

    ~CMutexLock() {}

    operator bool() const
    {
        return lock.owns_lock();
    }
};

typedef CMutexLock<CCriticalSection> CCriticalBlock;

#define PASTE(x, y) x ## y
#define PASTE2(x, y) PASTE(x, y)

#define LOCK(cs) CCriticalBlock PASTE2(criticalblock, __COUNTER__)(cs, #cs, __FILE__, __LINE__)
#define LOCK2(cs1, cs2) CCriticalBlock criticalblock1(cs1, #cs1, __FILE__, __LINE__), criticalblock2(cs2, #cs2, __FILE__, __LINE__)
#define TRY_LOCK(cs, name) CCriticalBlock name(cs, #cs, __FILE__, __LINE__, true)

#define WAIT_LOCK(cs, name) std::unique_lock<CWaitableCriticalSection> name(cs)

#endif // CALLGUARD_SYNC_H
