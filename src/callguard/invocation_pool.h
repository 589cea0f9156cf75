// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CALLGUARD_INVOCATION_POOL_H
#define CALLGUARD_INVOCATION_POOL_H

/**
 * @file invocation_pool.h
 * @brief Fixed set of worker threads running upstream calls
 *
 * Upstream calls run on pool workers so that the waiting request thread can
 * give up on a call at its deadline. A transport that ignores cancellation
 * keeps its worker busy after that; the per-key cap bounds how many such
 * calls one provider can pile up, and the fixed thread count bounds the
 * total. Shutdown cancels every outstanding call and joins the workers.
 */

#include <callguard/provider.h>
#include <sync.h>

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace callguard {

/** Worker threads for upstream calls */
static constexpr size_t DEFAULT_INVOCATION_THREADS = 16;

/** Calls one provider/model may have queued or running at once */
static constexpr size_t DEFAULT_MAX_IN_FLIGHT_PER_PROVIDER = 8;

class InvocationPool {
public:
    /**
     * @param threads Number of worker threads (at least one is started)
     * @param maxPerKey Outstanding tasks allowed per key
     */
    InvocationPool(size_t threads, size_t maxPerKey);
    ~InvocationPool();

    InvocationPool(const InvocationPool&) = delete;
    InvocationPool& operator=(const InvocationPool&) = delete;

    /**
     * @brief Queue a task
     * @param key Provider/model the task calls
     * @param cancel Token the task honours; cancelled on shutdown
     * @param task Work to run on a worker. Must not throw.
     * @return false if the key is at its cap or the pool is shut down
     */
    bool Submit(const std::string& key, std::shared_ptr<CancellationToken> cancel, std::function<void()> task);

    /** Tasks queued or running for a key */
    size_t GetOutstanding(const std::string& key) const;

    /** Tasks queued or running in total */
    size_t GetOutstanding() const;

    size_t GetThreadCount() const { return workers_.size(); }
    size_t GetMaxPerKey() const { return maxPerKey_; }

    /** Stop accepting work, cancel every outstanding task and join the workers */
    void Shutdown();

private:
    struct Task {
        uint64_t id;
        std::string key;
        std::function<void()> run;
    };

    void ThreadMain();

    const size_t maxPerKey_;

    mutable CWaitableCriticalSection cs_pool_;
    CConditionVariable cond_;
    std::deque<Task> queue_;
    std::map<std::string, size_t> outstanding_;
    /** Tokens of queued and running tasks, by task id */
    std::map<uint64_t, std::shared_ptr<CancellationToken>> tokens_;
    uint64_t nextId_;
    bool stopping_;

    std::vector<std::thread> workers_;
};

} // namespace callguard

#endif // CALLGUARD_INVOCATION_POOL_H
