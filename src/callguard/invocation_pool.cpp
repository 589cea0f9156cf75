// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <callguard/invocation_pool.h>
#include <logging.h>

#include <algorithm>

namespace callguard {

InvocationPool::InvocationPool(size_t threads, size_t maxPerKey)
    : maxPerKey_(std::max<size_t>(1, maxPerKey))
    , nextId_(0)
    , stopping_(false)
{
    const size_t count = std::max<size_t>(1, threads);
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back(&InvocationPool::ThreadMain, this);
    }
    LogPrint(CGLog::PROVIDER, "Started %u invocation threads (%u calls in flight per provider)\n",
             count, maxPerKey_);
}

InvocationPool::~InvocationPool()
{
    Shutdown();
}

bool InvocationPool::Submit(const std::string& key, std::shared_ptr<CancellationToken> cancel,
                            std::function<void()> task)
{
    {
        WAIT_LOCK(cs_pool_, lock);
        if (stopping_) {
            return false;
        }
        size_t& outstanding = outstanding_[key];
        if (outstanding >= maxPerKey_) {
            return false;
        }
        outstanding++;

        Task entry;
        entry.id = nextId_++;
        entry.key = key;
        entry.run = std::move(task);
        tokens_[entry.id] = std::move(cancel);
        queue_.push_back(std::move(entry));
    }
    cond_.notify_one();
    return true;
}

size_t InvocationPool::GetOutstanding(const std::string& key) const
{
    WAIT_LOCK(cs_pool_, lock);
    auto it = outstanding_.find(key);
    return it == outstanding_.end() ? 0 : it->second;
}

size_t InvocationPool::GetOutstanding() const
{
    WAIT_LOCK(cs_pool_, lock);
    return tokens_.size();
}

void InvocationPool::ThreadMain()
{
    while (true) {
        Task task;
        {
            WAIT_LOCK(cs_pool_, lock);
            cond_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            // Queued tasks still run after shutdown; their tokens are cancelled
            if (queue_.empty()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        task.run();

        WAIT_LOCK(cs_pool_, lock);
        auto it = outstanding_.find(task.key);
        if (it != outstanding_.end() && --it->second == 0) {
            outstanding_.erase(it);
        }
        tokens_.erase(task.id);
    }
}

void InvocationPool::Shutdown()
{
    size_t cancelled = 0;
    {
        WAIT_LOCK(cs_pool_, lock);
        if (stopping_ && workers_.empty()) {
            return;
        }
        stopping_ = true;
        for (auto& entry : tokens_) {
            if (entry.second && !entry.second->IsCancelled()) {
                entry.second->Cancel();
                cancelled++;
            }
        }
    }
    cond_.notify_all();

    if (cancelled > 0) {
        LogPrint(CGLog::PROVIDER, "Shutting down invocation pool, cancelled %u outstanding calls\n", cancelled);
    }
    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

} // namespace callguard
