// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CALLGUARD_TEST_TEST_CALLGUARD_H
#define CALLGUARD_TEST_TEST_CALLGUARD_H

#include <callguard/clock.h>
#include <callguard/event_sink.h>
#include <callguard/provider.h>

#include <atomic>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include <boost/signals2/connection.hpp>

/**
 * Basic testing setup.
 * Provides a manually driven clock and an event sink whose events are
 * recorded for inspection.
 */
struct BasicTestingSetup {
    callguard::MockClock clock;
    callguard::EventSink events;

    BasicTestingSetup();
    ~BasicTestingSetup();

    /** Recorded events of a type, oldest first */
    std::vector<callguard::ResilienceEvent> EventsOfType(callguard::EventType type) const;
    size_t CountEvents(callguard::EventType type) const;
    void ClearEvents();

private:
    mutable std::mutex m_events_mutex;
    std::vector<callguard::ResilienceEvent> m_events;
    boost::signals2::scoped_connection m_connection;
};

/**
 * Transport whose replies are scripted call by call.
 * Once the script runs out the default behaviour repeats.
 */
class ScriptedProvider : public callguard::IProvider {
public:
    enum class Behaviour {
        SUCCEED,
        FAIL,
        TIME_OUT,
        THROW_UNEXPECTED,
        /** Block until the request's token is cancelled */
        HANG
    };

    explicit ScriptedProvider(Behaviour defaultBehaviour = Behaviour::SUCCEED);

    callguard::ProviderReply Invoke(const callguard::InvocationRequest& request) override;

    void Push(Behaviour behaviour);
    void SetDefault(Behaviour behaviour);

    /** Tokens reported by successful replies */
    uint64_t tokensIn;
    uint64_t tokensOut;
    std::string replyText;

    uint64_t GetCallCount() const { return m_calls.load(); }

private:
    Behaviour Next();

    std::mutex m_mutex;
    std::deque<Behaviour> m_script;
    Behaviour m_default;
    std::atomic<uint64_t> m_calls;
};

#endif // CALLGUARD_TEST_TEST_CALLGUARD_H
