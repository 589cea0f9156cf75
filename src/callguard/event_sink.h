// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CALLGUARD_EVENT_SINK_H
#define CALLGUARD_EVENT_SINK_H

/**
 * @file event_sink.h
 * @brief Structured resilience events
 *
 * Components report state changes (breaker transitions, limit and budget
 * refusals, drift alerts, fallbacks, cache hits) through a shared
 * EventSink. Every event is written to the debug log under the "events"
 * category and fanned out to any subscribed observer.
 */

#include <callguard/clock.h>

#include <array>
#include <atomic>
#include <cstdint>
#include <map>
#include <ostream>
#include <string>

#include <boost/signals2/signal.hpp>

namespace callguard {

enum class EventType : uint8_t {
    BREAKER_OPENED = 0,
    BREAKER_HALF_OPEN = 1,
    BREAKER_CLOSED = 2,
    RATE_LIMIT_EXCEEDED = 3,
    BUDGET_EXCEEDED = 4,
    BUDGET_SOFT_CAP = 5,
    DRIFT_ALERT = 6,
    FALLBACK_SERVED = 7,
    CACHE_HIT = 8
};

static constexpr size_t EVENT_TYPE_COUNT = 9;

enum class EventSeverity : uint8_t {
    INFO = 0,
    WARNING = 1,
    CRITICAL = 2
};

std::string EventTypeToString(EventType type);
std::string EventSeverityToString(EventSeverity severity);

/** Severity a given event type is reported with */
EventSeverity GetEventSeverity(EventType type);

inline std::ostream& operator<<(std::ostream& os, EventType type) {
    return os << EventTypeToString(type);
}

inline std::ostream& operator<<(std::ostream& os, EventSeverity severity) {
    return os << EventSeverityToString(severity);
}

/**
 * @brief A single structured event
 */
struct ResilienceEvent {
    EventType type;
    EventSeverity severity;
    /** Unix seconds */
    int64_t timestamp;
    std::map<std::string, std::string> fields;

    ResilienceEvent()
        : type(EventType::CACHE_HIT)
        , severity(EventSeverity::INFO)
        , timestamp(0)
    {}

    /** Value of a field, empty if absent */
    std::string GetField(const std::string& key) const;

    /** "breaker_opened provider=a model=m failures=3" */
    std::string ToString() const;
};

/**
 * @brief Fan-out point for resilience events
 *
 * Thread-safe. Observers are invoked synchronously on the emitting thread;
 * components emit after releasing their own locks, so an observer may call
 * back into them.
 */
class EventSink {
public:
    explicit EventSink(const Clock& clock);

    /** Observers connect here */
    boost::signals2::signal<void (const ResilienceEvent&)> NotifyEvent;

    /** Build, log and broadcast an event */
    void Emit(EventType type, const std::map<std::string, std::string>& fields);

    /** Number of events of a type emitted so far */
    uint64_t GetEventCount(EventType type) const;

    uint64_t GetTotalEventCount() const;

private:
    const Clock& clock_;
    std::array<std::atomic<uint64_t>, EVENT_TYPE_COUNT> counts_;
};

} // namespace callguard

#endif // CALLGUARD_EVENT_SINK_H
