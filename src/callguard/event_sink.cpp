// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <callguard/event_sink.h>
#include <logging.h>

namespace callguard {

std::string EventTypeToString(EventType type)
{
    switch (type) {
        case EventType::BREAKER_OPENED:      return "breaker_opened";
        case EventType::BREAKER_HALF_OPEN:   return "breaker_half_open";
        case EventType::BREAKER_CLOSED:      return "breaker_closed";
        case EventType::RATE_LIMIT_EXCEEDED: return "rate_limit_exceeded";
        case EventType::BUDGET_EXCEEDED:     return "budget_exceeded";
        case EventType::BUDGET_SOFT_CAP:     return "budget_soft_cap";
        case EventType::DRIFT_ALERT:         return "drift_alert";
        case EventType::FALLBACK_SERVED:     return "fallback_served";
        case EventType::CACHE_HIT:           return "cache_hit";
        default:                             return "unknown";
    }
}

std::string EventSeverityToString(EventSeverity severity)
{
    switch (severity) {
        case EventSeverity::INFO:     return "info";
        case EventSeverity::WARNING:  return "warning";
        case EventSeverity::CRITICAL: return "critical";
        default:                      return "unknown";
    }
}

EventSeverity GetEventSeverity(EventType type)
{
    switch (type) {
        case EventType::BREAKER_OPENED:
        case EventType::BUDGET_EXCEEDED:
            return EventSeverity::CRITICAL;
        case EventType::RATE_LIMIT_EXCEEDED:
        case EventType::BUDGET_SOFT_CAP:
        case EventType::DRIFT_ALERT:
        case EventType::FALLBACK_SERVED:
            return EventSeverity::WARNING;
        default:
            return EventSeverity::INFO;
    }
}

std::string ResilienceEvent::GetField(const std::string& key) const
{
    auto it = fields.find(key);
    if (it == fields.end()) return "";
    return it->second;
}

std::string ResilienceEvent::ToString() const
{
    std::string str = EventTypeToString(type);
    for (const auto& field : fields) {
        str += strprintf(" %s=%s", field.first, field.second);
    }
    return str;
}

EventSink::EventSink(const Clock& clock)
    : clock_(clock)
{
    for (auto& count : counts_) {
        count.store(0);
    }
}

void EventSink::Emit(EventType type, const std::map<std::string, std::string>& fields)
{
    ResilienceEvent event;
    event.type = type;
    event.severity = GetEventSeverity(type);
    event.timestamp = clock_.WallTimeSeconds();
    event.fields = fields;

    counts_[static_cast<size_t>(type)]++;

    if (event.severity == EventSeverity::CRITICAL) {
        LogPrintf("CRITICAL: %s\n", event.ToString());
    } else {
        LogPrint(CGLog::EVENTS, "[%s] %s\n", EventSeverityToString(event.severity), event.ToString());
    }

    NotifyEvent(event);
}

uint64_t EventSink::GetEventCount(EventType type) const
{
    return counts_[static_cast<size_t>(type)].load();
}

uint64_t EventSink::GetTotalEventCount() const
{
    uint64_t total = 0;
    for (const auto& count : counts_) {
        total += count.load();
    }
    return total;
}

} // namespace callguard
