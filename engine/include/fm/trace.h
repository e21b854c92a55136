#pragma once

#include "fm/enums.h"
#include <nlohmann/json.hpp>
#include <functional>
#include <ostream>
#include <vector>

namespace fm {

// One explained computation. Written once, never read by the simulation.
struct AiTraceEvent {
    TraceType type = TraceType::MINUTE_CONTEXT;
    int minute = 0;
    TraceTeam team = TraceTeam::NEUTRAL;
    TraceSeverity severity = TraceSeverity::INFO;
    nlohmann::json inputs = nlohmann::json::object();
    nlohmann::json computed = nlohmann::json::object();
    nlohmann::json outcome = nlohmann::json::object();
};

class TraceSink {
public:
    virtual ~TraceSink() = default;
    virtual void record(const AiTraceEvent& event) = 0;
};

// Model code builds trace payloads only when a sink is attached
inline void emitTrace(TraceSink* sink, const AiTraceEvent& event) {
    if (sink) sink->record(event);
}

// Append-only in-memory log, queryable for the debug overlay
class TraceRecorder : public TraceSink {
    std::vector<AiTraceEvent> events_;
public:
    void record(const AiTraceEvent& event) override;

    const std::vector<AiTraceEvent>& events() const { return events_; }
    size_t size() const { return events_.size(); }
    void clear() { events_.clear(); }

    std::vector<AiTraceEvent> ofType(TraceType type) const;
    std::vector<AiTraceEvent> atMinute(int minute) const;
    std::vector<AiTraceEvent> find(int minute, TraceTeam team, TraceType type) const;

    // First trace of `type` for (minute, team), nullptr if none
    const AiTraceEvent* findFirst(int minute, TraceTeam team, TraceType type) const;
};

// Forwards every trace to a callback (bindings, streaming to a UI)
class CallbackTraceSink : public TraceSink {
    std::function<void(const AiTraceEvent&)> callback_;
public:
    explicit CallbackTraceSink(std::function<void(const AiTraceEvent&)> callback);
    void record(const AiTraceEvent& event) override;
};

nlohmann::json traceToJson(const AiTraceEvent& event);

// One JSON object per line
void writeTraceJsonLines(std::ostream& out, const std::vector<AiTraceEvent>& events);

} // namespace fm
