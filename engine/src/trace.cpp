#include "fm/trace.h"
#include <utility>

namespace fm {

// --- TraceRecorder ---

void TraceRecorder::record(const AiTraceEvent& event) {
    events_.push_back(event);
}

std::vector<AiTraceEvent> TraceRecorder::ofType(TraceType type) const {
    std::vector<AiTraceEvent> out;
    for (const auto& e : events_) {
        if (e.type == type) out.push_back(e);
    }
    return out;
}

std::vector<AiTraceEvent> TraceRecorder::atMinute(int minute) const {
    std::vector<AiTraceEvent> out;
    for (const auto& e : events_) {
        if (e.minute == minute) out.push_back(e);
    }
    return out;
}

std::vector<AiTraceEvent> TraceRecorder::find(int minute, TraceTeam team,
                                              TraceType type) const {
    std::vector<AiTraceEvent> out;
    for (const auto& e : events_) {
        if (e.minute == minute && e.team == team && e.type == type) out.push_back(e);
    }
    return out;
}

const AiTraceEvent* TraceRecorder::findFirst(int minute, TraceTeam team,
                                             TraceType type) const {
    for (const auto& e : events_) {
        if (e.minute == minute && e.team == team && e.type == type) return &e;
    }
    return nullptr;
}

// --- CallbackTraceSink ---

CallbackTraceSink::CallbackTraceSink(std::function<void(const AiTraceEvent&)> callback)
    : callback_(std::move(callback)) {}

void CallbackTraceSink::record(const AiTraceEvent& event) {
    if (callback_) callback_(event);
}

// --- Export ---

nlohmann::json traceToJson(const AiTraceEvent& event) {
    nlohmann::json j;
    j["type"] = toString(event.type);
    j["minute"] = event.minute;
    j["team"] = toString(event.team);
    j["severity"] = toString(event.severity);
    j["inputs"] = event.inputs;
    j["computed"] = event.computed;
    j["outcome"] = event.outcome;
    return j;
}

void writeTraceJsonLines(std::ostream& out, const std::vector<AiTraceEvent>& events) {
    for (const auto& e : events) {
        out << traceToJson(e).dump() << '\n';
    }
}

} // namespace fm
