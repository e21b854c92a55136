#pragma once

#include "fm/match_state.h"
#include "fm/trace.h"
#include "fm/engine_config.h"
#include <string>

namespace fm {

struct SubstitutionDecision {
    bool valid = false;
    SubReason reason = SubReason::FATIGUE;
    int outgoingId = -1;
    int incomingId = -1;
    double outgoingEnergy = 0.0;
    double incomingEnergy = 0.0;
    double gap = 0.0;        // energy gap (fatigue, protect_lead) or ability gap (tactical)
    int qualifyingPairs = 0;

    static SubstitutionDecision none() { return {}; }
};

struct SubstitutionResult {
    bool success = false;
    std::string error;
    MatchEvent event;

    static SubstitutionResult ok(const MatchEvent& evt) { return {true, "", evt}; }
    static SubstitutionResult fail(const std::string& why) { return {false, why, {}}; }
};

// Tries fatigue, protect_lead, tactical in that order; the first reason with a
// qualifying pair wins, and within it the pair with the largest gap (ties by
// outgoing id, then incoming id). Does not check side control or the minute
// window; runAiSubstitutions does.
SubstitutionDecision evaluateSubstitution(const MatchState& state, TeamSide side,
                                          int minute, const SubstitutionConfig& config,
                                          TraceSink* trace = nullptr);

// Human path: same position required. Never throws; rejections come back as fail().
SubstitutionResult makeSubstitution(MatchState& state, TeamSide side, int outgoingId,
                                    int incomingId, const SubstitutionConfig& config,
                                    TraceSink* trace = nullptr);

// Applies an AI decision: appends the event, swaps the lineup slot, counts the sub.
SubstitutionResult executeSubstitution(MatchState& state, TeamSide side,
                                       const SubstitutionDecision& decision,
                                       const SubstitutionConfig& config,
                                       TraceSink* trace = nullptr);

// Evaluates and executes repeatedly for an AI side, up to maxAiSubsPerMinute.
// Returns the number of substitutions made this minute.
int runAiSubstitutions(MatchState& state, TeamSide side, int minute,
                       const SubstitutionConfig& config, TraceSink* trace = nullptr);

} // namespace fm
