#include "fm/substitution_policy.h"
#include "fm/attribute_model.h"
#include <vector>

namespace fm {

namespace {

struct Candidate {
    const Player* out;
    const Player* in;
    double outEnergy;
    double inEnergy;
    double gap;
};

// Larger gap first, then lower ids, so replays pick the same pair
bool betterCandidate(const Candidate& a, const Candidate& b) {
    if (a.gap != b.gap) return a.gap > b.gap;
    if (a.out->id != b.out->id) return a.out->id < b.out->id;
    return a.in->id < b.in->id;
}

template<typename Qualifies>
std::vector<Candidate> collectPairs(const SideState& side, Qualifies&& qualifies) {
    std::vector<Candidate> pairs;
    side.forEachOnPitch([&](const Player& out) {
        side.forEachOnBench([&](const Player& in) {
            Candidate c{&out, &in, side.energyOf(out.id), side.energyOf(in.id), 0.0};
            if (qualifies(c)) pairs.push_back(c);
        });
    });
    return pairs;
}

SubstitutionDecision pickBest(const std::vector<Candidate>& pairs, SubReason reason) {
    if (pairs.empty()) return SubstitutionDecision::none();

    const Candidate* best = &pairs[0];
    for (const auto& c : pairs) {
        if (betterCandidate(c, *best)) best = &c;
    }

    SubstitutionDecision d;
    d.valid = true;
    d.reason = reason;
    d.outgoingId = best->out->id;
    d.incomingId = best->in->id;
    d.outgoingEnergy = best->outEnergy;
    d.incomingEnergy = best->inEnergy;
    d.gap = best->gap;
    d.qualifyingPairs = static_cast<int>(pairs.size());
    return d;
}

std::vector<Candidate> fatiguePairs(const SideState& side, const SubstitutionConfig& config) {
    return collectPairs(side, [&](Candidate& c) {
        if (c.out->position != c.in->position) return false;
        if (c.outEnergy >= config.fatigueEnergyThreshold) return false;
        c.gap = c.inEnergy - c.outEnergy;
        return c.gap >= config.fatigueMinEnergyGain;
    });
}

std::vector<Candidate> protectLeadPairs(const MatchState& state, const SideState& side,
                                        int minute, const SubstitutionConfig& config) {
    if (minute < config.protectLeadMinute) return {};
    if (state.goalDifference(side.side) < config.protectLeadMargin) return {};

    return collectPairs(side, [&](Candidate& c) {
        if (!isOutfield(c.out->position) || !isOutfield(c.in->position)) return false;
        if (c.outEnergy > config.protectLeadMaxOutgoingEnergy) return false;

        // Same line or deeper; a same-line swap has to bring better defending
        if (c.in->position > c.out->position) return false;
        if (c.in->position == c.out->position &&
            defendingQuality(*c.in) - defendingQuality(*c.out) < config.protectLeadMinDefenceDelta) {
            return false;
        }

        c.gap = c.inEnergy - c.outEnergy;
        return c.gap >= config.protectLeadMinEnergyGain;
    });
}

std::vector<Candidate> tacticalPairs(const SideState& side, const SubstitutionConfig& config) {
    return collectPairs(side, [&](Candidate& c) {
        if (c.out->position != c.in->position) return false;
        if (c.outEnergy < config.fatigueEnergyThreshold) return false;
        if (c.inEnergy < config.tacticalMinIncomingEnergy) return false;
        c.gap = compositeAbility(*c.in, c.inEnergy) - compositeAbility(*c.out, c.outEnergy);
        return c.gap > config.tacticalMinAbilityDelta;
    });
}

// Checks shared by the AI and manual paths
std::string checkConstraints(const SideState& side, int outgoingId, int incomingId,
                             const SubstitutionConfig& config) {
    if (side.subsUsed >= config.maxSubs) return "substitution limit reached";
    if (!side.isInLineup(outgoingId)) return "outgoing player is not on the pitch";
    if (side.isSentOff(outgoingId)) return "outgoing player was sent off";
    if (side.substitutedPlayers.count(incomingId)) return "incoming player was already used";
    if (!side.isOnBench(incomingId)) return "incoming player is not on the bench";
    if (!side.player(outgoingId) || !side.player(incomingId)) return "unknown player";
    return "";
}

MatchEvent applySwap(MatchState& state, SideState& side, int outgoingId, int incomingId,
                     const std::string& suffix) {
    for (auto& id : side.tactics.lineup) {
        if (id == outgoingId) {
            id = incomingId;
            break;
        }
    }
    side.substitutedPlayers.insert(outgoingId);
    side.substitutedPlayers.insert(incomingId);
    side.subsUsed++;

    const Player* in = side.player(incomingId);
    const Player* out = side.player(outgoingId);

    MatchEvent evt;
    evt.minute = state.minute;
    evt.type = MatchEventType::SUBSTITUTION;
    evt.team = side.side;
    evt.playerId = incomingId;
    evt.assistPlayerId = outgoingId;
    evt.description = "Substitution: " + in->displayName() + " replaces " +
                      out->displayName() + suffix;
    state.events.push_back(evt);
    return evt;
}

void traceExecuted(TraceSink* trace, const MatchState& state, const SideState& side,
                   SubReason reason, int outgoingId, int incomingId,
                   double outgoingEnergy, double incomingEnergy, double gap,
                   bool success, const std::string& error) {
    if (!trace) return;
    AiTraceEvent evt;
    evt.type = TraceType::SUB_EXECUTED;
    evt.minute = state.minute;
    evt.team = traceTeam(side.side);
    evt.severity = success ? TraceSeverity::NOTABLE : TraceSeverity::INFO;
    evt.inputs["outgoingPlayerId"] = outgoingId;
    evt.inputs["incomingPlayerId"] = incomingId;
    evt.inputs["outgoingEnergy"] = outgoingEnergy;
    evt.inputs["incomingEnergy"] = incomingEnergy;
    evt.computed["gap"] = gap;
    evt.computed["subsUsed"] = side.subsUsed;
    evt.outcome["success"] = success;
    evt.outcome["reason"] = toString(reason);
    if (!error.empty()) evt.outcome["error"] = error;
    emitTrace(trace, evt);
}

} // anonymous namespace

SubstitutionDecision evaluateSubstitution(const MatchState& state, TeamSide sideId,
                                          int minute, const SubstitutionConfig& config,
                                          TraceSink* trace) {
    const SideState& side = state.side(sideId);
    if (side.subsUsed >= config.maxSubs) return SubstitutionDecision::none();

    SubstitutionDecision decision = pickBest(fatiguePairs(side, config), SubReason::FATIGUE);
    if (!decision.valid) {
        decision = pickBest(protectLeadPairs(state, side, minute, config),
                            SubReason::PROTECT_LEAD);
    }
    if (!decision.valid) {
        decision = pickBest(tacticalPairs(side, config), SubReason::TACTICAL);
    }

    if (trace && decision.valid) {
        AiTraceEvent evt;
        evt.type = TraceType::SUB_CANDIDATE;
        evt.minute = minute;
        evt.team = traceTeam(sideId);
        evt.inputs["subsUsed"] = side.subsUsed;
        evt.inputs["goalDifference"] = state.goalDifference(sideId);
        evt.inputs["fatigueThreshold"] = config.fatigueEnergyThreshold;
        evt.computed["qualifyingPairs"] = decision.qualifyingPairs;
        evt.computed["gap"] = decision.gap;
        evt.outcome["reason"] = toString(decision.reason);
        evt.outcome["outgoingPlayerId"] = decision.outgoingId;
        evt.outcome["incomingPlayerId"] = decision.incomingId;
        emitTrace(trace, evt);
    }
    return decision;
}

SubstitutionResult makeSubstitution(MatchState& state, TeamSide sideId, int outgoingId,
                                    int incomingId, const SubstitutionConfig& config,
                                    TraceSink* trace) {
    SideState& side = state.side(sideId);
    if (state.isFinished()) return SubstitutionResult::fail("match is over");
    if (state.phase == MatchPhase::SCHEDULED) {
        return SubstitutionResult::fail("match has not kicked off");
    }

    std::string error = checkConstraints(side, outgoingId, incomingId, config);
    if (error.empty() && side.player(outgoingId)->position != side.player(incomingId)->position) {
        error = "incoming player plays a different position";
    }

    double outEnergy = side.energyOf(outgoingId);
    double inEnergy = side.energyOf(incomingId);
    if (!error.empty()) {
        traceExecuted(trace, state, side, SubReason::MANUAL, outgoingId, incomingId,
                      outEnergy, inEnergy, 0.0, false, error);
        return SubstitutionResult::fail(error);
    }

    MatchEvent evt = applySwap(state, side, outgoingId, incomingId, "");
    traceExecuted(trace, state, side, SubReason::MANUAL, outgoingId, incomingId,
                  outEnergy, inEnergy, inEnergy - outEnergy, true, "");
    return SubstitutionResult::ok(evt);
}

SubstitutionResult executeSubstitution(MatchState& state, TeamSide sideId,
                                       const SubstitutionDecision& decision,
                                       const SubstitutionConfig& config,
                                       TraceSink* trace) {
    if (!decision.valid) return SubstitutionResult::fail("no decision");
    SideState& side = state.side(sideId);

    std::string error = checkConstraints(side, decision.outgoingId, decision.incomingId, config);
    if (!error.empty()) {
        traceExecuted(trace, state, side, decision.reason, decision.outgoingId,
                      decision.incomingId, decision.outgoingEnergy, decision.incomingEnergy,
                      decision.gap, false, error);
        return SubstitutionResult::fail(error);
    }

    std::string suffix = std::string(" [ai_reason:") + toString(decision.reason) + "]";
    MatchEvent evt = applySwap(state, side, decision.outgoingId, decision.incomingId, suffix);
    traceExecuted(trace, state, side, decision.reason, decision.outgoingId,
                  decision.incomingId, decision.outgoingEnergy, decision.incomingEnergy,
                  decision.gap, true, "");
    return SubstitutionResult::ok(evt);
}

int runAiSubstitutions(MatchState& state, TeamSide sideId, int minute,
                       const SubstitutionConfig& config, TraceSink* trace) {
    if (state.side(sideId).control != Control::AI) return 0;
    if (minute < config.earliestAiMinute) return 0;

    int made = 0;
    while (made < config.maxAiSubsPerMinute) {
        SubstitutionDecision decision = evaluateSubstitution(state, sideId, minute, config, trace);
        if (!decision.valid) break;
        SubstitutionResult result = executeSubstitution(state, sideId, decision, config, trace);
        if (!result.success) break;
        made++;
    }
    return made;
}

} // namespace fm
