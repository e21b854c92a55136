#include "fm/match_engine.h"
#include "fm/energy_model.h"
#include "fm/probability_engine.h"
#include <memory>

namespace fm {

MatchEngine::MatchEngine(const MatchSetup& setup, const EngineConfig& config, uint32_t seed,
                         TraceSink* trace)
    : config_(config), ownedRng_(std::make_unique<MatchRng>(seed)), rng_(ownedRng_.get()),
      trace_(trace),
      state_(createMatchState(setup)) {}

MatchEngine::MatchEngine(const MatchSetup& setup, const EngineConfig& config, RngBase& rng,
                         TraceSink* trace)
    : config_(config), rng_(&rng), trace_(trace), state_(createMatchState(setup)) {}

MatchEngine::MatchEngine(const MatchState& snapshot, const EngineConfig& config, uint32_t seed,
                         TraceSink* trace)
    : config_(config), ownedRng_(std::make_unique<MatchRng>(seed)), rng_(ownedRng_.get()),
      trace_(trace),
      state_(snapshot) {
    if (!state_.home.roster || !state_.away.roster) {
        throw SetupError("snapshot has no rosters");
    }
}

int MatchEngine::finalMinute() const {
    return config_.match.regulationMinutes + state_.stoppageTime;
}

void MatchEngine::appendEvent(MatchEventType type, const std::string& description) {
    MatchEvent evt;
    evt.minute = state_.minute;
    evt.type = type;
    evt.team = TeamSide::HOME;
    evt.description = description;
    state_.events.push_back(evt);
}

void MatchEngine::kickoff() {
    state_.minute = 0;
    state_.phase = MatchPhase::FIRST_HALF;
    state_.possession = TeamSide::HOME;
    if (config_.match.maxStoppageMinutes > 0) {
        state_.stoppageTime = rng_->nextInt(1, config_.match.maxStoppageMinutes);
    }
    appendEvent(MatchEventType::KICKOFF,
                state_.home.roster->name + " vs " + state_.away.roster->name + " kicks off");
}

void MatchEngine::tickEnergy(SideState& side) {
    Posture posture = side.tactics.posture;
    double total = 0.0;
    double lowest = 100.0;
    int lowestId = -1;
    int n = 0;

    side.forEachOnPitch([&](const Player& p) {
        double next = decayEnergy(p, side.energyOf(p.id), 1, posture, config_.energy);
        side.liveEnergy[p.id] = next;
        total += next;
        if (lowestId < 0 || next < lowest) {
            lowest = next;
            lowestId = p.id;
        }
        n++;
    });

    if (trace_) {
        AiTraceEvent evt;
        evt.type = TraceType::ENERGY_TICK;
        evt.minute = state_.minute;
        evt.team = traceTeam(side.side);
        evt.inputs["posture"] = toString(posture);
        evt.inputs["onPitch"] = n;
        evt.computed["averageEnergy"] = n > 0 ? total / n : 0.0;
        evt.computed["lowestEnergy"] = lowest;
        evt.outcome["lowestPlayerId"] = lowestId;
        emitTrace(trace_, evt);
    }
}

void MatchEngine::recordMinuteContext() {
    if (!trace_) return;
    AiTraceEvent evt;
    evt.type = TraceType::MINUTE_CONTEXT;
    evt.minute = state_.minute;
    evt.team = TraceTeam::NEUTRAL;
    evt.inputs["phase"] = toString(state_.phase);
    evt.inputs["homeScore"] = state_.homeScore();
    evt.inputs["awayScore"] = state_.awayScore();
    evt.inputs["homeOnPitch"] = state_.home.onPitchCount();
    evt.inputs["awayOnPitch"] = state_.away.onPitchCount();
    evt.inputs["homeSubsUsed"] = state_.home.subsUsed;
    evt.inputs["awaySubsUsed"] = state_.away.subsUsed;
    evt.computed["finalMinute"] = finalMinute();
    emitTrace(trace_, evt);
}

bool MatchEngine::step() {
    if (state_.phase == MatchPhase::FULL_TIME) return false;

    if (state_.phase == MatchPhase::SCHEDULED) {
        kickoff();
        return true;
    }

    state_.minute++;
    if (state_.minute > config_.match.halfTimeMinute) state_.phase = MatchPhase::SECOND_HALF;
    recordMinuteContext();

    tickEnergy(state_.home);
    tickEnergy(state_.away);

    runAiSubstitutions(state_, TeamSide::HOME, state_.minute, config_.substitution, trace_);
    runAiSubstitutions(state_, TeamSide::AWAY, state_.minute, config_.substitution, trace_);

    rollMinute(state_, *rng_, config_, trace_);

    if (state_.minute == config_.match.halfTimeMinute) {
        appendEvent(MatchEventType::HALF_TIME, "Half time");
    }
    if (state_.minute >= finalMinute()) {
        appendEvent(MatchEventType::FULL_TIME, "Full time");
        state_.phase = MatchPhase::FULL_TIME;
    }
    return true;
}

void MatchEngine::simulateToEnd() {
    while (step()) {}
}

SubstitutionResult MatchEngine::makeSubstitution(TeamSide side, int outgoingId, int incomingId) {
    return fm::makeSubstitution(state_, side, outgoingId, incomingId, config_.substitution, trace_);
}

} // namespace fm
