#pragma once

#include "fm/match_state.h"
#include "fm/rng.h"
#include "fm/trace.h"
#include "fm/engine_config.h"
#include "fm/substitution_policy.h"
#include <cstdint>
#include <memory>

namespace fm {

// Minute-by-minute driver. Owns the live state and (unless one is lent) the RNG.
// Phases: SCHEDULED -> FIRST_HALF -> SECOND_HALF -> FULL_TIME.
class MatchEngine {
    EngineConfig config_;
    std::unique_ptr<RngBase> ownedRng_;
    RngBase* rng_;
    TraceSink* trace_;
    MatchState state_;

public:
    // Throws SetupError if either side's tactics are invalid
    MatchEngine(const MatchSetup& setup, const EngineConfig& config, uint32_t seed,
                TraceSink* trace = nullptr);

    // Borrows rng (scripted tests); it must outlive the engine
    MatchEngine(const MatchSetup& setup, const EngineConfig& config, RngBase& rng,
                TraceSink* trace = nullptr);

    // Resumes a saved match; the snapshot's rosters must outlive the engine
    MatchEngine(const MatchState& snapshot, const EngineConfig& config, uint32_t seed,
                TraceSink* trace = nullptr);

    MatchEngine(const MatchEngine&) = delete;
    MatchEngine& operator=(const MatchEngine&) = delete;

    // Kickoff on the first call, then one minute per call.
    // Returns false once the match is over (no-op).
    bool step();

    void simulateToEnd();

    // Human-side substitution between ticks
    SubstitutionResult makeSubstitution(TeamSide side, int outgoingId, int incomingId);

    const MatchState& state() const { return state_; }
    const std::vector<MatchEvent>& events() const { return state_.events; }
    const EngineConfig& config() const { return config_; }
    bool isFinished() const { return state_.isFinished(); }

    // Minute at which full_time is blown (regulation + stoppage)
    int finalMinute() const;

    void setTraceSink(TraceSink* trace) { trace_ = trace; }

private:
    void kickoff();
    void tickEnergy(SideState& side);
    void recordMinuteContext();
    void appendEvent(MatchEventType type, const std::string& description);
};

} // namespace fm
