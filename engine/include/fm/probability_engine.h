#pragma once

#include "fm/match_state.h"
#include "fm/rng.h"
#include "fm/trace.h"
#include "fm/engine_config.h"
#include <vector>

namespace fm {

struct MinuteOutcome {
    bool triggered = false;
    TeamSide attacking = TeamSide::HOME;
    EventCategory category = EventCategory::CHANCE;
    ChanceKind chanceKind = ChanceKind::OPEN_PLAY;
    double homePossession = 0.5;
    double triggerProbability = 0.0;
    std::vector<MatchEvent> events;     // appended to the state this minute
};

struct ConversionEstimate {
    double attackStrength = 0.0;
    double defenceStrength = 0.0;
    double strengthTerm = 0.0;
    double tacticalTerm = 0.0;          // creation - prevention
    double energyTerm = 0.0;
    double homeTerm = 0.0;
    double raw = 0.0;
    double probability = 0.0;           // raw clamped to [min, max]
};

struct PenaltyEstimate {
    double takerQuality = 0.0;          // energy adjusted
    double keeperQuality = 0.0;         // 0 with no keeper
    double raw = 0.0;
    double probability = 0.0;
};

// Energy-adjusted strength of the players on the pitch, red cards included
double sideStrength(const SideState& side);

// --- Step probabilities (pure) ---

// Home side's share of possession, clamped
double possessionShare(const MatchState& state, const EngineConfig& config);

double triggerProbability(const MatchState& state, TeamSide attacking, int minute,
                          const ProbabilityConfig& config);

// Indexed by EventCategory
std::vector<double> categoryWeights(const MatchState& state, TeamSide attacking,
                                    const ProbabilityConfig& config);

ConversionEstimate calculateChanceConversion(const MatchState& state, TeamSide attacking,
                                             const EngineConfig& config);

// Taker vs keeper; keeper may be null (sent off, no replacement)
PenaltyEstimate estimatePenaltyConversion(const Player& taker, double takerEnergy,
                                          const Player* keeper, double keeperEnergy,
                                          const ProbabilityConfig& config);

double calculatePenaltyConversion(const Player& taker, double takerEnergy,
                                  const Player* keeper, double keeperEnergy,
                                  const ProbabilityConfig& config);

// Best on-pitch outfield taker, ties to the lower id. Null if nobody is left.
const Player* pickPenaltyTaker(const SideState& side);

const Player* goalkeeperOnPitch(const SideState& side);

// --- Minute roll ---

// Possession, trigger, category and resolution of one minute. Mutates the
// state (score, bookings, sent-offs, energy on injury) and appends events.
// Never rolls half_time or full_time.
MinuteOutcome rollMinute(MatchState& state, RngBase& rng, const EngineConfig& config,
                         TraceSink* trace = nullptr);

} // namespace fm
