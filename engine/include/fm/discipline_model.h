#pragma once

#include "fm/match_state.h"
#include "fm/rng.h"
#include "fm/trace.h"
#include "fm/engine_config.h"

namespace fm {

struct FoulDecision {
    bool committed = false;
    int foulerId = -1;
    CardSeverity severity = CardSeverity::NONE;
    bool secondBooking = false;   // red shown for a second bookable offence
    double weight = 0.0;          // fouler's draw weight

    static FoulDecision none() { return {}; }
};

// Picks the fouler among the defending side's on-pitch, not-sent-off players
// and the card he receives. A player already booked always gets a red.
// committed == false when nobody is eligible.
FoulDecision maybeFoul(const MatchState& state, TeamSide defendingSide, int minute,
                       RngBase& rng, const DisciplineConfig& config,
                       TraceSink* trace);

// Books or dismisses the fouler. Keeps bookings == 2 exactly for sent-off players.
void applyCard(SideState& side, const FoulDecision& decision);

} // namespace fm
