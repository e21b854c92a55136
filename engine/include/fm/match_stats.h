#pragma once

#include "fm/match_state.h"
#include <map>
#include <vector>

namespace fm {

// Everything the event log alone determines
struct ReplayedTotals {
    int homeScore = 0;
    int awayScore = 0;
    int homeSubsUsed = 0;
    int awaySubsUsed = 0;
    std::map<int, int> bookings;
    std::map<int, bool> sentOff;
};

ReplayedTotals replayEvents(const std::vector<MatchEvent>& events);

struct PlayerMatchStats {
    int playerId = -1;
    TeamSide side = TeamSide::HOME;
    bool started = false;
    int minutesPlayed = 0;
    int goals = 0;
    int assists = 0;
    int yellowCards = 0;
    int redCards = 0;
};

// Per-player stats for everyone who appeared (starters, then substitutes in
// order of appearance). Depends only on the starting lineups and the log.
std::vector<PlayerMatchStats> aggregatePlayerStats(const std::vector<int>& homeStarters,
                                                   const std::vector<int>& awayStarters,
                                                   const std::vector<MatchEvent>& events,
                                                   int finalMinute);

std::vector<PlayerMatchStats> aggregatePlayerStats(const MatchState& state);

} // namespace fm
