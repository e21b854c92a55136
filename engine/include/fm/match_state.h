#pragma once

#include "fm/enums.h"
#include "fm/roster.h"
#include "fm/tactics.h"
#include "fm/match_event.h"
#include "fm/engine_config.h"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace fm {

// Live overlay for one side. Roster data is shared read-only.
struct SideState {
    TeamSide side = TeamSide::HOME;
    const TeamRoster* roster = nullptr;
    Tactics tactics;
    Control control = Control::AI;
    std::vector<int> startingLineup;
    std::map<int, double> liveEnergy;   // lineup + bench, 0-100
    std::map<int, int> bookings;        // 0-2, only booked players present
    std::map<int, bool> sentOff;
    std::set<int> substitutedPlayers;   // came on or went off; never come on again
    int score = 0;
    int subsUsed = 0;

    const Player* player(int id) const;

    bool isInLineup(int id) const;
    bool isOnPitch(int id) const;       // in lineup and not sent off
    bool isOnBench(int id) const;       // listed substitute, not yet used
    bool isSentOff(int id) const;
    int bookingsOf(int id) const;
    double energyOf(int id) const;

    int onPitchCount() const;
    int sentOffCount() const;

    template<typename F>
    void forEachOnPitch(F&& func) const {
        for (int id : tactics.lineup) {
            if (!isOnPitch(id)) continue;
            const Player* p = player(id);
            if (p) func(*p);
        }
    }

    template<typename F>
    void forEachOnBench(F&& func) const {
        for (int id : tactics.substitutes) {
            if (!isOnBench(id)) continue;
            const Player* p = player(id);
            if (p) func(*p);
        }
    }
};

class MatchState {
public:
    std::string fixtureId;
    int minute = 0;
    MatchPhase phase = MatchPhase::SCHEDULED;
    TeamSide possession = TeamSide::HOME;
    int stoppageTime = 0;
    SideState home;
    SideState away;
    std::vector<MatchEvent> events;

    MatchState();

    SideState& side(TeamSide s);
    const SideState& side(TeamSide s) const;

    int homeScore() const { return home.score; }
    int awayScore() const { return away.score; }

    // Positive when `s` leads
    int goalDifference(TeamSide s) const;

    bool isFinished() const { return phase == MatchPhase::FULL_TIME; }
};

struct MatchSetup {
    const TeamRoster* homeRoster = nullptr;
    const TeamRoster* awayRoster = nullptr;
    Tactics homeTactics;
    Tactics awayTactics;
    Control homeControl = Control::AI;
    Control awayControl = Control::AI;
    std::string fixtureId;
};

// Validates both sides and builds the pre-kickoff state (phase SCHEDULED).
// Throws SetupError.
MatchState createMatchState(const MatchSetup& setup);

} // namespace fm
