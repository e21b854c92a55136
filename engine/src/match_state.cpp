#include "fm/match_state.h"
#include "fm/weighted_draw.h"
#include <algorithm>

namespace fm {

// --- SideState ---

const Player* SideState::player(int id) const {
    return roster ? roster->findPlayer(id) : nullptr;
}

bool SideState::isInLineup(int id) const {
    return std::find(tactics.lineup.begin(), tactics.lineup.end(), id) != tactics.lineup.end();
}

bool SideState::isOnPitch(int id) const {
    return isInLineup(id) && !isSentOff(id);
}

bool SideState::isOnBench(int id) const {
    if (substitutedPlayers.count(id)) return false;
    return std::find(tactics.substitutes.begin(), tactics.substitutes.end(), id) !=
           tactics.substitutes.end();
}

bool SideState::isSentOff(int id) const {
    auto it = sentOff.find(id);
    return it != sentOff.end() && it->second;
}

int SideState::bookingsOf(int id) const {
    auto it = bookings.find(id);
    return it == bookings.end() ? 0 : it->second;
}

double SideState::energyOf(int id) const {
    auto it = liveEnergy.find(id);
    return it == liveEnergy.end() ? 0.0 : it->second;
}

int SideState::onPitchCount() const {
    int n = 0;
    for (int id : tactics.lineup) {
        if (!isSentOff(id)) n++;
    }
    return n;
}

int SideState::sentOffCount() const {
    int n = 0;
    for (const auto& kv : sentOff) {
        if (kv.second) n++;
    }
    return n;
}

// --- MatchState ---

MatchState::MatchState() {
    home.side = TeamSide::HOME;
    away.side = TeamSide::AWAY;
}

SideState& MatchState::side(TeamSide s) {
    return s == TeamSide::HOME ? home : away;
}

const SideState& MatchState::side(TeamSide s) const {
    return s == TeamSide::HOME ? home : away;
}

int MatchState::goalDifference(TeamSide s) const {
    int diff = home.score - away.score;
    return s == TeamSide::HOME ? diff : -diff;
}

namespace {

void initSide(SideState& side, TeamSide s, const TeamRoster& roster,
              const Tactics& tactics, Control control) {
    side.side = s;
    side.roster = &roster;
    side.tactics = tactics;
    side.control = control;
    side.startingLineup = tactics.lineup;
    side.liveEnergy.clear();
    side.bookings.clear();
    side.sentOff.clear();
    side.substitutedPlayers.clear();
    side.score = 0;
    side.subsUsed = 0;

    for (int id : tactics.lineup) {
        side.liveEnergy[id] = clampValue(roster.findPlayer(id)->energy, 0.0, 100.0);
    }
    for (int id : tactics.substitutes) {
        side.liveEnergy[id] = clampValue(roster.findPlayer(id)->energy, 0.0, 100.0);
    }
}

} // anonymous namespace

MatchState createMatchState(const MatchSetup& setup) {
    if (!setup.homeRoster || !setup.awayRoster) {
        throw SetupError("both rosters are required");
    }
    validateTactics(setup.homeTactics, *setup.homeRoster);
    validateTactics(setup.awayTactics, *setup.awayRoster);

    for (const auto& p : setup.homeRoster->players) {
        if (setup.awayRoster->findPlayer(p.id)) {
            throw SetupError("player id " + std::to_string(p.id) +
                             " is used by both rosters");
        }
    }

    MatchState state;
    state.fixtureId = setup.fixtureId;
    initSide(state.home, TeamSide::HOME, *setup.homeRoster, setup.homeTactics,
             setup.homeControl);
    initSide(state.away, TeamSide::AWAY, *setup.awayRoster, setup.awayTactics,
             setup.awayControl);
    return state;
}

} // namespace fm
