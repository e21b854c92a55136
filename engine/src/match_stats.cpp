#include "fm/match_stats.h"
#include <algorithm>

namespace fm {

ReplayedTotals replayEvents(const std::vector<MatchEvent>& events) {
    ReplayedTotals totals;
    for (const auto& e : events) {
        switch (e.type) {
            case MatchEventType::GOAL:
            case MatchEventType::OWN_GOAL:
            case MatchEventType::PENALTY_SCORED:
                if (e.team == TeamSide::HOME) totals.homeScore++;
                else totals.awayScore++;
                break;
            case MatchEventType::YELLOW_CARD:
                if (e.playerId >= 0) totals.bookings[e.playerId] = 1;
                break;
            case MatchEventType::RED_CARD:
                if (e.playerId >= 0) {
                    totals.bookings[e.playerId] = 2;
                    totals.sentOff[e.playerId] = true;
                }
                break;
            case MatchEventType::SUBSTITUTION:
                if (e.team == TeamSide::HOME) totals.homeSubsUsed++;
                else totals.awaySubsUsed++;
                break;
            default:
                break;
        }
    }
    return totals;
}

namespace {

struct Appearance {
    PlayerMatchStats stats;
    int onMinute = 0;
    int offMinute = -1;     // -1 = still on the pitch
};

} // anonymous namespace

std::vector<PlayerMatchStats> aggregatePlayerStats(const std::vector<int>& homeStarters,
                                                   const std::vector<int>& awayStarters,
                                                   const std::vector<MatchEvent>& events,
                                                   int finalMinute) {
    std::vector<Appearance> rows;
    std::map<int, size_t> rowOf;

    auto addRow = [&](int id, TeamSide side, bool started, int minute) {
        if (id < 0 || rowOf.count(id)) return;
        Appearance a;
        a.stats.playerId = id;
        a.stats.side = side;
        a.stats.started = started;
        a.onMinute = minute;
        rowOf[id] = rows.size();
        rows.push_back(a);
    };
    auto find = [&](int id) -> Appearance* {
        auto it = rowOf.find(id);
        return it == rowOf.end() ? nullptr : &rows[it->second];
    };

    for (int id : homeStarters) addRow(id, TeamSide::HOME, true, 0);
    for (int id : awayStarters) addRow(id, TeamSide::AWAY, true, 0);

    for (const auto& e : events) {
        switch (e.type) {
            case MatchEventType::GOAL:
            case MatchEventType::PENALTY_SCORED:
                if (Appearance* a = find(e.playerId)) a->stats.goals++;
                if (Appearance* a = find(e.assistPlayerId)) a->stats.assists++;
                break;
            case MatchEventType::YELLOW_CARD:
                if (Appearance* a = find(e.playerId)) a->stats.yellowCards++;
                break;
            case MatchEventType::RED_CARD:
                if (Appearance* a = find(e.playerId)) {
                    a->stats.redCards++;
                    if (a->offMinute < 0) a->offMinute = e.minute;
                }
                break;
            case MatchEventType::SUBSTITUTION:
                if (Appearance* out = find(e.assistPlayerId)) {
                    if (out->offMinute < 0) out->offMinute = e.minute;
                }
                addRow(e.playerId, e.team, false, e.minute);
                break;
            default:
                break;
        }
    }

    std::vector<PlayerMatchStats> out;
    out.reserve(rows.size());
    for (auto& a : rows) {
        int end = a.offMinute >= 0 ? a.offMinute : finalMinute;
        a.stats.minutesPlayed = std::max(0, end - a.onMinute);
        out.push_back(a.stats);
    }
    return out;
}

std::vector<PlayerMatchStats> aggregatePlayerStats(const MatchState& state) {
    return aggregatePlayerStats(state.home.startingLineup, state.away.startingLineup,
                                state.events, state.minute);
}

} // namespace fm
