#pragma once

#include "fm/enums.h"
#include <nlohmann/json.hpp>
#include <string>

namespace fm {

struct MatchEvent {
    int minute = 0;
    MatchEventType type = MatchEventType::KICKOFF;
    TeamSide team = TeamSide::HOME;
    int playerId = -1;          // substitution: incoming player
    int assistPlayerId = -1;    // substitution: outgoing player
    std::string description;

    bool operator==(const MatchEvent& o) const {
        return minute == o.minute && type == o.type && team == o.team &&
               playerId == o.playerId && assistPlayerId == o.assistPlayerId &&
               description == o.description;
    }
    bool operator!=(const MatchEvent& o) const { return !(*this == o); }
};

nlohmann::json eventToJson(const MatchEvent& event);

} // namespace fm
