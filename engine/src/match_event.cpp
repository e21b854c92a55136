#include "fm/match_event.h"

namespace fm {

nlohmann::json eventToJson(const MatchEvent& event) {
    nlohmann::json j;
    j["minute"] = event.minute;
    j["type"] = toString(event.type);
    j["team"] = toString(event.team);
    if (event.playerId >= 0) j["player_id"] = event.playerId;
    if (event.assistPlayerId >= 0) j["assist_player_id"] = event.assistPlayerId;
    if (!event.description.empty()) j["description"] = event.description;
    return j;
}

} // namespace fm
