#pragma once

#include "fm/player.h"
#include <string>
#include <vector>

namespace fm {

struct TeamRoster {
    std::string id;
    std::string name;
    std::string shortName;
    std::vector<Player> players;

    const Player* findPlayer(int playerId) const;
};

// Deterministic 18-man squad (2 GK, 6 DEF, 5 MID, 5 ATT) with ids
// firstId..firstId+17, every rating close to baseRating.
TeamRoster makeSquad(const std::string& name, int firstId, int baseRating);

// Built-in squads used by the CLI and examples
const TeamRoster& getLisbonRoster();
const TeamRoster& getPortoRoster();
const TeamRoster& getBragaRoster();
const TeamRoster& getMinhoRoster();

// Lookup built-in roster by name (case-insensitive), nullptr if unknown
const TeamRoster* getRosterByName(const std::string& name);

} // namespace fm
