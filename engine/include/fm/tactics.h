#pragma once

#include "fm/enums.h"
#include "fm/roster.h"
#include <string>
#include <vector>

namespace fm {

struct Tactics {
    Formation formation = Formation::F_4_3_3;
    Posture posture = Posture::BALANCED;
    std::vector<int> lineup;        // 11 player ids in formation order
    std::vector<int> substitutes;   // bench player ids
};

struct FormationLines {
    int def;
    int mid;
    int att;
};

FormationLines formationLines(Formation f);

// Parse "4-3-3" / "attacking" etc. Throws SetupError on unknown names.
Formation parseFormation(const std::string& name);
Posture parsePosture(const std::string& name);

// Rejects anything that would make kickoff impossible: lineup size, goalkeeper
// count, unknown or duplicated ids, a player both starting and on the bench.
// Throws SetupError.
void validateTactics(const Tactics& tactics, const TeamRoster& roster);

// Best XI for the formation (one GK, then the strongest players per line),
// next seven best as substitutes.
Tactics createDefaultTactics(const TeamRoster& roster,
                             Formation formation = Formation::F_4_3_3,
                             Posture posture = Posture::BALANCED);

// --- Tactical impact ---

constexpr double TACTICAL_IMPACT_MIN = -0.2;
constexpr double TACTICAL_IMPACT_MAX = 0.2;

struct TacticalImpact {
    double possession = 0.0;
    double creation = 0.0;
    double prevention = 0.0;
};

TacticalImpact postureImpact(Posture posture);
TacticalImpact formationMatchupImpact(Formation own, Formation opponent);
TacticalImpact mergeImpacts(const TacticalImpact& a, const TacticalImpact& b);

// Posture + formation match-up of `own` against `opponent`
TacticalImpact tacticalImpact(const Tactics& own, const Tactics& opponent);

} // namespace fm
