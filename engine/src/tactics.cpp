#include "fm/tactics.h"
#include "fm/attribute_model.h"
#include "fm/engine_config.h"
#include "fm/weighted_draw.h"
#include <algorithm>
#include <set>

namespace fm {

FormationLines formationLines(Formation f) {
    switch (f) {
        case Formation::F_4_4_2:   return {4, 4, 2};
        case Formation::F_4_3_3:   return {4, 3, 3};
        case Formation::F_4_2_3_1: return {4, 5, 1};
        case Formation::F_3_5_2:   return {3, 5, 2};
        case Formation::F_4_5_1:   return {4, 5, 1};
        case Formation::F_5_3_2:   return {5, 3, 2};
        case Formation::F_5_4_1:   return {5, 4, 1};
        case Formation::F_3_4_3:   return {3, 4, 3};
    }
    return {4, 4, 2};
}

Formation parseFormation(const std::string& name) {
    static const Formation all[] = {
        Formation::F_4_4_2, Formation::F_4_3_3, Formation::F_4_2_3_1,
        Formation::F_3_5_2, Formation::F_4_5_1, Formation::F_5_3_2,
        Formation::F_5_4_1, Formation::F_3_4_3,
    };
    for (Formation f : all) {
        if (name == toString(f)) return f;
    }
    throw SetupError("unknown formation: " + name);
}

Posture parsePosture(const std::string& name) {
    if (name == "defensive") return Posture::DEFENSIVE;
    if (name == "balanced")  return Posture::BALANCED;
    if (name == "attacking") return Posture::ATTACKING;
    throw SetupError("unknown posture: " + name);
}

void validateTactics(const Tactics& tactics, const TeamRoster& roster) {
    const std::string team = roster.name.empty() ? roster.id : roster.name;

    if (tactics.lineup.size() != 11) {
        throw SetupError(team + ": lineup must have exactly 11 players, got " +
                         std::to_string(tactics.lineup.size()));
    }

    std::set<int> seen;
    int goalkeepers = 0;
    for (int id : tactics.lineup) {
        const Player* p = roster.findPlayer(id);
        if (!p) {
            throw SetupError(team + ": lineup player " + std::to_string(id) +
                             " is not in the roster");
        }
        if (!seen.insert(id).second) {
            throw SetupError(team + ": player " + std::to_string(id) +
                             " appears twice in the lineup");
        }
        if (p->position == Position::GK) goalkeepers++;
    }
    if (goalkeepers == 0) {
        throw SetupError(team + ": lineup has no goalkeeper");
    }
    if (goalkeepers > 1) {
        throw SetupError(team + ": lineup has " + std::to_string(goalkeepers) +
                         " goalkeepers");
    }

    for (int id : tactics.substitutes) {
        if (!roster.findPlayer(id)) {
            throw SetupError(team + ": substitute " + std::to_string(id) +
                             " is not in the roster");
        }
        if (!seen.insert(id).second) {
            throw SetupError(team + ": player " + std::to_string(id) +
                             " is listed more than once");
        }
    }
}

Tactics createDefaultTactics(const TeamRoster& roster, Formation formation,
                             Posture posture) {
    Tactics tactics;
    tactics.formation = formation;
    tactics.posture = posture;

    std::vector<const Player*> sorted;
    for (const auto& p : roster.players) sorted.push_back(&p);
    std::stable_sort(sorted.begin(), sorted.end(), [](const Player* a, const Player* b) {
        int oa = calculateOverall(*a);
        int ob = calculateOverall(*b);
        if (oa != ob) return oa > ob;
        return a->id < b->id;
    });

    FormationLines lines = formationLines(formation);
    int need[4] = {1, lines.def, lines.mid, lines.att};
    std::set<int> picked;

    for (int pos = 0; pos < 4; ++pos) {
        for (const Player* p : sorted) {
            if (need[pos] == 0) break;
            if (static_cast<int>(p->position) != pos) continue;
            tactics.lineup.push_back(p->id);
            picked.insert(p->id);
            need[pos]--;
        }
    }

    // Thin squads: fill remaining outfield slots with the best unused outfielders
    for (const Player* p : sorted) {
        if (tactics.lineup.size() >= 11) break;
        if (picked.count(p->id) || p->position == Position::GK) continue;
        tactics.lineup.push_back(p->id);
        picked.insert(p->id);
    }

    for (const Player* p : sorted) {
        if (tactics.substitutes.size() >= 7) break;
        if (picked.count(p->id)) continue;
        tactics.substitutes.push_back(p->id);
    }
    return tactics;
}

// --- Tactical impact ---

TacticalImpact postureImpact(Posture posture) {
    switch (posture) {
        case Posture::DEFENSIVE: return {-0.03, -0.06, 0.08};
        case Posture::BALANCED:  return {0.0, 0.0, 0.0};
        case Posture::ATTACKING: return {0.03, 0.08, -0.06};
    }
    return {};
}

TacticalImpact formationMatchupImpact(Formation own, Formation opponent) {
    FormationLines o = formationLines(own);
    FormationLines x = formationLines(opponent);

    // Line-for-line differences, so a mirror match-up is neutral
    int mid = o.mid - x.mid;
    int att = o.att - x.att;
    int def = o.def - x.def;
    double possession = mid * 0.012 + def * 0.003;
    double creation = att * 0.018 + mid * 0.008;
    double prevention = def * 0.018 + mid * 0.006;

    return {
        clampValue(possession, TACTICAL_IMPACT_MIN, TACTICAL_IMPACT_MAX),
        clampValue(creation, TACTICAL_IMPACT_MIN, TACTICAL_IMPACT_MAX),
        clampValue(prevention, TACTICAL_IMPACT_MIN, TACTICAL_IMPACT_MAX),
    };
}

TacticalImpact mergeImpacts(const TacticalImpact& a, const TacticalImpact& b) {
    return {
        clampValue(a.possession + b.possession, TACTICAL_IMPACT_MIN, TACTICAL_IMPACT_MAX),
        clampValue(a.creation + b.creation, TACTICAL_IMPACT_MIN, TACTICAL_IMPACT_MAX),
        clampValue(a.prevention + b.prevention, TACTICAL_IMPACT_MIN, TACTICAL_IMPACT_MAX),
    };
}

TacticalImpact tacticalImpact(const Tactics& own, const Tactics& opponent) {
    return mergeImpacts(postureImpact(own.posture),
                        formationMatchupImpact(own.formation, opponent.formation));
}

} // namespace fm
