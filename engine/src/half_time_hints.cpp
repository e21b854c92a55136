#include "fm/half_time_hints.h"
#include <cstdlib>

namespace fm {

namespace {

// +1 high, -1 low, 0 neutral
int bucket(double value) {
    if (value >= HINT_BUCKET_THRESHOLD) return 1;
    if (value <= -HINT_BUCKET_THRESHOLD) return -1;
    return 0;
}

void addHint(std::vector<std::string>& hints, double value,
             const char* favourable, const char* underPressure) {
    int b = bucket(value);
    if (b > 0) hints.push_back(favourable);
    else if (b < 0) hints.push_back(underPressure);
}

} // anonymous namespace

HalfTimeHints getHalfTimeHints(const HalfTimeHintParams& params) {
    HalfTimeHints hints;

    int diff = params.playerScore - params.opponentScore;
    if (diff > 0) hints.situation = MatchSituation::WINNING;
    else if (diff < 0) hints.situation = MatchSituation::LOSING;
    else hints.situation = MatchSituation::DRAWING;
    hints.goalDifference = std::abs(diff);

    hints.defensiveHint = "increases_prevention";
    hints.balancedHint = "neutral";
    hints.attackingHint = "increases_creation";

    TacticalImpact impact = formationMatchupImpact(params.playerFormation,
                                                   params.opponentFormation);
    addHint(hints.formationMatchupHints, impact.creation,
            "attack_favourable", "attack_under_pressure");
    addHint(hints.formationMatchupHints, impact.prevention,
            "defence_favourable", "defence_under_pressure");
    addHint(hints.formationMatchupHints, impact.possession,
            "midfield_favourable", "midfield_under_pressure");
    if (hints.formationMatchupHints.empty()) hints.formationMatchupHints.push_back("neutral");

    return hints;
}

HalfTimeHints getHalfTimeHints(const MatchState& state, TeamSide playerSide,
                               const Tactics* selected) {
    const SideState& own = state.side(playerSide);
    const SideState& opp = state.side(opponent(playerSide));
    const Tactics& tactics = selected ? *selected : own.tactics;

    HalfTimeHintParams params;
    params.playerScore = own.score;
    params.opponentScore = opp.score;
    params.playerFormation = tactics.formation;
    params.playerPosture = tactics.posture;
    params.opponentFormation = opp.tactics.formation;
    params.opponentPosture = opp.tactics.posture;
    params.isHome = playerSide == TeamSide::HOME;
    return getHalfTimeHints(params);
}

} // namespace fm
