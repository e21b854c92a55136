#pragma once

#include "fm/match_state.h"
#include <string>
#include <vector>

namespace fm {

// Qualitative hints for the half-time team talk. Only hint keys leave this
// module, never the underlying numbers.
enum class MatchSituation : uint8_t { WINNING, DRAWING, LOSING };

inline const char* toString(MatchSituation s) {
    switch (s) {
        case MatchSituation::WINNING: return "winning";
        case MatchSituation::DRAWING: return "drawing";
        case MatchSituation::LOSING:  return "losing";
    }
    return "?";
}

constexpr double HINT_BUCKET_THRESHOLD = 0.02;

struct HalfTimeHintParams {
    int playerScore = 0;
    int opponentScore = 0;
    Formation playerFormation = Formation::F_4_3_3;
    Posture playerPosture = Posture::BALANCED;
    Formation opponentFormation = Formation::F_4_3_3;
    Posture opponentPosture = Posture::BALANCED;
    bool isHome = true;
};

struct HalfTimeHints {
    MatchSituation situation = MatchSituation::DRAWING;
    int goalDifference = 0;                             // absolute
    std::string defensiveHint;                          // "increases_prevention"
    std::string balancedHint;                           // "neutral"
    std::string attackingHint;                          // "increases_creation"
    std::vector<std::string> formationMatchupHints;     // never empty
};

HalfTimeHints getHalfTimeHints(const HalfTimeHintParams& params);

// From a live match, for the side the human manages. selected (optional)
// previews tactics the player is considering instead of the current ones.
HalfTimeHints getHalfTimeHints(const MatchState& state, TeamSide playerSide,
                               const Tactics* selected = nullptr);

} // namespace fm
