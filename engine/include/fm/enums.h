#pragma once

#include <cstdint>

namespace fm {

// --- TeamSide ---
enum class TeamSide : uint8_t { HOME, AWAY };

inline TeamSide opponent(TeamSide side) {
    return side == TeamSide::HOME ? TeamSide::AWAY : TeamSide::HOME;
}

inline const char* toString(TeamSide side) {
    return side == TeamSide::HOME ? "home" : "away";
}

// --- Position ---
// Ordered from most defensive to most attacking line.
enum class Position : uint8_t { GK, DEF, MID, ATT };

inline const char* toString(Position p) {
    switch (p) {
        case Position::GK:  return "GK";
        case Position::DEF: return "DEF";
        case Position::MID: return "MID";
        case Position::ATT: return "ATT";
    }
    return "?";
}

inline bool isOutfield(Position p) {
    return p != Position::GK;
}

// --- Posture ---
enum class Posture : uint8_t { DEFENSIVE, BALANCED, ATTACKING };

inline const char* toString(Posture p) {
    switch (p) {
        case Posture::DEFENSIVE: return "defensive";
        case Posture::BALANCED:  return "balanced";
        case Posture::ATTACKING: return "attacking";
    }
    return "?";
}

// --- Formation ---
enum class Formation : uint8_t {
    F_4_4_2, F_4_3_3, F_4_2_3_1, F_3_5_2, F_4_5_1, F_5_3_2, F_5_4_1, F_3_4_3
};

inline const char* toString(Formation f) {
    switch (f) {
        case Formation::F_4_4_2:   return "4-4-2";
        case Formation::F_4_3_3:   return "4-3-3";
        case Formation::F_4_2_3_1: return "4-2-3-1";
        case Formation::F_3_5_2:   return "3-5-2";
        case Formation::F_4_5_1:   return "4-5-1";
        case Formation::F_5_3_2:   return "5-3-2";
        case Formation::F_5_4_1:   return "5-4-1";
        case Formation::F_3_4_3:   return "3-4-3";
    }
    return "?";
}

// --- Control ---
// Which side the in-match AI manages. Human sides only change via makeSubstitution.
enum class Control : uint8_t { AI, HUMAN };

// --- MatchPhase ---
enum class MatchPhase : uint8_t {
    SCHEDULED, FIRST_HALF, SECOND_HALF, FULL_TIME
};

inline const char* toString(MatchPhase p) {
    switch (p) {
        case MatchPhase::SCHEDULED:   return "scheduled";
        case MatchPhase::FIRST_HALF:  return "first_half";
        case MatchPhase::SECOND_HALF: return "second_half";
        case MatchPhase::FULL_TIME:   return "full_time";
    }
    return "?";
}

inline bool isInProgress(MatchPhase p) {
    return p == MatchPhase::FIRST_HALF || p == MatchPhase::SECOND_HALF;
}

// --- MatchEventType ---
enum class MatchEventType : uint8_t {
    GOAL, OWN_GOAL, PENALTY_SCORED, PENALTY_MISSED, CHANCE_MISSED,
    YELLOW_CARD, RED_CARD, SUBSTITUTION, INJURY, SAVE,
    CORNER, FREE_KICK, OFFSIDE, KICKOFF, HALF_TIME, FULL_TIME
};

inline const char* toString(MatchEventType t) {
    switch (t) {
        case MatchEventType::GOAL:           return "goal";
        case MatchEventType::OWN_GOAL:       return "own_goal";
        case MatchEventType::PENALTY_SCORED: return "penalty_scored";
        case MatchEventType::PENALTY_MISSED: return "penalty_missed";
        case MatchEventType::CHANCE_MISSED:  return "chance_missed";
        case MatchEventType::YELLOW_CARD:    return "yellow_card";
        case MatchEventType::RED_CARD:       return "red_card";
        case MatchEventType::SUBSTITUTION:   return "substitution";
        case MatchEventType::INJURY:         return "injury";
        case MatchEventType::SAVE:           return "save";
        case MatchEventType::CORNER:         return "corner";
        case MatchEventType::FREE_KICK:      return "free_kick";
        case MatchEventType::OFFSIDE:        return "offside";
        case MatchEventType::KICKOFF:        return "kickoff";
        case MatchEventType::HALF_TIME:      return "half_time";
        case MatchEventType::FULL_TIME:      return "full_time";
    }
    return "?";
}

// Goals count for the event's team (own goals are credited to the benefiting side).
inline bool isScoringEvent(MatchEventType t) {
    return t == MatchEventType::GOAL || t == MatchEventType::OWN_GOAL ||
           t == MatchEventType::PENALTY_SCORED;
}

// --- EventCategory ---
// Outcome of the category roll once a minute has triggered.
enum class EventCategory : uint8_t {
    CHANCE, CARD, SET_PIECE, SAVE, INJURY
};

constexpr int EVENT_CATEGORY_COUNT = 5;

inline const char* toString(EventCategory c) {
    switch (c) {
        case EventCategory::CHANCE:    return "chance";
        case EventCategory::CARD:      return "card";
        case EventCategory::SET_PIECE: return "set_piece";
        case EventCategory::SAVE:      return "save";
        case EventCategory::INJURY:    return "injury";
    }
    return "?";
}

// --- ChanceKind ---
enum class ChanceKind : uint8_t { OPEN_PLAY, PENALTY, OWN_GOAL };

inline const char* toString(ChanceKind k) {
    switch (k) {
        case ChanceKind::OPEN_PLAY: return "open_play";
        case ChanceKind::PENALTY:   return "penalty";
        case ChanceKind::OWN_GOAL:  return "own_goal";
    }
    return "?";
}

// --- CardSeverity ---
enum class CardSeverity : uint8_t { NONE, YELLOW, RED };

inline const char* toString(CardSeverity s) {
    switch (s) {
        case CardSeverity::NONE:   return "none";
        case CardSeverity::YELLOW: return "yellow";
        case CardSeverity::RED:    return "red";
    }
    return "?";
}

// --- SubReason ---
// Priority order: first qualifying reason wins.
enum class SubReason : uint8_t { FATIGUE, PROTECT_LEAD, TACTICAL, MANUAL };

inline const char* toString(SubReason r) {
    switch (r) {
        case SubReason::FATIGUE:      return "fatigue";
        case SubReason::PROTECT_LEAD: return "protect_lead";
        case SubReason::TACTICAL:     return "tactical";
        case SubReason::MANUAL:       return "manual";
    }
    return "?";
}

// --- TraceType ---
enum class TraceType : uint8_t {
    MINUTE_CONTEXT, EVENT_PROBABILITY, CHANCE_EVALUATION, FOUL_SELECTION,
    SUB_CANDIDATE, SUB_EXECUTED, ENERGY_TICK
};

inline const char* toString(TraceType t) {
    switch (t) {
        case TraceType::MINUTE_CONTEXT:    return "minute_context";
        case TraceType::EVENT_PROBABILITY: return "event_probability";
        case TraceType::CHANCE_EVALUATION: return "chance_evaluation";
        case TraceType::FOUL_SELECTION:    return "foul_selection";
        case TraceType::SUB_CANDIDATE:     return "sub_candidate";
        case TraceType::SUB_EXECUTED:      return "sub_executed";
        case TraceType::ENERGY_TICK:       return "energy_tick";
    }
    return "?";
}

// --- TraceTeam ---
enum class TraceTeam : uint8_t { HOME, AWAY, NEUTRAL };

inline TraceTeam traceTeam(TeamSide side) {
    return side == TeamSide::HOME ? TraceTeam::HOME : TraceTeam::AWAY;
}

inline const char* toString(TraceTeam t) {
    switch (t) {
        case TraceTeam::HOME:    return "home";
        case TraceTeam::AWAY:    return "away";
        case TraceTeam::NEUTRAL: return "neutral";
    }
    return "?";
}

// --- TraceSeverity ---
enum class TraceSeverity : uint8_t { INFO, NOTABLE, CRITICAL };

inline const char* toString(TraceSeverity s) {
    switch (s) {
        case TraceSeverity::INFO:     return "info";
        case TraceSeverity::NOTABLE:  return "notable";
        case TraceSeverity::CRITICAL: return "critical";
    }
    return "?";
}

} // namespace fm
