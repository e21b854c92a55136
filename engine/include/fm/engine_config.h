#pragma once

#include <stdexcept>
#include <string>

namespace fm {

// Thrown for anything that must be rejected before kickoff:
// malformed tactics, unknown names, bad config files.
class SetupError : public std::invalid_argument {
public:
    explicit SetupError(const std::string& what) : std::invalid_argument(what) {}
};

struct EnergyConfig {
    double baseDrainPerMinute = 0.14;
    double defensivePostureMult = 0.85;
    double balancedPostureMult = 1.0;
    double attackingPostureMult = 1.2;
    double pressedLineMult = 1.1;     // ATT under attacking posture, DEF under defensive
    double relievedLineMult = 0.95;   // the opposite line
    double goalkeeperMult = 0.6;
    int ageBaseline = 24;
    double ageMultPerYear = 0.25 / 9.0;
    double ageMultCap = 1.35;
    double staminaMultBase = 1.3;
    double staminaMultSlope = 0.6;    // per 100 stamina
};

struct ProbabilityConfig {
    // Possession
    double homePossessionBonus = 0.08;
    double possessionMin = 0.2;
    double possessionMax = 0.8;

    // Trigger
    double eventProbabilityPerMinute = 0.15;
    int lateGameMinute = 75;
    double lateGameTriggerBoost = 0.15;   // relative increase after lateGameMinute

    // Category weights
    double chanceWeight = 0.50;
    double cardWeight = 0.18;
    double setPieceWeight = 0.18;
    double saveWeight = 0.10;
    double injuryWeight = 0.04;
    double trailingChanceBonusPerGoal = 0.05;
    int trailingBonusGoalCap = 3;
    double attackingPostureChanceBonus = 0.06;
    double defensivePostureCardBonus = 0.04;
    // Chance weight per 100 rating points of attack minus defence strength.
    // Set piece gains half of it and card loses half.
    double strengthCategoryWeight = 0.2;
    double strengthCategoryCap = 30.0;    // rating points

    // Chance kinds
    double penaltyShare = 0.06;
    double ownGoalShare = 0.03;

    // Conversion
    double baseGoalConversion = 0.3;
    double minGoalConversion = 0.05;
    double maxGoalConversion = 0.6;
    double strengthDiffConversionWeight = 0.2;  // per 100 rating points
    double energyConversionWeight = 0.5;
    double homeConversionBonus = 0.05;
    double saveShareOfMisses = 0.45;
    double assistProbability = 0.7;

    // Penalties
    double penaltyBaseConversion = 0.76;
    double penaltySkillWeight = 0.5;            // per 100 rating points of taker - keeper
    double penaltyMinConversion = 0.55;
    double penaltyMaxConversion = 0.92;

    // Set pieces
    double cornerShare = 0.45;
    double freeKickShare = 0.35;
    double offsideShare = 0.20;

    // Injuries
    double injuryEnergyLoss = 15.0;
};

struct DisciplineConfig {
    double aggressionWeight = 1.0;
    double composureWeight = 0.6;
    double energyDeficitWeight = 0.5;
    double bookingWeight = 0.4;
    double latenessWeight = 0.5;
    double directRedWeight = 1.6;   // minimum fouler weight for a straight red
    double directRedChance = 0.08;
};

struct SubstitutionConfig {
    int maxSubs = 5;
    int earliestAiMinute = 46;
    int maxAiSubsPerMinute = 3;

    double fatigueEnergyThreshold = 55.0;
    double fatigueMinEnergyGain = 20.0;

    int protectLeadMinute = 70;
    int protectLeadMargin = 1;
    double protectLeadMaxOutgoingEnergy = 75.0;
    double protectLeadMinEnergyGain = 10.0;
    double protectLeadMinDefenceDelta = 5.0;   // same-line swaps must defend better

    double tacticalMinAbilityDelta = 6.0;
    double tacticalMinIncomingEnergy = 70.0;
};

struct MatchSettings {
    int regulationMinutes = 90;
    int halfTimeMinute = 45;
    int maxStoppageMinutes = 0;   // 0 = full time exactly at regulationMinutes
    bool neutralVenue = false;
};

struct EngineConfig {
    EnergyConfig energy;
    ProbabilityConfig probability;
    DisciplineConfig discipline;
    SubstitutionConfig substitution;
    MatchSettings match;
};

// Load from JSON file. Missing keys keep their defaults.
// Throws SetupError if the file cannot be read or a value has the wrong type.
EngineConfig loadEngineConfig(const std::string& path);

// Load from JSON string (for testing)
EngineConfig loadEngineConfigFromString(const std::string& json);

// Serialize every tunable (pretty-printed JSON)
std::string engineConfigToJson(const EngineConfig& config);

} // namespace fm
