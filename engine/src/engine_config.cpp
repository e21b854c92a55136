#include "fm/engine_config.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <type_traits>

namespace fm {

namespace {

// Field lists shared by loading and dumping

template<typename F>
void visitFields(EnergyConfig& c, F&& f) {
    f("base_drain_per_minute", c.baseDrainPerMinute);
    f("defensive_posture_mult", c.defensivePostureMult);
    f("balanced_posture_mult", c.balancedPostureMult);
    f("attacking_posture_mult", c.attackingPostureMult);
    f("pressed_line_mult", c.pressedLineMult);
    f("relieved_line_mult", c.relievedLineMult);
    f("goalkeeper_mult", c.goalkeeperMult);
    f("age_baseline", c.ageBaseline);
    f("age_mult_per_year", c.ageMultPerYear);
    f("age_mult_cap", c.ageMultCap);
    f("stamina_mult_base", c.staminaMultBase);
    f("stamina_mult_slope", c.staminaMultSlope);
}

template<typename F>
void visitFields(ProbabilityConfig& c, F&& f) {
    f("home_possession_bonus", c.homePossessionBonus);
    f("possession_min", c.possessionMin);
    f("possession_max", c.possessionMax);
    f("event_probability_per_minute", c.eventProbabilityPerMinute);
    f("late_game_minute", c.lateGameMinute);
    f("late_game_trigger_boost", c.lateGameTriggerBoost);
    f("chance_weight", c.chanceWeight);
    f("card_weight", c.cardWeight);
    f("set_piece_weight", c.setPieceWeight);
    f("save_weight", c.saveWeight);
    f("injury_weight", c.injuryWeight);
    f("trailing_chance_bonus_per_goal", c.trailingChanceBonusPerGoal);
    f("trailing_bonus_goal_cap", c.trailingBonusGoalCap);
    f("attacking_posture_chance_bonus", c.attackingPostureChanceBonus);
    f("defensive_posture_card_bonus", c.defensivePostureCardBonus);
    f("strength_category_weight", c.strengthCategoryWeight);
    f("strength_category_cap", c.strengthCategoryCap);
    f("penalty_share", c.penaltyShare);
    f("own_goal_share", c.ownGoalShare);
    f("base_goal_conversion", c.baseGoalConversion);
    f("min_goal_conversion", c.minGoalConversion);
    f("max_goal_conversion", c.maxGoalConversion);
    f("strength_diff_conversion_weight", c.strengthDiffConversionWeight);
    f("energy_conversion_weight", c.energyConversionWeight);
    f("home_conversion_bonus", c.homeConversionBonus);
    f("save_share_of_misses", c.saveShareOfMisses);
    f("assist_probability", c.assistProbability);
    f("penalty_base_conversion", c.penaltyBaseConversion);
    f("penalty_skill_weight", c.penaltySkillWeight);
    f("penalty_min_conversion", c.penaltyMinConversion);
    f("penalty_max_conversion", c.penaltyMaxConversion);
    f("corner_share", c.cornerShare);
    f("free_kick_share", c.freeKickShare);
    f("offside_share", c.offsideShare);
    f("injury_energy_loss", c.injuryEnergyLoss);
}

template<typename F>
void visitFields(DisciplineConfig& c, F&& f) {
    f("aggression_weight", c.aggressionWeight);
    f("composure_weight", c.composureWeight);
    f("energy_deficit_weight", c.energyDeficitWeight);
    f("booking_weight", c.bookingWeight);
    f("lateness_weight", c.latenessWeight);
    f("direct_red_weight", c.directRedWeight);
    f("direct_red_chance", c.directRedChance);
}

template<typename F>
void visitFields(SubstitutionConfig& c, F&& f) {
    f("max_subs", c.maxSubs);
    f("earliest_ai_minute", c.earliestAiMinute);
    f("max_ai_subs_per_minute", c.maxAiSubsPerMinute);
    f("fatigue_energy_threshold", c.fatigueEnergyThreshold);
    f("fatigue_min_energy_gain", c.fatigueMinEnergyGain);
    f("protect_lead_minute", c.protectLeadMinute);
    f("protect_lead_margin", c.protectLeadMargin);
    f("protect_lead_max_outgoing_energy", c.protectLeadMaxOutgoingEnergy);
    f("protect_lead_min_energy_gain", c.protectLeadMinEnergyGain);
    f("protect_lead_min_defence_delta", c.protectLeadMinDefenceDelta);
    f("tactical_min_ability_delta", c.tacticalMinAbilityDelta);
    f("tactical_min_incoming_energy", c.tacticalMinIncomingEnergy);
}

template<typename F>
void visitFields(MatchSettings& c, F&& f) {
    f("regulation_minutes", c.regulationMinutes);
    f("half_time_minute", c.halfTimeMinute);
    f("max_stoppage_minutes", c.maxStoppageMinutes);
    f("neutral_venue", c.neutralVenue);
}

template<typename Section>
void readSection(const nlohmann::json& root, const char* name, Section& section) {
    if (!root.contains(name)) return;
    const auto& j = root[name];
    if (!j.is_object()) {
        throw SetupError(std::string("config section '") + name + "' must be an object");
    }
    visitFields(section, [&](const char* key, auto& field) {
        if (!j.contains(key)) return;
        try {
            field = j[key].template get<std::decay_t<decltype(field)>>();
        } catch (const nlohmann::json::exception& e) {
            throw SetupError(std::string("config field '") + name + "." + key +
                             "': " + e.what());
        }
    });
}

template<typename Section>
void writeSection(nlohmann::json& root, const char* name, Section section) {
    nlohmann::json j = nlohmann::json::object();
    visitFields(section, [&](const char* key, auto& field) {
        j[key] = field;
    });
    root[name] = j;
}

EngineConfig parseJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw SetupError("engine config must be a JSON object");
    }
    EngineConfig config;
    readSection(j, "energy", config.energy);
    readSection(j, "probability", config.probability);
    readSection(j, "discipline", config.discipline);
    readSection(j, "substitution", config.substitution);
    readSection(j, "match", config.match);

    if (config.substitution.maxSubs < 0) {
        throw SetupError("substitution.max_subs must not be negative");
    }
    if (config.match.halfTimeMinute <= 0 ||
        config.match.halfTimeMinute >= config.match.regulationMinutes) {
        throw SetupError("match.half_time_minute must lie inside regulation time");
    }
    if (config.match.maxStoppageMinutes < 0) {
        throw SetupError("match.max_stoppage_minutes must not be negative");
    }
    if (config.probability.strengthCategoryCap < 0.0) {
        throw SetupError("probability.strength_category_cap must not be negative");
    }
    return config;
}

} // anonymous namespace

EngineConfig loadEngineConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw SetupError("cannot open engine config: " + path);
    }
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw SetupError("malformed engine config " + path + ": " + e.what());
    }
    return parseJson(j);
}

EngineConfig loadEngineConfigFromString(const std::string& json) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json);
    } catch (const nlohmann::json::parse_error& e) {
        throw SetupError(std::string("malformed engine config: ") + e.what());
    }
    return parseJson(j);
}

std::string engineConfigToJson(const EngineConfig& config) {
    nlohmann::json j = nlohmann::json::object();
    writeSection(j, "energy", config.energy);
    writeSection(j, "probability", config.probability);
    writeSection(j, "discipline", config.discipline);
    writeSection(j, "substitution", config.substitution);
    writeSection(j, "match", config.match);
    return j.dump(2);
}

} // namespace fm
