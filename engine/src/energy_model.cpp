#include "fm/energy_model.h"
#include "fm/weighted_draw.h"
#include <algorithm>

namespace fm {

namespace {

double postureMultiplier(Posture posture, const EnergyConfig& config) {
    switch (posture) {
        case Posture::DEFENSIVE: return config.defensivePostureMult;
        case Posture::BALANCED:  return config.balancedPostureMult;
        case Posture::ATTACKING: return config.attackingPostureMult;
    }
    return 1.0;
}

// 1.0 up to the baseline age, linear growth after, capped
double ageMultiplier(int age, const EnergyConfig& config) {
    if (age <= config.ageBaseline) return 1.0;
    double mult = 1.0 + (age - config.ageBaseline) * config.ageMultPerYear;
    return std::min(config.ageMultCap, mult);
}

double staminaMultiplier(int stamina, const EnergyConfig& config) {
    double s = clampValue(stamina, 1.0, 99.0) / 100.0;
    return std::max(0.1, config.staminaMultBase - config.staminaMultSlope * s);
}

} // anonymous namespace

double positionPostureMultiplier(Position position, Posture posture,
                                 const EnergyConfig& config) {
    if (position == Position::GK) return config.goalkeeperMult;
    if (posture == Posture::ATTACKING) {
        if (position == Position::ATT) return config.pressedLineMult;
        if (position == Position::DEF) return config.relievedLineMult;
    } else if (posture == Posture::DEFENSIVE) {
        if (position == Position::DEF) return config.pressedLineMult;
        if (position == Position::ATT) return config.relievedLineMult;
    }
    return 1.0;
}

double drainPerMinute(const Player& player, Posture posture, const EnergyConfig& config) {
    double drain = config.baseDrainPerMinute *
                   postureMultiplier(posture, config) *
                   positionPostureMultiplier(player.position, posture, config) *
                   ageMultiplier(player.age, config) *
                   staminaMultiplier(player.attributes.stamina, config);
    return std::max(0.0, drain);
}

double decayEnergy(const Player& player, double energy, int minutesPlayed,
                   Posture posture, const EnergyConfig& config) {
    double current = clampValue(energy, 0.0, 100.0);
    if (minutesPlayed <= 0) return current;
    double next = current - drainPerMinute(player, posture, config) * minutesPlayed;
    return clampValue(next, 0.0, 100.0);
}

} // namespace fm
