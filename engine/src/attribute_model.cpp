#include "fm/attribute_model.h"
#include "fm/weighted_draw.h"
#include <algorithm>
#include <cmath>

namespace fm {

int calculateOverall(const Player& player) {
    const PlayerAttributes& a = player.attributes;
    double total = 0.0;
    double weightSum = 0.0;
    auto add = [&](int value, double weight) {
        total += value * weight;
        weightSum += weight;
    };

    switch (player.position) {
        case Position::GK:
            add(a.reflexes, 3); add(a.handling, 3); add(a.diving, 3);
            add(a.positioning, 2); add(a.composure, 1);
            break;
        case Position::DEF:
            add(a.tackling, 3); add(a.heading, 2); add(a.strength, 2);
            add(a.positioning, 2); add(a.speed, 1);
            break;
        case Position::MID:
            add(a.passing, 3); add(a.vision, 2); add(a.stamina, 2);
            add(a.dribbling, 1); add(a.positioning, 1); add(a.tackling, 1);
            break;
        case Position::ATT:
            add(a.shooting, 3); add(a.positioning, 2); add(a.dribbling, 2);
            add(a.speed, 2); add(a.composure, 1);
            break;
    }
    if (weightSum <= 0.0) return 50;
    return static_cast<int>(std::lround(total / weightSum));
}

double energyModifier(double energy) {
    struct Breakpoint { double energy; double penalty; };
    // Descending energy
    static const Breakpoint curve[] = {
        {85.0, 0.0}, {70.0, 0.06}, {55.0, 0.16}, {40.0, 0.28}, {0.0, 0.4},
    };

    double e = clampValue(energy, 0.0, 100.0);
    if (e >= curve[0].energy) return 0.0;
    for (size_t i = 1; i < sizeof(curve) / sizeof(curve[0]); ++i) {
        const Breakpoint& hi = curve[i - 1];
        const Breakpoint& lo = curve[i];
        if (e >= lo.energy) {
            double t = (hi.energy - e) / (hi.energy - lo.energy);
            return hi.penalty + t * (lo.penalty - hi.penalty);
        }
    }
    return 0.4;
}

double energyFactor(double energy) {
    return 1.0 - energyModifier(energy);
}

double compositeAbility(const Player& player, double energy) {
    return calculateOverall(player) * energyFactor(energy);
}

double finishingQuality(const Player& player, double energy) {
    const PlayerAttributes& a = player.attributes;
    double raw = (a.shooting * 3.0 + a.positioning * 2.0 + a.composure) / 6.0;
    return raw * energyFactor(energy);
}

double goalkeepingQuality(const Player& player, double energy) {
    const PlayerAttributes& a = player.attributes;
    double raw = (a.reflexes + a.diving + a.handling) / 3.0;
    return raw * energyFactor(energy);
}

double defendingQuality(const Player& player) {
    const PlayerAttributes& a = player.attributes;
    return (a.tackling * 3.0 + a.positioning * 2.0 + a.strength + a.heading) / 7.0;
}

double penaltyTakerScore(const Player& player) {
    const PlayerAttributes& a = player.attributes;
    return a.shooting * 0.5 + a.composure * 0.3 + a.positioning * 0.2;
}

double scorerWeight(const Player& player, double energy) {
    const PlayerAttributes& a = player.attributes;
    double w = a.shooting + a.positioning;
    if (player.position == Position::DEF) w *= 0.25;
    if (player.position == Position::GK) w = 0.0;
    return w * energyFactor(energy);
}

double assistWeight(const Player& player, double energy) {
    const PlayerAttributes& a = player.attributes;
    double w = a.passing + a.vision;
    if (player.position == Position::GK) w *= 0.05;
    return w * energyFactor(energy);
}

double injuryProneness(const Player& player, double energy) {
    double deficit = 100.0 - clampValue(energy, 0.0, 100.0);
    double frailty = (100.0 - player.attributes.strength) / 100.0;
    return 1.0 + deficit / 25.0 + frailty;
}

double foulWeight(const Player& player, double energy, int bookings, int minute,
                  const DisciplineConfig& config) {
    const PlayerAttributes& a = player.attributes;
    double aggression = clampValue(a.aggression / 100.0, 0.0, 1.0);
    double composure = clampValue(a.composure / 100.0, 0.0, 1.0);
    double deficit = (100.0 - clampValue(energy, 0.0, 100.0)) / 100.0;
    double lateness = clampValue(minute / 90.0, 0.0, 1.0);

    double base = config.aggressionWeight * aggression +
                  config.composureWeight * (1.0 - composure) +
                  config.energyDeficitWeight * deficit +
                  config.bookingWeight * bookings;
    return std::max(0.0, base * (1.0 + config.latenessWeight * lateness));
}

double teamStrength(const std::vector<RatedPlayer>& onPitch, Posture posture,
                    int missingPlayers) {
    if (onPitch.empty()) return 50.0;

    double total = 0.0;
    for (const auto& rp : onPitch) {
        total += compositeAbility(*rp.player, rp.energy);
    }
    double avg = total / onPitch.size();

    double postureBonus = 0.0;
    if (posture == Posture::ATTACKING) postureBonus = 3.0;
    else if (posture == Posture::DEFENSIVE) postureBonus = -3.0;

    return avg + postureBonus - RED_CARD_STRENGTH_PENALTY * missingPlayers;
}

} // namespace fm
