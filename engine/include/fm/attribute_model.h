#pragma once

#include "fm/player.h"
#include "fm/engine_config.h"
#include <vector>

namespace fm {

// Position-weighted overall rating (1-99)
int calculateOverall(const Player& player);

// Performance penalty from live energy, 0 (fresh) to 0.4 (empty).
// Piecewise linear: 85+ -> 0, 70 -> 0.06, 55 -> 0.16, 40 -> 0.28, 0 -> 0.4
double energyModifier(double energy);

// 1 - energyModifier
double energyFactor(double energy);

// Overall scaled by live energy; used to compare bench and pitch players
double compositeAbility(const Player& player, double energy);

double finishingQuality(const Player& player, double energy);
double goalkeepingQuality(const Player& player, double energy);
double defendingQuality(const Player& player);

double penaltyTakerScore(const Player& player);

// Draw weights
double scorerWeight(const Player& player, double energy);
double assistWeight(const Player& player, double energy);
double injuryProneness(const Player& player, double energy);

// Likelihood of being the fouler. Grows with aggression, (1 - composure),
// energy deficit, existing bookings, and match lateness.
double foulWeight(const Player& player, double energy, int bookings, int minute,
                  const DisciplineConfig& config);

struct RatedPlayer {
    const Player* player;
    double energy;
};

constexpr double RED_CARD_STRENGTH_PENALTY = 8.0;

// Average energy-adjusted overall of the players on the pitch, posture bonus,
// minus a flat penalty per missing (sent off) player.
double teamStrength(const std::vector<RatedPlayer>& onPitch, Posture posture,
                    int missingPlayers);

} // namespace fm
