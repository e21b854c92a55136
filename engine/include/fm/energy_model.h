#pragma once

#include "fm/player.h"
#include "fm/engine_config.h"

namespace fm {

// Multiplier the posture applies to a line: attacking posture presses the
// attackers, defensive posture presses the defenders. Goalkeepers use their
// own flat multiplier.
double positionPostureMultiplier(Position position, Posture posture,
                                 const EnergyConfig& config);

// Energy lost per minute on the pitch (always > 0)
double drainPerMinute(const Player& player, Posture posture, const EnergyConfig& config);

// Energy after `minutesPlayed` more minutes on the pitch, clamped to [0, 100]
double decayEnergy(const Player& player, double energy, int minutesPlayed,
                   Posture posture, const EnergyConfig& config);

} // namespace fm
