#pragma once

#include "fm/enums.h"
#include <string>

namespace fm {

// All ratings 1-99.
struct PlayerAttributes {
    // Physical
    int speed = 50;
    int strength = 50;
    int stamina = 50;

    // Technical
    int shooting = 50;
    int passing = 50;
    int dribbling = 50;
    int heading = 50;
    int tackling = 50;

    // Mental
    int positioning = 50;
    int vision = 50;
    int composure = 50;
    int aggression = 50;

    // Goalkeeping
    int reflexes = 50;
    int handling = 50;
    int diving = 50;
};

struct Player {
    int id = 0;                 // unique across both rosters of a match
    std::string name;
    std::string nickname;
    int age = 25;
    Position position = Position::MID;
    PlayerAttributes attributes{};
    double energy = 100.0;      // baseline energy carried into the match (0-100)

    const std::string& displayName() const {
        return nickname.empty() ? name : nickname;
    }
};

} // namespace fm
