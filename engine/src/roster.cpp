#include "fm/roster.h"
#include <algorithm>
#include <cctype>

namespace fm {

namespace {

std::string toLower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c){ return std::tolower(c); });
    return out;
}

int clampRating(int v) {
    return std::max(1, std::min(99, v));
}

// Squad shape: 2 GK, 6 DEF, 5 MID, 5 ATT
constexpr Position SQUAD_POSITIONS[18] = {
    Position::GK, Position::GK,
    Position::DEF, Position::DEF, Position::DEF, Position::DEF, Position::DEF, Position::DEF,
    Position::MID, Position::MID, Position::MID, Position::MID, Position::MID,
    Position::ATT, Position::ATT, Position::ATT, Position::ATT, Position::ATT,
};

// Per-slot rating offset; first players of each line are the stronger starters
constexpr int SLOT_OFFSET[18] = {
    3, -4,
    4, 3, 2, 1, -3, -5,
    4, 2, 1, -2, -4,
    5, 3, 1, -2, -3,
};

constexpr int SLOT_AGE[18] = {
    29, 22,
    27, 31, 24, 26, 33, 20,
    25, 28, 30, 21, 34,
    26, 24, 29, 19, 32,
};

PlayerAttributes attributesFor(Position pos, int rating, int slot) {
    PlayerAttributes a;
    int lo = clampRating(rating - 25);
    int mid = clampRating(rating - 10);
    int hi = clampRating(rating);
    int wobble = (slot * 7) % 5 - 2;

    a.speed = clampRating(mid + wobble);
    a.strength = mid;
    a.stamina = clampRating(mid + 5 - wobble);
    a.shooting = lo;
    a.passing = mid;
    a.dribbling = lo;
    a.heading = mid;
    a.tackling = lo;
    a.positioning = mid;
    a.vision = mid;
    a.composure = clampRating(mid + wobble);
    a.aggression = clampRating(45 + (slot * 11) % 40);
    a.reflexes = clampRating(rating - 40);
    a.handling = clampRating(rating - 40);
    a.diving = clampRating(rating - 40);

    switch (pos) {
        case Position::GK:
            a.reflexes = hi;
            a.handling = clampRating(hi - 2);
            a.diving = clampRating(hi - 1);
            a.positioning = hi;
            a.composure = clampRating(hi - 3);
            break;
        case Position::DEF:
            a.tackling = hi;
            a.heading = clampRating(hi - 2);
            a.strength = clampRating(hi - 1);
            a.positioning = clampRating(hi - 3);
            break;
        case Position::MID:
            a.passing = hi;
            a.vision = clampRating(hi - 2);
            a.stamina = clampRating(hi + 2);
            a.dribbling = clampRating(hi - 4);
            a.tackling = mid;
            break;
        case Position::ATT:
            a.shooting = hi;
            a.positioning = clampRating(hi - 1);
            a.dribbling = clampRating(hi - 2);
            a.speed = clampRating(hi - 3);
            a.composure = clampRating(hi - 4);
            break;
    }
    return a;
}

} // anonymous namespace

const Player* TeamRoster::findPlayer(int playerId) const {
    for (const auto& p : players) {
        if (p.id == playerId) return &p;
    }
    return nullptr;
}

TeamRoster makeSquad(const std::string& name, int firstId, int baseRating) {
    TeamRoster roster;
    roster.id = toLower(name);
    roster.name = name;
    roster.shortName = name.substr(0, std::min<size_t>(3, name.size()));
    std::transform(roster.shortName.begin(), roster.shortName.end(),
                   roster.shortName.begin(),
                   [](unsigned char c){ return std::toupper(c); });

    roster.players.reserve(18);
    for (int i = 0; i < 18; ++i) {
        Player p;
        p.id = firstId + i;
        p.name = name + " " + toString(SQUAD_POSITIONS[i]) + " " + std::to_string(i + 1);
        p.age = SLOT_AGE[i];
        p.position = SQUAD_POSITIONS[i];
        p.attributes = attributesFor(p.position, clampRating(baseRating + SLOT_OFFSET[i]), i);
        p.energy = 100.0;
        roster.players.push_back(p);
    }
    return roster;
}

const TeamRoster& getLisbonRoster() {
    static const TeamRoster roster = makeSquad("Lisbon", 100, 74);
    return roster;
}

const TeamRoster& getPortoRoster() {
    static const TeamRoster roster = makeSquad("Porto", 200, 73);
    return roster;
}

const TeamRoster& getBragaRoster() {
    static const TeamRoster roster = makeSquad("Braga", 300, 68);
    return roster;
}

const TeamRoster& getMinhoRoster() {
    static const TeamRoster roster = makeSquad("Minho", 400, 61);
    return roster;
}

const TeamRoster* getRosterByName(const std::string& name) {
    std::string lower = toLower(name);
    if (lower == "lisbon") return &getLisbonRoster();
    if (lower == "porto")  return &getPortoRoster();
    if (lower == "braga")  return &getBragaRoster();
    if (lower == "minho")  return &getMinhoRoster();
    return nullptr;
}

} // namespace fm
