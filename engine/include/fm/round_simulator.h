#pragma once

#include "fm/match_engine.h"
#include <cstdint>
#include <memory>
#include <vector>

namespace fm {

struct FixtureResult {
    std::string fixtureId;
    std::string homeTeam;
    std::string awayTeam;
    int homeScore = 0;
    int awayScore = 0;
    bool finished = false;
};

// Plays a set of independent fixtures (a league round). Each match owns its
// RNG; rosters are shared read-only, so matches may run on separate threads.
class RoundSimulator {
    EngineConfig config_;
    uint32_t baseSeed_;
    std::vector<std::unique_ptr<MatchEngine>> matches_;

public:
    // Throws SetupError if any fixture is invalid
    RoundSimulator(const std::vector<MatchSetup>& fixtures, const EngineConfig& config,
                   uint32_t baseSeed);

    static uint32_t seedFor(uint32_t baseSeed, size_t index) {
        return baseSeed + static_cast<uint32_t>(index) * 7919u;
    }

    size_t size() const { return matches_.size(); }
    MatchEngine& match(size_t index) { return *matches_.at(index); }
    const MatchEngine& match(size_t index) const { return *matches_.at(index); }

    // Advances every unfinished match by one step. Returns how many advanced.
    int stepAll();

    // Plays every match to full time. threads <= 1 runs inline.
    void simulateAll(int threads = 1);

    bool allFinished() const;

    std::vector<FixtureResult> results() const;
};

} // namespace fm
