#include "fm/round_simulator.h"
#include <algorithm>
#include <atomic>
#include <memory>
#include <thread>

namespace fm {

RoundSimulator::RoundSimulator(const std::vector<MatchSetup>& fixtures,
                               const EngineConfig& config, uint32_t baseSeed)
    : config_(config), baseSeed_(baseSeed) {
    matches_.reserve(fixtures.size());
    for (size_t i = 0; i < fixtures.size(); ++i) {
        matches_.push_back(
            std::make_unique<MatchEngine>(fixtures[i], config_, seedFor(baseSeed_, i)));
    }
}

int RoundSimulator::stepAll() {
    int advanced = 0;
    for (auto& m : matches_) {
        if (m->step()) advanced++;
    }
    return advanced;
}

void RoundSimulator::simulateAll(int threads) {
    int workers = std::min<int>(threads, static_cast<int>(matches_.size()));
    if (workers <= 1) {
        for (auto& m : matches_) m->simulateToEnd();
        return;
    }

    // Workers claim whole matches; no match is touched by two threads
    std::atomic<size_t> next{0};
    auto worker = [this, &next]() {
        for (;;) {
            size_t i = next.fetch_add(1);
            if (i >= matches_.size()) break;
            matches_[i]->simulateToEnd();
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (int w = 0; w < workers; ++w) pool.emplace_back(worker);
    for (auto& t : pool) t.join();
}

bool RoundSimulator::allFinished() const {
    return std::all_of(matches_.begin(), matches_.end(),
                       [](const std::unique_ptr<MatchEngine>& m) { return m->isFinished(); });
}

std::vector<FixtureResult> RoundSimulator::results() const {
    std::vector<FixtureResult> out;
    out.reserve(matches_.size());
    for (const auto& m : matches_) {
        const MatchState& s = m->state();
        FixtureResult r;
        r.fixtureId = s.fixtureId;
        r.homeTeam = s.home.roster->name;
        r.awayTeam = s.away.roster->name;
        r.homeScore = s.homeScore();
        r.awayScore = s.awayScore();
        r.finished = s.isFinished();
        out.push_back(r);
    }
    return out;
}

} // namespace fm
