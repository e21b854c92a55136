#pragma once

#include <cstdint>
#include <random>
#include <vector>

namespace fm {

// Uniform source for every draw a match makes. One instance per match.
class RngBase {
public:
    virtual ~RngBase() = default;
    // Uniform in [0, 1)
    virtual double nextDouble() = 0;
    // Uniform integer in [lo, hi]
    virtual int nextInt(int lo, int hi) {
        if (hi <= lo) return lo;
        int span = hi - lo + 1;
        int v = lo + static_cast<int>(nextDouble() * span);
        return v > hi ? hi : v;
    }
};

class MatchRng : public RngBase {
    std::mt19937 rng_;
public:
    explicit MatchRng(uint32_t seed);
    MatchRng();  // uses random_device

    double nextDouble() override;
};

// Scripted draws for tests
class FixedRng : public RngBase {
    std::vector<double> values_;
    size_t index_ = 0;
public:
    explicit FixedRng(std::vector<double> values);

    double nextDouble() override;

    size_t remaining() const { return values_.size() - index_; }
};

} // namespace fm
