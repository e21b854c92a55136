#include "fm/rng.h"
#include <stdexcept>

namespace fm {

// --- MatchRng ---

MatchRng::MatchRng(uint32_t seed) : rng_(seed) {}

MatchRng::MatchRng() : rng_(std::random_device{}()) {}

double MatchRng::nextDouble() {
    // Fixed 32-bit mapping so the sequence is identical on every standard library
    return static_cast<double>(rng_()) / 4294967296.0;
}

// --- FixedRng ---

FixedRng::FixedRng(std::vector<double> values)
    : values_(std::move(values)) {}

double FixedRng::nextDouble() {
    if (index_ >= values_.size()) {
        throw std::out_of_range("FixedRng: no more values");
    }
    return values_[index_++];
}

} // namespace fm
