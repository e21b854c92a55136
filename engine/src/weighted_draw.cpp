#include "fm/weighted_draw.h"
#include <algorithm>
#include <cmath>

namespace fm {

namespace {

double usableWeight(double w) {
    if (std::isnan(w) || w <= 0.0) return 0.0;
    return w;
}

} // anonymous namespace

double clampProbability(double p) {
    if (std::isnan(p)) return 0.0;
    return std::max(0.0, std::min(1.0, p));
}

double clampValue(double v, double lo, double hi) {
    return std::max(lo, std::min(hi, v));
}

int weightedIndex(const std::vector<double>& weights, double roll) {
    double total = 0.0;
    int lastPositive = -1;
    for (size_t i = 0; i < weights.size(); ++i) {
        double w = usableWeight(weights[i]);
        if (w > 0.0) {
            total += w;
            lastPositive = static_cast<int>(i);
        }
    }
    if (lastPositive < 0) return -1;

    double target = clampValue(roll, 0.0, 1.0) * total;
    double cumulative = 0.0;
    for (size_t i = 0; i < weights.size(); ++i) {
        double w = usableWeight(weights[i]);
        if (w <= 0.0) continue;
        cumulative += w;
        if (target < cumulative) return static_cast<int>(i);
    }
    // roll == 1.0 or rounding at the top end
    return lastPositive;
}

int drawWeighted(const std::vector<double>& weights, RngBase& rng) {
    bool any = std::any_of(weights.begin(), weights.end(),
                           [](double w) { return usableWeight(w) > 0.0; });
    if (!any) return -1;
    return weightedIndex(weights, rng.nextDouble());
}

bool drawChance(double probability, RngBase& rng) {
    return rng.nextDouble() < clampProbability(probability);
}

} // namespace fm
