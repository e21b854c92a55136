#pragma once

#include "fm/rng.h"
#include <vector>

namespace fm {

// Clamp to [0, 1]; NaN maps to 0
double clampProbability(double p);

double clampValue(double v, double lo, double hi);

// Categorical selection over candidate weights. Negative and NaN weights count
// as zero. roll in [0, 1) is scaled by the total weight and walked in index
// order, so equal weights resolve towards the lower index.
// Returns -1 when no candidate has positive weight.
int weightedIndex(const std::vector<double>& weights, double roll);

// Same as weightedIndex but consumes one draw from rng. No draw is consumed
// when there is nothing to choose from.
int drawWeighted(const std::vector<double>& weights, RngBase& rng);

// Bernoulli draw against a clamped probability
bool drawChance(double probability, RngBase& rng);

} // namespace fm
