// SPDX-License-Identifier: Apache-2.0
// rng.hpp - the single seedable generator threaded through a battle.
// Draws are derived from raw mt19937_64 output (not std distributions) so a seed replays identically
// across standard library implementations.
#pragma once
#include <cstdint>
#include <random>

namespace botarena::sim {

class Rng
{
public:
    explicit Rng(uint64_t seed = 1) : gen_(seed) {}

    void reseed(uint64_t seed) { gen_.seed(seed); }

    // [0, 1)
    double next01() { return static_cast<double>(gen_() >> 11) * 0x1.0p-53; }

    float uniform(float lo, float hi) { return lo + static_cast<float>(next01()) * (hi - lo); }

    double uniform(double lo, double hi) { return lo + next01() * (hi - lo); }

    bool chance(double p) { return next01() < p; }

    int sign() { return chance(0.5) ? 1 : -1; }

private:
    std::mt19937_64 gen_;
};

} // namespace botarena::sim
