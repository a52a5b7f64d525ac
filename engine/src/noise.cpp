#include "gi/noise.h"
#include <stdexcept>

namespace gi {

// --- SeededNoise ---

SeededNoise::SeededNoise(uint32_t seed) : rng_(seed) {}

double SeededNoise::uniform(double lo, double hi) {
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(rng_);
}

int SeededNoise::uniformInt(int lo, int hi) {
    std::uniform_int_distribution<int> dist(lo, hi);
    return dist(rng_);
}

// --- FixedNoise ---

FixedNoise::FixedNoise(std::vector<double> draws)
    : draws_(std::move(draws)) {}

double FixedNoise::next() {
    if (index_ >= draws_.size()) {
        throw std::out_of_range("FixedNoise: no more draws");
    }
    return draws_[index_++];
}

double FixedNoise::uniform(double lo, double hi) {
    return lo + (hi - lo) * next();
}

int FixedNoise::uniformInt(int lo, int hi) {
    int value = lo + static_cast<int>(next() * (hi - lo + 1));
    return value > hi ? hi : value;
}

// --- Seeding ---

uint32_t stableSeed(const std::string& key) {
    uint32_t hash = 2166136261u;
    for (unsigned char c : key) {
        hash ^= c;
        hash *= 16777619u;
    }
    return hash;
}

NoiseFactory seededNoiseFactory() {
    return [](uint32_t seed) -> std::unique_ptr<NoiseSourceBase> {
        return std::make_unique<SeededNoise>(seed);
    };
}

} // namespace gi
