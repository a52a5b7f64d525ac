#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace gi {

class NoiseSourceBase {
public:
    virtual ~NoiseSourceBase() = default;
    virtual double uniform(double lo, double hi) = 0;
    virtual int uniformInt(int lo, int hi) = 0;
};

class SeededNoise : public NoiseSourceBase {
    std::mt19937 rng_;
public:
    explicit SeededNoise(uint32_t seed);

    double uniform(double lo, double hi) override;
    int uniformInt(int lo, int hi) override;
};

// Replays fixed unit draws in [0, 1], scaled into the requested range
class FixedNoise : public NoiseSourceBase {
    std::vector<double> draws_;
    size_t index_ = 0;

    double next();
public:
    explicit FixedNoise(std::vector<double> draws);

    double uniform(double lo, double hi) override;
    int uniformInt(int lo, int hi) override;

    size_t remaining() const { return draws_.size() - index_; }
};

using NoiseFactory = std::function<std::unique_ptr<NoiseSourceBase>(uint32_t seed)>;

// FNV-1a; identical on every platform and run
uint32_t stableSeed(const std::string& key);

NoiseFactory seededNoiseFactory();

} // namespace gi
