#pragma once

#include <cstdint>
#include <random>

// Source of zero-mean process disturbance samples. The caller owns and seeds
// it; the simulation driver only draws from it.
class DisturbanceSource {
public:
    virtual ~DisturbanceSource() = default;

    // Draw one sample with the given standard deviation (> 0)
    virtual double sample(double std_dev) = 0;
};

// Gaussian disturbance backed by a seeded Mersenne Twister
class GaussianDisturbance : public DisturbanceSource {
public:
    explicit GaussianDisturbance(uint64_t seed);

    double sample(double std_dev) override;

    // Restart the stream from a new seed
    void reseed(uint64_t seed);

private:
    std::mt19937_64 rng_;
};
