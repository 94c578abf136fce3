#include "disturbance.hpp"

GaussianDisturbance::GaussianDisturbance(uint64_t seed) : rng_(seed) {}

double GaussianDisturbance::sample(double std_dev) {
    std::normal_distribution<double> dist(0.0, std_dev);
    return dist(rng_);
}

void GaussianDisturbance::reseed(uint64_t seed) {
    rng_.seed(seed);
}
