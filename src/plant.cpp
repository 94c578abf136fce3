#include "plant.hpp"
#include "errors.hpp"

#include <cmath>
#include <string>

void validatePlant(const ThermalPlant& plant) {
    if (!std::isfinite(plant.alpha) || plant.alpha <= 0.0 || plant.alpha > 1.0) {
        throw InvalidConfiguration("Plant alpha must be in (0, 1], got " + std::to_string(plant.alpha));
    }
    if (!std::isfinite(plant.beta)) {
        throw InvalidConfiguration("Plant beta must be finite");
    }
}
