#pragma once

// First-order thermal plant, explicit-Euler discretization:
//   y[k+1] = y[k] + alpha * ( -(y[k] - ambient[k]) + beta * u[k] ) + w[k]
// -(y - ambient) is passive exchange with the surroundings, beta * u the
// actuator forcing. alpha in (0, 1] keeps the passive part stable.
struct ThermalPlant {
    double alpha = 0.2;  // Response speed
    double beta = 0.5;   // Actuator effectiveness

    ThermalPlant() = default;
    ThermalPlant(double a, double b) : alpha(a), beta(b) {}

    // Rate term without the alpha scaling
    double derivative(double y, double ambient, double u) const {
        return -(y - ambient) + beta * u;
    }

    // Advance one sample
    double step(double y, double ambient, double u, double noise = 0.0) const {
        return y + alpha * derivative(y, ambient, u) + noise;
    }
};

// Throws InvalidConfiguration unless alpha is in (0, 1] and beta is finite
void validatePlant(const ThermalPlant& plant);
