#pragma once

#include "controller.hpp"
#include "plant.hpp"

#include <complex>
#include <vector>

// Linearized closed loop (no saturation, no noise, constant setpoint and
// ambient). With Ki != 0 the state is [y, I]:
//   A = [[1 - alpha - alpha*beta*(Kp + Ki*Ts), alpha*beta],
//        [-Ki*Ts,                               1         ]]
// With Ki == 0 the integral is frozen at zero and the loop is scalar.
struct LinearAnalysis {
    std::vector<std::complex<double>> poles;
    double spectral_radius = 0.0;
    bool stable = false;
    double steady_state_measured = 0.0;
    double steady_state_error = 0.0;
    double steady_state_integral = 0.0;
};

LinearAnalysis analyzeClosedLoop(const PIGains& gains, double Ts, const ThermalPlant& plant,
                                 double setpoint, double ambient);
