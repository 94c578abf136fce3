#include "analysis.hpp"
#include "errors.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <limits>

LinearAnalysis analyzeClosedLoop(const PIGains& gains, double Ts, const ThermalPlant& plant,
                                 double setpoint, double ambient) {
    validateSampleTime(Ts);
    validatePlant(plant);

    const double a = plant.alpha;
    const double b = plant.beta;
    LinearAnalysis out;

    if (gains.Ki == 0.0) {
        // y[k+1] = (1 - a - a*b*Kp) y[k] + a*ambient + a*b*Kp*r
        const double pole = 1.0 - a - a * b * gains.Kp;
        out.poles.emplace_back(pole, 0.0);
        out.spectral_radius = std::abs(pole);
        out.stable = out.spectral_radius < 1.0;

        const double denom = 1.0 + b * gains.Kp;
        if (denom != 0.0) {
            out.steady_state_measured = (ambient + b * gains.Kp * setpoint) / denom;
        } else {
            out.steady_state_measured = std::numeric_limits<double>::quiet_NaN();
        }
        out.steady_state_error = setpoint - out.steady_state_measured;
        out.steady_state_integral = 0.0;
        return out;
    }

    const double k_eff = gains.Kp + gains.Ki * Ts;
    Eigen::Matrix2d A;
    A << 1.0 - a - a * b * k_eff, a * b,
         -gains.Ki * Ts,          1.0;
    Eigen::Vector2d forcing(a * ambient + a * b * k_eff * setpoint,
                            gains.Ki * Ts * setpoint);

    Eigen::EigenSolver<Eigen::Matrix2d> solver(A, false);
    const auto eigenvalues = solver.eigenvalues();
    for (Eigen::Index i = 0; i < eigenvalues.size(); ++i) {
        out.poles.push_back(eigenvalues(i));
        out.spectral_radius = std::max(out.spectral_radius, std::abs(eigenvalues(i)));
    }
    out.stable = out.spectral_radius < 1.0;

    // Fixed point: (I - A) x = forcing
    const Eigen::Matrix2d M = Eigen::Matrix2d::Identity() - A;
    const Eigen::FullPivLU<Eigen::Matrix2d> lu(M);
    if (!lu.isInvertible()) {
        // beta == 0: the actuator has no effect and no fixed point is defined
        const double nan = std::numeric_limits<double>::quiet_NaN();
        out.steady_state_measured = nan;
        out.steady_state_integral = nan;
        out.steady_state_error = nan;
        return out;
    }
    const Eigen::Vector2d x = lu.solve(forcing);
    out.steady_state_measured = x(0);
    out.steady_state_integral = x(1);
    out.steady_state_error = setpoint - x(0);
    return out;
}
