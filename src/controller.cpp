#include "controller.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace {

void validateGains(const PIGains& gains) {
    if (!std::isfinite(gains.Kp) || !std::isfinite(gains.Ki)) {
        throw InvalidConfiguration("PI gains must be finite (Kp=" + std::to_string(gains.Kp) +
                                   ", Ki=" + std::to_string(gains.Ki) + ")");
    }
}

}  // namespace

void validateSampleTime(double Ts) {
    if (!std::isfinite(Ts) || Ts <= 0.0) {
        throw InvalidConfiguration("Sample time Ts must be > 0, got " + std::to_string(Ts));
    }
}

void validateLimits(const OutputLimits& limits) {
    if (!std::isfinite(limits.u_min) || !std::isfinite(limits.u_max)) {
        throw InvalidConfiguration("Output limits must be finite");
    }
    if (limits.u_min > limits.u_max) {
        throw InvalidConfiguration("Output limits inverted: u_min=" + std::to_string(limits.u_min) +
                                   " > u_max=" + std::to_string(limits.u_max));
    }
}

PIController::PIController(const PIGains& gains, double Ts,
                           const OutputLimits& limits, bool anti_windup)
    : gains_(gains), Ts_(Ts), limits_(limits), anti_windup_(anti_windup) {
    validateGains(gains_);
    validateSampleTime(Ts_);
    validateLimits(limits_);
}

double PIController::step(double setpoint, double measurement) {
    if (!std::isfinite(setpoint) || !std::isfinite(measurement)) {
        throw InvalidInput("PIController::step: non-finite input (setpoint=" +
                           std::to_string(setpoint) + ", measurement=" +
                           std::to_string(measurement) + ")");
    }

    double error = setpoint - measurement;

    // Candidate integral and raw output
    double integral_try = integral_ + gains_.Ki * Ts_ * error;
    double p_term = gains_.Kp * error;
    double u_raw = p_term + integral_try;
    if (std::isnan(u_raw)) {
        throw InvalidInput("PIController::step: raw output is NaN");
    }

    double u_sat = std::clamp(u_raw, limits_.u_min, limits_.u_max);

    // Conditional integration: hold the integral while the output is pinned
    // at a bound and the error pushes further into it.
    bool saturated = (u_raw != u_sat);
    bool pushing_deeper = (u_raw > u_sat && error > 0.0) ||
                          (u_raw < u_sat && error < 0.0);
    bool hold = anti_windup_ && saturated && pushing_deeper;
    if (!hold) {
        integral_ = integral_try;
    }

    last_output_ = u_sat;
    last_step_ = {error, p_term, integral_try, u_raw, u_sat, saturated, hold};
    return u_sat;
}

void PIController::reset(double I0) {
    integral_ = I0;
    last_output_ = 0.0;
    last_step_ = StepInfo();
}

void PIController::setGains(const PIGains& gains) {
    validateGains(gains);
    gains_ = gains;
}

void PIController::setLimits(const OutputLimits& limits) {
    validateLimits(limits);
    limits_ = limits;
}

void PIController::setSampleTime(double Ts) {
    validateSampleTime(Ts);
    Ts_ = Ts;
}
