#pragma once

// PI gains structure
struct PIGains {
    double Kp = 0.0;  // Proportional gain
    double Ki = 0.0;  // Integral gain

    PIGains() = default;
    PIGains(double kp, double ki) : Kp(kp), Ki(ki) {}
};

// Actuator output range
struct OutputLimits {
    double u_min = -100.0;
    double u_max = 100.0;

    OutputLimits() = default;
    OutputLimits(double lo, double hi) : u_min(lo), u_max(hi) {}
};

// Intermediate values of the most recent step (for debugging and analysis)
struct StepInfo {
    double error = 0.0;
    double p_term = 0.0;
    double integral_try = 0.0;  // Candidate integral before the anti-windup decision
    double u_raw = 0.0;
    double u_sat = 0.0;
    bool saturated = false;
    bool integration_held = false;  // Candidate integral was discarded
};

// Discrete PI controller with output clamping and conditional-integration
// anti-windup. With anti-windup disabled every candidate integral is committed
// (plain clamping controller).
class PIController {
public:
    PIController(const PIGains& gains, double Ts,
                 const OutputLimits& limits = OutputLimits(),
                 bool anti_windup = true);

    // One sample period: returns the bounded control output.
    // Throws InvalidInput for non-finite setpoint or measurement.
    double step(double setpoint, double measurement);

    // Set integral state to I0 and clear the last output
    void reset(double I0 = 0.0);

    // Reconfiguration. Bounds changes do not re-clamp the integral; the next
    // step re-evaluates saturation.
    void setGains(const PIGains& gains);
    void setLimits(const OutputLimits& limits);
    void setSampleTime(double Ts);
    void setAntiWindup(bool enabled) { anti_windup_ = enabled; }

    // Accessors
    const PIGains& gains() const { return gains_; }
    const OutputLimits& limits() const { return limits_; }
    double sampleTime() const { return Ts_; }
    bool antiWindup() const { return anti_windup_; }
    double integral() const { return integral_; }
    double lastOutput() const { return last_output_; }
    const StepInfo& lastStep() const { return last_step_; }

private:
    PIGains gains_;
    double Ts_;
    OutputLimits limits_;
    bool anti_windup_;

    double integral_ = 0.0;
    double last_output_ = 0.0;
    StepInfo last_step_;
};

// Throws InvalidConfiguration unless Ts is finite and positive
void validateSampleTime(double Ts);

// Throws InvalidConfiguration unless both bounds are finite and u_min <= u_max
void validateLimits(const OutputLimits& limits);
