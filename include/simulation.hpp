#pragma once

#include "controller.hpp"
#include "disturbance.hpp"
#include "plant.hpp"

#include <optional>
#include <vector>

// One-time change of the ambient value at a known step index
struct AmbientStep {
    int trigger_step = 0;  // Step index k at which the new value takes effect
    double value = 0.0;    // New ambient value from that step onward

    AmbientStep() = default;
    AmbientStep(int k, double v) : trigger_step(k), value(v) {}
};

// Scenario for one closed-loop run
struct SimulationParams {
    int steps = 240;
    double Ts = 1.0;
    double setpoint = 26.0;
    double initial_value = 20.0;
    ThermalPlant plant;
    double ambient_initial = 20.0;
    std::optional<AmbientStep> ambient_step = AmbientStep(120, 24.0);
    double noise_std = 0.0;
    OutputLimits limits;
};

// Trajectories of one run.
// State sequences (time, measured, integral, setpoint, ambient) hold steps + 1
// samples; transition sequences (control, error) hold steps entries, entry k
// describing the move from sample k to k + 1.
struct SimulationResult {
    double Ts = 0.0;
    OutputLimits limits;

    std::vector<double> time;
    std::vector<double> measured;
    std::vector<double> integral;
    std::vector<double> setpoint;
    std::vector<double> ambient;

    std::vector<double> control;
    std::vector<double> error;

    int steps() const { return static_cast<int>(control.size()); }
};

// Throws InvalidConfiguration on a malformed scenario
void validateParams(const SimulationParams& params);

// Run the closed loop. The controller gets the scenario's limits and is reset
// to a zero integral before the first sample. Its own Ts drives integration;
// params.Ts only spaces the time axis. `disturbance` may be null
// when params.noise_std == 0.
SimulationResult runSimulation(const SimulationParams& params, PIController& controller,
                               DisturbanceSource* disturbance = nullptr);

// Ambient in effect for the last transition: the event value if the event
// fires within params.steps, otherwise the initial ambient
double finalAmbient(const SimulationParams& params);

// Pre-sized result holding the initial sample
SimulationResult initResult(const SimulationParams& params, double initial_integral);

void storeSample(SimulationResult& result, double t, double y, double integral,
                 double setpoint, double ambient);
