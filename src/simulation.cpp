#include "simulation.hpp"
#include "errors.hpp"

#include <cmath>
#include <string>

void validateParams(const SimulationParams& params) {
    if (params.steps < 0) {
        throw InvalidConfiguration("steps must be >= 0, got " + std::to_string(params.steps));
    }
    validateSampleTime(params.Ts);
    validateLimits(params.limits);
    validatePlant(params.plant);
    if (!std::isfinite(params.setpoint) || !std::isfinite(params.initial_value) ||
        !std::isfinite(params.ambient_initial)) {
        throw InvalidConfiguration("setpoint, initial value and ambient must be finite");
    }
    if (params.ambient_step) {
        if (params.ambient_step->trigger_step < 0) {
            throw InvalidConfiguration("ambient step index must be >= 0, got " +
                                       std::to_string(params.ambient_step->trigger_step));
        }
        if (!std::isfinite(params.ambient_step->value)) {
            throw InvalidConfiguration("ambient step value must be finite");
        }
    }
    if (!std::isfinite(params.noise_std) || params.noise_std < 0.0) {
        throw InvalidConfiguration("noise_std must be >= 0, got " + std::to_string(params.noise_std));
    }
}

double finalAmbient(const SimulationParams& params) {
    if (params.ambient_step && params.ambient_step->trigger_step < params.steps) {
        return params.ambient_step->value;
    }
    return params.ambient_initial;
}

SimulationResult initResult(const SimulationParams& params, double initial_integral) {
    SimulationResult result;
    result.Ts = params.Ts;
    result.limits = params.limits;

    const size_t n_states = static_cast<size_t>(params.steps) + 1;
    const size_t n_transitions = static_cast<size_t>(params.steps);
    result.time.reserve(n_states);
    result.measured.reserve(n_states);
    result.integral.reserve(n_states);
    result.setpoint.reserve(n_states);
    result.ambient.reserve(n_states);
    result.control.reserve(n_transitions);
    result.error.reserve(n_transitions);

    storeSample(result, 0.0, params.initial_value, initial_integral,
                params.setpoint, params.ambient_initial);
    return result;
}

void storeSample(SimulationResult& result, double t, double y, double integral,
                 double setpoint, double ambient) {
    result.time.push_back(t);
    result.measured.push_back(y);
    result.integral.push_back(integral);
    result.setpoint.push_back(setpoint);
    result.ambient.push_back(ambient);
}

SimulationResult runSimulation(const SimulationParams& params, PIController& controller,
                               DisturbanceSource* disturbance) {
    validateParams(params);
    if (params.noise_std > 0.0 && disturbance == nullptr) {
        throw InvalidConfiguration("noise_std > 0 requires a disturbance source");
    }

    // Every run starts from a clean integral with the scenario's bounds
    controller.setLimits(params.limits);
    controller.reset(0.0);

    SimulationResult result = initResult(params, controller.integral());

    const double r = params.setpoint;
    double y = params.initial_value;
    double ambient_now = params.ambient_initial;

    for (int k = 0; k < params.steps; ++k) {
        if (params.ambient_step && k == params.ambient_step->trigger_step) {
            ambient_now = params.ambient_step->value;
        }

        double u = controller.step(r, y);

        // Same pre-step measurement the controller used, so this equals the
        // controller's internal error. Kept separate so a filtered measurement
        // or derivative path in the controller does not change the logged error.
        double e = r - y;

        double noise = 0.0;
        if (params.noise_std > 0.0) {
            noise = disturbance->sample(params.noise_std);
        }

        y = params.plant.step(y, ambient_now, u, noise);

        result.control.push_back(u);
        result.error.push_back(e);
        storeSample(result, (k + 1) * params.Ts, y, controller.integral(), r, ambient_now);
    }

    return result;
}
