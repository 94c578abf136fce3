#include "sim_setup.hpp"
#include "disturbance.hpp"

#include <stdexcept>
#include <string>
#include <utility>

SimulationParams readSimulationParams(const Config& cfg) {
    SimulationParams p;
    p.steps = cfg.getInt("steps", p.steps);
    p.Ts = cfg.getDouble("Ts", p.Ts);
    p.setpoint = cfg.getDouble("setpoint", p.setpoint);
    p.initial_value = cfg.getDouble("initial_value", p.initial_value);
    p.plant.alpha = cfg.getDouble("alpha", p.plant.alpha);
    p.plant.beta = cfg.getDouble("beta", p.plant.beta);
    p.ambient_initial = cfg.getDouble("ambient", p.ambient_initial);

    if (cfg.getBool("ambient_step", true)) {
        AmbientStep event(120, 24.0);
        event.trigger_step = cfg.getInt("ambient_step_at", event.trigger_step);
        event.value = cfg.getDouble("ambient_step_value", event.value);
        p.ambient_step = event;
    } else {
        p.ambient_step.reset();
    }

    p.noise_std = cfg.getDouble("noise_std", p.noise_std);
    p.limits.u_min = cfg.getDouble("u_min", p.limits.u_min);
    p.limits.u_max = cfg.getDouble("u_max", p.limits.u_max);

    validateParams(p);
    return p;
}

uint64_t readNoiseSeed(const Config& cfg) {
    const int seed = cfg.getInt("noise_seed", 42);
    if (seed < 0) {
        throw std::runtime_error("noise_seed must be >= 0, got " + std::to_string(seed));
    }
    return static_cast<uint64_t>(seed);
}

double readSettleBand(const Config& cfg) {
    const double band = cfg.getDouble("settle_band", 0.1);
    if (band < 0.0) {
        throw std::runtime_error("settle_band must be >= 0");
    }
    return band;
}

std::vector<ControllerConfigEntry> readControllers(const Config& cfg) {
    if (cfg.hasControllers()) {
        // Global gains only describe the single-controller setup
        if (cfg.has("kp") || cfg.has("ki")) {
            throw std::runtime_error("Global kp/ki (or --kp/--ki) cannot be combined with "
                                     "[[controller]] sections; set the gains per section");
        }
        return cfg.getControllerEntries();
    }

    ControllerConfigEntry entry;
    entry.name = "pi";
    entry.kp = cfg.getDouble("kp", 10.0);
    entry.ki = cfg.getDouble("ki", 0.5);
    entry.anti_windup = cfg.getBool("anti_windup", true);
    return {entry};
}

PIController makeController(const ControllerConfigEntry& entry, const SimulationParams& params) {
    return PIController(PIGains(entry.kp, entry.ki), params.Ts, params.limits, entry.anti_windup);
}

std::vector<RunRecord> runControllers(const std::vector<ControllerConfigEntry>& controllers,
                                      const SimulationParams& params,
                                      uint64_t seed, double settle_band) {
    std::vector<RunRecord> runs;
    runs.reserve(controllers.size());

    for (const auto& entry : controllers) {
        PIController controller = makeController(entry, params);
        GaussianDisturbance disturbance(seed);

        RunRecord run;
        run.name = entry.name;
        run.gains = controller.gains();
        run.anti_windup = controller.antiWindup();
        run.result = runSimulation(params, controller, &disturbance);
        run.summary = summarize(run.result, settle_band);
        runs.push_back(std::move(run));
    }
    return runs;
}
