#pragma once

#include "config.hpp"
#include "controller.hpp"
#include "performance.hpp"
#include "simulation.hpp"

#include <cstdint>
#include <string>
#include <vector>

// One controller's run over the shared scenario
struct RunRecord {
    std::string name;
    PIGains gains;
    bool anti_windup = true;
    SimulationResult result;
    PerformanceSummary summary;
};

SimulationParams readSimulationParams(const Config& cfg);
uint64_t readNoiseSeed(const Config& cfg);
double readSettleBand(const Config& cfg);

// [[controller]] sections, or a single "pi" controller from global kp/ki
std::vector<ControllerConfigEntry> readControllers(const Config& cfg);

// Controller sampled at the scenario's Ts with the scenario's limits
PIController makeController(const ControllerConfigEntry& entry, const SimulationParams& params);

// Run every controller on the same scenario. Each run gets its own disturbance
// stream seeded with `seed`, so all runs see identical noise.
std::vector<RunRecord> runControllers(const std::vector<ControllerConfigEntry>& controllers,
                                      const SimulationParams& params,
                                      uint64_t seed, double settle_band);
