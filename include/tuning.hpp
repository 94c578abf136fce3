#pragma once

#include "config.hpp"
#include "controller.hpp"
#include "performance.hpp"
#include "simulation.hpp"

#include <string>
#include <vector>

// Gain that can be fixed or searched over
struct TunableGain {
    std::string name;
    bool is_variable = false;
    double value = 0.0;      // Current/fixed value
    double min_bound = 0.0;  // Only used if variable
    double max_bound = 0.0;  // Only used if variable
};

// Offline gain search over a fixed scenario
struct TuningSetup {
    TunableGain kp;
    TunableGain ki;
    bool anti_windup = true;
    CostMetric metric = CostMetric::ISE;
    int max_eval = 200;

    // Values of variable gains only, in kp, ki order
    std::vector<double> variableValues() const;

    // Set values of variable gains from an optimization vector
    void setVariableValues(const std::vector<double>& x);

    void getVariableBounds(std::vector<double>& lb, std::vector<double>& ub) const;

    size_t numVariable() const;

    PIGains gains() const { return PIGains(kp.value, ki.value); }

    // kp / ki are either a number or "variable" with <name>_min / <name>_max
    static TuningSetup fromConfig(const Config& cfg);
};

struct TuningResult {
    PIGains gains;
    double cost = 0.0;
    double initial_cost = 0.0;
    int evaluations = 0;
};

// Closed-loop cost of a gain pair on the noise-free scenario
double evaluateGains(const PIGains& gains, bool anti_windup,
                     const SimulationParams& params, CostMetric metric);

// Bounded COBYLA search starting from the current values
TuningResult tuneGains(const TuningSetup& setup, const SimulationParams& params);
