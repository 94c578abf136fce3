#pragma once

#include "simulation.hpp"

#include <optional>
#include <string>

// Scalar figures of merit for one run
struct PerformanceSummary {
    double final_error = 0.0;      // setpoint - measured at the last sample
    double max_abs_error = 0.0;
    double iae = 0.0;              // sum |e| * Ts
    double ise = 0.0;              // sum e^2 * Ts
    double itae = 0.0;             // sum t * |e| * Ts
    double overshoot = 0.0;        // Excursion past the setpoint in the approach direction
    std::optional<double> settling_time;  // First time after which |r - y| stays in band
    int saturated_steps = 0;       // Outputs sitting on a bound
};

enum class CostMetric {
    IAE,
    ISE,
    ITAE
};

PerformanceSummary summarize(const SimulationResult& result, double settle_band);

double cost(const PerformanceSummary& summary, CostMetric metric);

CostMetric parseCostMetric(const std::string& value);
std::string toString(CostMetric metric);
