#include "performance.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

PerformanceSummary summarize(const SimulationResult& result, double settle_band) {
    PerformanceSummary s;
    if (result.measured.empty()) {
        return s;
    }

    s.final_error = result.setpoint.back() - result.measured.back();

    for (size_t k = 0; k < result.error.size(); ++k) {
        const double abs_e = std::abs(result.error[k]);
        s.max_abs_error = std::max(s.max_abs_error, abs_e);
        s.iae += abs_e * result.Ts;
        s.ise += result.error[k] * result.error[k] * result.Ts;
        s.itae += result.time[k] * abs_e * result.Ts;
    }

    for (double u : result.control) {
        if (u == result.limits.u_min || u == result.limits.u_max) {
            s.saturated_steps++;
        }
    }

    // Approach direction is set by the initial error; an initial error of
    // zero counts every excursion as overshoot.
    const double initial_error = result.setpoint.front() - result.measured.front();
    for (size_t k = 0; k < result.measured.size(); ++k) {
        const double past = result.measured[k] - result.setpoint[k];
        double excursion = 0.0;
        if (initial_error > 0.0) {
            excursion = past;
        } else if (initial_error < 0.0) {
            excursion = -past;
        } else {
            excursion = std::abs(past);
        }
        s.overshoot = std::max(s.overshoot, excursion);
    }

    // Walk back from the end to find the last sample outside the band
    const size_t n = result.measured.size();
    size_t first_inside = n;
    for (size_t k = n; k-- > 0;) {
        if (std::abs(result.setpoint[k] - result.measured[k]) > settle_band) {
            break;
        }
        first_inside = k;
    }
    if (first_inside < n) {
        s.settling_time = result.time[first_inside];
    }

    return s;
}

double cost(const PerformanceSummary& summary, CostMetric metric) {
    switch (metric) {
        case CostMetric::IAE:
            return summary.iae;
        case CostMetric::ISE:
            return summary.ise;
        case CostMetric::ITAE:
            return summary.itae;
    }
    return summary.ise;
}

CostMetric parseCostMetric(const std::string& value) {
    if (value == "iae") return CostMetric::IAE;
    if (value == "ise") return CostMetric::ISE;
    if (value == "itae") return CostMetric::ITAE;
    throw std::runtime_error("Cost metric must be 'iae', 'ise', or 'itae' (got '" + value + "')");
}

std::string toString(CostMetric metric) {
    switch (metric) {
        case CostMetric::IAE:
            return "iae";
        case CostMetric::ISE:
            return "ise";
        case CostMetric::ITAE:
            return "itae";
    }
    return "ise";
}
