#include "controller.hpp"
#include "disturbance.hpp"
#include "errors.hpp"
#include "performance.hpp"
#include "plant.hpp"
#include "simulation.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <iostream>

namespace {

// Disturbance that always returns the same offset
class ConstantDisturbance : public DisturbanceSource {
public:
    explicit ConstantDisturbance(double value) : value_(value) {}
    double sample(double std_dev) override {
        (void)std_dev;
        calls++;
        return value_;
    }
    int calls = 0;

private:
    double value_;
};

bool expectConfigError(const std::function<void()>& fn) {
    try {
        fn();
        return false;
    } catch (const InvalidConfiguration&) {
        return true;
    }
}

SimulationParams constantAmbient(double ambient, int steps) {
    SimulationParams params;
    params.steps = steps;
    params.ambient_initial = ambient;
    params.ambient_step.reset();
    return params;
}

// Test 1: Sequence lengths follow the state/transition convention
bool testResultSizes() {
    std::cout << "Test: Result sequence lengths\n";

    bool passed = true;
    for (int steps : {0, 1, 240}) {
        SimulationParams params;
        params.steps = steps;
        PIController pi(PIGains(10.0, 0.5), params.Ts);
        SimulationResult res = runSimulation(params, pi);

        const size_t n = static_cast<size_t>(steps);
        bool ok = res.time.size() == n + 1 && res.measured.size() == n + 1 &&
                  res.integral.size() == n + 1 && res.setpoint.size() == n + 1 &&
                  res.ambient.size() == n + 1 && res.control.size() == n &&
                  res.error.size() == n && res.steps() == steps;
        ok = ok && res.measured.front() == params.initial_value && res.time.front() == 0.0;
        std::cout << "  steps=" << steps << ": " << (ok ? "ok" : "wrong sizes") << "\n";
        passed = passed && ok;
    }

    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

// Test 2: Proportional-only control leaves the offset r / (1 + Kp*beta)
bool testProportionalOffset() {
    std::cout << "Test: P-only steady-state offset\n";

    SimulationParams params = constantAmbient(0.0, 100);
    PIController p_only(PIGains(10.0, 0.0), params.Ts);
    SimulationResult res = runSimulation(params, p_only);

    const double expected = params.setpoint / (1.0 + 10.0 * params.plant.beta);
    const double final_error = res.setpoint.back() - res.measured.back();

    bool passed = std::abs(final_error - expected) < 1e-3;
    std::cout << "  Final error: " << final_error << " (expected " << expected << ")\n";
    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

// Test 3: Adding integral action removes the offset
bool testIntegralRemovesOffset() {
    std::cout << "Test: PI removes steady-state error\n";

    SimulationParams params = constantAmbient(20.0, 150);
    PIController pi(PIGains(10.0, 0.5), params.Ts);
    SimulationResult res = runSimulation(params, pi);

    const double final_error = res.setpoint.back() - res.measured.back();
    const double final_integral = res.integral.back();
    const double expected_integral = (params.setpoint - params.ambient_initial) / params.plant.beta;

    bool passed = std::abs(final_error) < 0.01 &&
                  std::abs(final_integral - expected_integral) < 0.1;
    std::cout << "  Final error: " << final_error << " (expected ~0)\n";
    std::cout << "  Final integral: " << final_integral << " (expected ~" << expected_integral << ")\n";
    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

// Test 4: Default scenario with the ambient step recovers to the setpoint
bool testAmbientStepScenario() {
    std::cout << "Test: Ambient step scenario\n";

    SimulationParams params;  // 240 steps, ambient 20 -> 24 at k = 120
    PIController pi(PIGains(10.0, 0.5), params.Ts);
    SimulationResult res = runSimulation(params, pi);

    bool passed = res.measured.size() == 241 && res.control.size() == 240;

    // Ambient samples: 20 through index 120, 24 from index 121
    passed = passed && res.ambient[0] == 20.0 && res.ambient[120] == 20.0 &&
             res.ambient[121] == 24.0 && res.ambient.back() == 24.0;
    passed = passed && std::abs(res.time[37] - 37.0) < 1e-12;

    const double final_error = res.setpoint.back() - res.measured.back();
    passed = passed && std::abs(final_error) < 0.05;

    std::cout << "  Final error: " << final_error << " (expected ~0)\n";
    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

// Test 5: Logged error, control and plant update are mutually consistent
bool testTrajectoryConsistency() {
    std::cout << "Test: Trajectory consistency\n";

    SimulationParams params;
    params.limits = OutputLimits(-5.0, 15.0);
    PIController pi(PIGains(4.0, 0.3), params.Ts);
    SimulationResult res = runSimulation(params, pi);

    int bad = 0;
    for (int k = 0; k < res.steps(); ++k) {
        const size_t i = static_cast<size_t>(k);
        if (std::abs(res.error[i] - (res.setpoint[i] - res.measured[i])) > 1e-12) bad++;
        if (res.control[i] < params.limits.u_min || res.control[i] > params.limits.u_max) bad++;
        const double y_next = params.plant.step(res.measured[i], res.ambient[i + 1], res.control[i]);
        if (std::abs(res.measured[i + 1] - y_next) > 1e-12) bad++;
    }

    bool passed = bad == 0;
    std::cout << "  Inconsistent entries: " << bad << "\n";
    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

// Test 6: Controller is reset and given the scenario's limits
bool testControllerPreparedPerRun() {
    std::cout << "Test: Controller reset and limits applied per run\n";

    SimulationParams params = constantAmbient(20.0, 30);
    params.limits = OutputLimits(0.0, 40.0);

    PIController pi(PIGains(10.0, 0.5), params.Ts, OutputLimits(-1.0, 1.0));
    pi.reset(500.0);

    SimulationResult first = runSimulation(params, pi);
    SimulationResult second = runSimulation(params, pi);

    bool passed = first.integral.front() == 0.0 && pi.limits().u_max == 40.0 &&
                  first.measured == second.measured && first.control == second.control;
    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

// Test 7: Anti-windup keeps the integral frozen while pinned and limits the
// overshoot once the load changes; plain clamping winds up
bool testWindupInClosedLoop() {
    std::cout << "Test: Closed-loop windup vs. conditional integration\n";

    // u_max = 10 cannot reach the setpoint before the ambient step
    SimulationParams params;
    params.limits = OutputLimits(0.0, 10.0);

    PIController guarded(PIGains(10.0, 0.5), params.Ts, params.limits, true);
    PIController naive(PIGains(10.0, 0.5), params.Ts, params.limits, false);
    SimulationResult g = runSimulation(params, guarded);
    SimulationResult n = runSimulation(params, naive);

    const double g_peak = *std::max_element(g.measured.begin() + 121, g.measured.end());
    const double n_peak = *std::max_element(n.measured.begin() + 121, n.measured.end());

    bool passed = g.integral[60] == 0.0 && n.integral[60] > 30.0 && n_peak > g_peak + 1.0;

    PerformanceSummary gs = summarize(g, 0.1);
    PerformanceSummary ns = summarize(n, 0.1);
    passed = passed && gs.saturated_steps > 0 && ns.saturated_steps > gs.saturated_steps;

    std::cout << "  Integral at k=60: guarded " << g.integral[60] << ", naive " << n.integral[60] << "\n";
    std::cout << "  Peak after step: guarded " << g_peak << ", naive " << n_peak << "\n";
    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

// Test 8: Disturbance samples are added after the plant update
bool testDisturbanceInjection() {
    std::cout << "Test: Disturbance injection\n";

    SimulationParams params = constantAmbient(20.0, 5);
    params.noise_std = 1.0;
    ConstantDisturbance offset(0.5);
    PIController pi(PIGains(10.0, 0.5), params.Ts);
    SimulationResult res = runSimulation(params, pi, &offset);

    const double y1 = params.plant.step(params.initial_value, 20.0, res.control[0]) + 0.5;
    bool passed = offset.calls == 5 && std::abs(res.measured[1] - y1) < 1e-12;

    // No draws when noise is off
    params.noise_std = 0.0;
    ConstantDisturbance unused(0.5);
    runSimulation(params, pi, &unused);
    passed = passed && unused.calls == 0;

    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

// Test 9: Same seed reproduces a noisy run, different seed does not
bool testSeededNoise() {
    std::cout << "Test: Seeded noise reproducibility\n";

    SimulationParams params;
    params.noise_std = 0.2;

    PIController pi(PIGains(10.0, 0.5), params.Ts);
    GaussianDisturbance a(7);
    GaussianDisturbance b(7);
    GaussianDisturbance c(8);
    SimulationResult ra = runSimulation(params, pi, &a);
    SimulationResult rb = runSimulation(params, pi, &b);
    SimulationResult rc = runSimulation(params, pi, &c);

    a.reseed(7);
    SimulationResult rd = runSimulation(params, pi, &a);

    bool passed = ra.measured == rb.measured && ra.measured != rc.measured &&
                  ra.measured == rd.measured;
    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

// Test 10: Malformed scenarios are rejected before stepping
bool testInvalidScenario() {
    std::cout << "Test: Invalid scenario rejected\n";

    PIController pi(PIGains(10.0, 0.5), 1.0);
    auto run = [&pi](SimulationParams params) {
        return [&pi, params]() { runSimulation(params, pi); };
    };

    bool passed = true;
    SimulationParams p;

    p = SimulationParams(); p.steps = -1;
    passed &= expectConfigError(run(p));
    p = SimulationParams(); p.Ts = 0.0;
    passed &= expectConfigError(run(p));
    p = SimulationParams(); p.plant.alpha = 0.0;
    passed &= expectConfigError(run(p));
    p = SimulationParams(); p.plant.alpha = 1.5;
    passed &= expectConfigError(run(p));
    p = SimulationParams(); p.limits = OutputLimits(10.0, -10.0);
    passed &= expectConfigError(run(p));
    p = SimulationParams(); p.noise_std = -0.1;
    passed &= expectConfigError(run(p));
    p = SimulationParams(); p.ambient_step = AmbientStep(-3, 24.0);
    passed &= expectConfigError(run(p));
    p = SimulationParams(); p.noise_std = 0.5;  // No disturbance source
    passed &= expectConfigError(run(p));

    // alpha = 1 is the edge of the valid range
    p = SimulationParams(); p.plant.alpha = 1.0; p.steps = 3;
    try {
        runSimulation(p, pi);
    } catch (const std::exception&) {
        passed = false;
    }

    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

// Test 11: Ambient step at or past the horizon never fires
bool testLateAmbientStep() {
    std::cout << "Test: Ambient step beyond horizon\n";

    SimulationParams params;
    params.steps = 50;
    params.ambient_step = AmbientStep(50, 30.0);
    PIController pi(PIGains(10.0, 0.5), params.Ts);
    SimulationResult res = runSimulation(params, pi);

    bool passed = std::all_of(res.ambient.begin(), res.ambient.end(),
                              [](double a) { return a == 20.0; });
    // Steady-state ambient agrees with the one the run ends on
    passed = passed && finalAmbient(params) == 20.0 && finalAmbient(params) == res.ambient.back();

    // Step at k = 0 applies to the very first transition
    params.ambient_step = AmbientStep(0, 30.0);
    SimulationResult early = runSimulation(params, pi);
    passed = passed && early.ambient[0] == 20.0 && early.ambient[1] == 30.0;
    passed = passed && finalAmbient(params) == 30.0 && finalAmbient(params) == early.ambient.back();

    // Last possible trigger still fires
    params.ambient_step = AmbientStep(49, 30.0);
    passed = passed && finalAmbient(params) == 30.0 &&
             runSimulation(params, pi).ambient.back() == 30.0;

    params.ambient_step.reset();
    passed = passed && finalAmbient(params) == 20.0;

    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

// Test 12: Figures of merit on a hand-built trajectory
bool testPerformanceSummary() {
    std::cout << "Test: Performance summary\n";

    SimulationParams params = constantAmbient(0.0, 3);
    params.setpoint = 10.0;
    params.initial_value = 0.0;

    SimulationResult res = initResult(params, 0.0);
    const double y[] = {5.0, 11.0, 10.0};
    const double e[] = {10.0, 5.0, -1.0};
    const double u[] = {100.0, 50.0, -2.0};
    for (int k = 0; k < 3; ++k) {
        res.control.push_back(u[k]);
        res.error.push_back(e[k]);
        storeSample(res, k + 1.0, y[k], 0.0, 10.0, 0.0);
    }

    PerformanceSummary s = summarize(res, 0.5);
    bool passed = std::abs(s.iae - 16.0) < 1e-12 && std::abs(s.ise - 126.0) < 1e-12 &&
                  std::abs(s.itae - 7.0) < 1e-12 && std::abs(s.overshoot - 1.0) < 1e-12 &&
                  std::abs(s.max_abs_error - 10.0) < 1e-12 && s.final_error == 0.0 &&
                  s.saturated_steps == 1 && s.settling_time && *s.settling_time == 3.0;

    passed = passed && cost(s, CostMetric::ISE) == s.ise && cost(s, CostMetric::ITAE) == s.itae;
    passed = passed && parseCostMetric("iae") == CostMetric::IAE &&
             toString(CostMetric::ITAE) == "itae";
    try {
        parseCostMetric("mse");
        passed = false;
    } catch (const std::runtime_error&) {
    }

    // A tight band that is never entered
    PerformanceSummary tight = summarize(res, -1.0);
    passed = passed && !tight.settling_time;

    std::cout << "  IAE " << s.iae << ", ISE " << s.ise << ", ITAE " << s.itae
              << ", overshoot " << s.overshoot << "\n";
    std::cout << "  " << (passed ? "PASSED" : "FAILED") << "\n\n";
    return passed;
}

}  // namespace

int main() {
    std::cout << "Closed-Loop Simulation Tests\n";
    std::cout << "============================\n\n";

    int passed = 0;
    const int total = 12;

    if (testResultSizes()) passed++;
    if (testProportionalOffset()) passed++;
    if (testIntegralRemovesOffset()) passed++;
    if (testAmbientStepScenario()) passed++;
    if (testTrajectoryConsistency()) passed++;
    if (testControllerPreparedPerRun()) passed++;
    if (testWindupInClosedLoop()) passed++;
    if (testDisturbanceInjection()) passed++;
    if (testSeededNoise()) passed++;
    if (testInvalidScenario()) passed++;
    if (testLateAmbientStep()) passed++;
    if (testPerformanceSummary()) passed++;

    std::cout << "Summary: " << passed << "/" << total << " tests passed\n";

    return (passed == total) ? 0 : 1;
}
