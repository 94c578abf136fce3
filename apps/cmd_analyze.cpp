#include "cmd_analyze.hpp"
#include "analysis.hpp"
#include "sim_setup.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>

int runAnalyze(const Config& cfg) {
    SimulationParams params = readSimulationParams(cfg);
    auto controllers = readControllers(cfg);

    // Steady state of the ambient the run ends with
    const double ambient = finalAmbient(params);

    std::cout << std::fixed << std::setprecision(4);
    std::cout << "Linearized closed loop (alpha=" << params.plant.alpha
              << ", beta=" << params.plant.beta << ", Ts=" << params.Ts
              << ", setpoint=" << params.setpoint << ", ambient=" << ambient << ")\n\n";

    for (const auto& entry : controllers) {
        LinearAnalysis la = analyzeClosedLoop(PIGains(entry.kp, entry.ki), params.Ts,
                                              params.plant, params.setpoint, ambient);

        std::cout << entry.name << " (Kp=" << entry.kp << ", Ki=" << entry.ki << ")\n";
        std::cout << "  poles:";
        for (const auto& p : la.poles) {
            std::cout << " " << p.real();
            if (p.imag() != 0.0) {
                std::cout << (p.imag() > 0.0 ? "+" : "-") << std::abs(p.imag()) << "i";
            }
        }
        std::cout << "\n";
        std::cout << "  spectral radius: " << la.spectral_radius
                  << (la.stable ? " (stable)" : " (UNSTABLE)") << "\n";
        std::cout << "  steady state: y=" << la.steady_state_measured
                  << ", e=" << la.steady_state_error
                  << ", I=" << la.steady_state_integral << "\n\n";
    }
    return 0;
}
