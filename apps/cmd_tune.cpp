#include "cmd_tune.hpp"
#include "output.hpp"
#include "sim_setup.hpp"
#include "tuning.hpp"

#include <iomanip>
#include <iostream>

int runTune(const Config& cfg) {
    SimulationParams params = readSimulationParams(cfg);
    TuningSetup setup = TuningSetup::fromConfig(cfg);

    if (setup.numVariable() == 0) {
        std::cerr << "Warning: neither kp nor ki is 'variable'; evaluating fixed gains only" << std::endl;
    }

    std::cout << "Tuning " << setup.numVariable() << " gain(s) on " << toString(setup.metric)
              << " over " << params.steps << " steps..." << std::endl;
    TuningResult tuned = tuneGains(setup, params);

    std::cout << std::setprecision(6);
    std::cout << "Initial: Kp=" << setup.kp.value << " Ki=" << setup.ki.value
              << " cost=" << tuned.initial_cost << "\n";
    std::cout << "Tuned:   Kp=" << tuned.gains.Kp << " Ki=" << tuned.gains.Ki
              << " cost=" << tuned.cost << " (" << tuned.evaluations << " evaluations)\n";

    if (cfg.has("output")) {
        ControllerConfigEntry entry;
        entry.name = "tuned";
        entry.kp = tuned.gains.Kp;
        entry.ki = tuned.gains.Ki;
        entry.anti_windup = setup.anti_windup;

        auto runs = runControllers({entry}, params, readNoiseSeed(cfg), readSettleBand(cfg));
        writeHDF5(cfg.getString("output"), params, runs);
        std::cout << "Output written to " << cfg.getString("output") << std::endl;
    }
    return 0;
}
