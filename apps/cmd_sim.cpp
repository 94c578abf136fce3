#include "cmd_sim.hpp"
#include "output.hpp"
#include "report.hpp"
#include "sim_setup.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::vector<std::unique_ptr<RunReporter>> makeReporters(const Config& cfg) {
    std::vector<std::unique_ptr<RunReporter>> reporters;

    std::string report = cfg.getString("report", "text");
    if (report == "text") {
        reporters.push_back(std::make_unique<TextReporter>(std::cout));
    } else if (report != "none") {
        throw std::runtime_error("report must be 'text' or 'none' (got '" + report + "')");
    }

    if (cfg.has("output")) {
        reporters.push_back(std::make_unique<Hdf5Reporter>(cfg.getString("output")));
    }
    return reporters;
}

}  // namespace

int runSim(const Config& cfg) {
    SimulationParams params = readSimulationParams(cfg);
    auto controllers = readControllers(cfg);
    uint64_t seed = readNoiseSeed(cfg);
    double settle_band = readSettleBand(cfg);
    auto reporters = makeReporters(cfg);

    std::cout << "Running " << controllers.size() << " controller(s) for "
              << params.steps << " steps..." << std::endl;
    auto runs = runControllers(controllers, params, seed, settle_band);

    for (auto& reporter : reporters) {
        reporter->report(params, runs);
    }
    if (cfg.has("output")) {
        std::cout << "Output written to " << cfg.getString("output") << std::endl;
    }

    return 0;
}

int runDemo() {
    // Room scenario: defaults of readSimulationParams, P-only against PI
    Config cfg;
    SimulationParams params = readSimulationParams(cfg);

    ControllerConfigEntry p_only;
    p_only.name = "p_only";
    p_only.kp = 10.0;
    p_only.ki = 0.0;

    ControllerConfigEntry pi;
    pi.name = "pi";
    pi.kp = 10.0;
    pi.ki = 0.5;

    std::cout << "Running P-only and PI control on the room scenario..." << std::endl;
    auto runs = runControllers({p_only, pi}, params, readNoiseSeed(cfg), readSettleBand(cfg));

    TextReporter reporter(std::cout);
    reporter.report(params, runs);
    return 0;
}
