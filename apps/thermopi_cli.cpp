#include "cmd_analyze.hpp"
#include "cmd_args.hpp"
#include "cmd_sim.hpp"
#include "cmd_tune.hpp"
#include "config.hpp"

#include <iostream>
#include <string>

void printUsage(const char* prog) {
    std::cerr << "Usage: " << prog << " <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  sim        Run closed-loop simulation for each configured controller\n";
    std::cerr << "  demo       P-only vs PI on the default room scenario\n";
    std::cerr << "  tune       Search Kp/Ki minimizing the tracking cost (-c <config>)\n";
    std::cerr << "  analyze    Closed-loop poles and predicted steady state\n";
    std::cerr << "\n";
    std::cerr << "Options (sim, tune, analyze):\n";
    std::cerr << "  -c <file>             Config file (key = value, [[controller]] sections)\n";
    std::cerr << "  --kp X, --ki X        Gains of the single-controller setup\n";
    std::cerr << "  --setpoint X          Target value\n";
    std::cerr << "  --initial X           Initial measured value\n";
    std::cerr << "  --ambient X           Initial ambient value\n";
    std::cerr << "  --ambient-step K:V    Ambient becomes V at step K ('none' disables)\n";
    std::cerr << "  --steps N             Number of samples\n";
    std::cerr << "  --noise STD           Process noise standard deviation\n";
    std::cerr << "  --seed N              Noise seed\n";
    std::cerr << "  -o <file>             Write results to HDF5\n";
    std::cerr << "  --quiet               No text report\n";
    std::cerr << "\n";
    std::cerr << "Examples:\n";
    std::cerr << "  " << prog << " demo\n";
    std::cerr << "  " << prog << " sim -c configs/room.cfg -o room.h5\n";
    std::cerr << "  " << prog << " sim --kp 10 --ki 0.5 --ambient-step 120:24\n";
    std::cerr << "  " << prog << " tune -c configs/tune.cfg\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2 || cliarg::isHelpFlag(argv[1])) {
        printUsage(argv[0]);
        return argc < 2 ? 1 : 0;
    }

    std::string command = argv[1];
    for (int i = 2; i < argc; ++i) {
        if (cliarg::isHelpFlag(argv[i])) {
            printUsage(argv[0]);
            return 0;
        }
    }

    if (command == "demo") {
        try {
            return runDemo();
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }
    }

    Config cfg;
    try {
        cfg = cliarg::parseCommandArgs(argc, argv, 2);
    } catch (const std::exception& e) {
        std::cerr << "Error loading config: " << e.what() << std::endl;
        return 1;
    }

    try {
        if (command == "sim") {
            return runSim(cfg);
        } else if (command == "tune") {
            return runTune(cfg);
        } else if (command == "analyze") {
            return runAnalyze(cfg);
        } else {
            std::cerr << "Unknown command: " << command << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
