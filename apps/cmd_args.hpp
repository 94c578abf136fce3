#pragma once

#include "config.hpp"
#include "parse_utils.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace cliarg {

inline bool isHelpFlag(const std::string& arg) {
    return arg == "-h" || arg == "--help";
}

inline std::string requireOptionValue(int argc, char* argv[], int& i, const char* flag) {
    if (i + 1 >= argc) {
        throw std::runtime_error(std::string("Missing value for ") + flag);
    }
    return std::string(argv[++i]);
}

inline double parseDouble(const std::string& raw, const char* flag) {
    return parseutil::parseDoubleStrict(raw, flag);
}

inline int parseInt(const std::string& raw, const char* flag) {
    return parseutil::parseIntStrict(raw, flag);
}

// Parse "K:V" (step index and new ambient) for --ambient-step
inline std::pair<int, double> parseAmbientStep(const std::string& raw, const char* flag) {
    size_t colon = raw.find(':');
    if (colon == std::string::npos) {
        throw std::runtime_error(std::string("Invalid value for ") + flag +
                                 ": expected STEP:VALUE or 'none', got '" + raw + "'");
    }
    return {parseInt(raw.substr(0, colon), flag), parseDouble(raw.substr(colon + 1), flag)};
}

// Build the command config: optional "-c <file>" plus scenario overrides.
// Every override is parsed here so malformed text never reaches the simulation.
inline Config parseCommandArgs(int argc, char* argv[], int start) {
    std::string config_file;
    std::vector<std::pair<std::string, std::string>> overrides;

    auto numeric = [&](int& i, const char* flag, const char* key) {
        std::string raw = requireOptionValue(argc, argv, i, flag);
        parseDouble(raw, flag);
        overrides.emplace_back(key, raw);
    };
    auto integer = [&](int& i, const char* flag, const char* key) {
        std::string raw = requireOptionValue(argc, argv, i, flag);
        parseInt(raw, flag);
        overrides.emplace_back(key, raw);
    };

    for (int i = start; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-c") {
            config_file = requireOptionValue(argc, argv, i, "-c");
        } else if (arg == "--kp") {
            numeric(i, "--kp", "kp");
        } else if (arg == "--ki") {
            numeric(i, "--ki", "ki");
        } else if (arg == "--setpoint") {
            numeric(i, "--setpoint", "setpoint");
        } else if (arg == "--initial") {
            numeric(i, "--initial", "initial_value");
        } else if (arg == "--ambient") {
            numeric(i, "--ambient", "ambient");
        } else if (arg == "--noise") {
            numeric(i, "--noise", "noise_std");
        } else if (arg == "--steps") {
            integer(i, "--steps", "steps");
        } else if (arg == "--seed") {
            integer(i, "--seed", "noise_seed");
        } else if (arg == "--ambient-step") {
            std::string raw = requireOptionValue(argc, argv, i, "--ambient-step");
            if (raw == "none") {
                overrides.emplace_back("ambient_step", "false");
            } else {
                const auto [k, value] = parseAmbientStep(raw, "--ambient-step");
                std::ostringstream value_text;
                value_text << std::setprecision(17) << value;
                overrides.emplace_back("ambient_step", "true");
                overrides.emplace_back("ambient_step_at", std::to_string(k));
                overrides.emplace_back("ambient_step_value", value_text.str());
            }
        } else if (arg == "-o") {
            overrides.emplace_back("output", requireOptionValue(argc, argv, i, "-o"));
        } else if (arg == "--quiet") {
            overrides.emplace_back("report", "none");
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    Config cfg = config_file.empty() ? Config() : Config::load(config_file);
    for (const auto& [key, value] : overrides) {
        cfg.set(key, value);
    }
    return cfg;
}

}  // namespace cliarg
