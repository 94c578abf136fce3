#pragma once

#include "config.hpp"

// Run every configured controller on the configured scenario and report
int runSim(const Config& cfg);

// Built-in P-only vs PI comparison on the default room scenario
int runDemo();
