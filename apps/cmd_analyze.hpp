#pragma once

#include "config.hpp"

// Closed-loop pole and steady-state prediction for each controller
int runAnalyze(const Config& cfg);
