#pragma once

#include "config.hpp"

// Offline Kp/Ki search on the configured scenario
int runTune(const Config& cfg);
