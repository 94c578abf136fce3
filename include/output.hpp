#pragma once

#include "report.hpp"
#include "sim_setup.hpp"

#include <string>
#include <utility>
#include <vector>

// Write scenario parameters and every run's trajectories to an HDF5 file
void writeHDF5(const std::string& filename, const SimulationParams& params,
               const std::vector<RunRecord>& runs);

// RunReporter that persists to HDF5
class Hdf5Reporter : public RunReporter {
public:
    explicit Hdf5Reporter(std::string filename) : filename_(std::move(filename)) {}

    void report(const SimulationParams& params, const std::vector<RunRecord>& runs) override;

private:
    std::string filename_;
};
