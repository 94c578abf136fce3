#include "output.hpp"

#include <highfive/H5Easy.hpp>
#include <highfive/H5File.hpp>
#include <Eigen/Dense>

#include <set>
#include <stdexcept>
#include <utility>

namespace {

// Nx4 [measured, integral, setpoint, ambient] matrix of the state samples
Eigen::MatrixXd stateMatrix(const SimulationResult& res) {
    const size_t n = res.measured.size();
    if (res.integral.size() != n || res.setpoint.size() != n || res.ambient.size() != n) {
        throw std::runtime_error("writeHDF5: state sequences have inconsistent lengths");
    }
    Eigen::MatrixXd mat(static_cast<Eigen::Index>(n), 4);
    for (size_t i = 0; i < n; ++i) {
        mat.row(static_cast<Eigen::Index>(i)) << res.measured[i], res.integral[i],
                                                 res.setpoint[i], res.ambient[i];
    }
    return mat;
}

void writeSummary(HighFive::File& file, const std::string& group, const PerformanceSummary& s) {
    file.createGroup(group);
    const std::pair<const char*, double> values[] = {
        {"final_error", s.final_error},
        {"max_abs_error", s.max_abs_error},
        {"iae", s.iae},
        {"ise", s.ise},
        {"itae", s.itae},
        {"overshoot", s.overshoot},
        // -1 marks a run that never settled
        {"settling_time", s.settling_time ? *s.settling_time : -1.0},
    };
    for (auto& [name, val] : values) {
        H5Easy::dump(file, group + "/" + name, val);
    }
    H5Easy::dump(file, group + "/saturated_steps", s.saturated_steps);
}

}  // namespace

void writeHDF5(const std::string& filename, const SimulationParams& params,
               const std::vector<RunRecord>& runs) {
    std::set<std::string> seen;
    for (const auto& run : runs) {
        // "count" and "names" are datasets of /runs; "." and ".." are not valid link names
        if (run.name.empty() || run.name.find('/') != std::string::npos ||
            run.name == "." || run.name == ".." || run.name == "count" || run.name == "names") {
            throw std::runtime_error("writeHDF5: invalid run name '" + run.name + "'");
        }
        if (!seen.insert(run.name).second) {
            throw std::runtime_error("writeHDF5: duplicate run name '" + run.name + "'");
        }
    }

    HighFive::File file(filename, HighFive::File::Overwrite);

    // Scenario parameters
    file.createGroup("/parameters");
    const std::pair<const char*, double> scalar_params[] = {
        {"Ts", params.Ts},
        {"setpoint", params.setpoint},
        {"initial_value", params.initial_value},
        {"alpha", params.plant.alpha},
        {"beta", params.plant.beta},
        {"ambient", params.ambient_initial},
        {"ambient_step_value", params.ambient_step ? params.ambient_step->value : params.ambient_initial},
        {"noise_std", params.noise_std},
        {"u_min", params.limits.u_min},
        {"u_max", params.limits.u_max},
    };
    for (auto& [name, val] : scalar_params) {
        H5Easy::dump(file, std::string("/parameters/") + name, val);
    }
    H5Easy::dump(file, "/parameters/steps", params.steps);
    H5Easy::dump(file, "/parameters/ambient_step_at",
                 params.ambient_step ? params.ambient_step->trigger_step : -1);

    // Runs
    file.createGroup("/runs");
    H5Easy::dump(file, "/runs/count", static_cast<int>(runs.size()));
    std::vector<std::string> names;
    names.reserve(runs.size());
    for (const auto& run : runs) {
        names.push_back(run.name);
    }
    H5Easy::dump(file, "/runs/names", names);

    for (const auto& run : runs) {
        const std::string group = "/runs/" + run.name;
        const auto& res = run.result;
        file.createGroup(group);

        H5Easy::dump(file, group + "/kp", run.gains.Kp);
        H5Easy::dump(file, group + "/ki", run.gains.Ki);
        H5Easy::dump(file, group + "/anti_windup", run.anti_windup ? 1 : 0);

        // State samples (steps + 1)
        file.createDataSet(group + "/time", res.time);
        file.createDataSet(group + "/measured", res.measured);
        file.createDataSet(group + "/integral", res.integral);
        file.createDataSet(group + "/setpoint", res.setpoint);
        file.createDataSet(group + "/ambient", res.ambient);
        file.createDataSet(group + "/state", stateMatrix(res));

        // Transitions (steps)
        file.createDataSet(group + "/control", res.control);
        file.createDataSet(group + "/error", res.error);

        writeSummary(file, group + "/summary", run.summary);
    }
}

void Hdf5Reporter::report(const SimulationParams& params, const std::vector<RunRecord>& runs) {
    writeHDF5(filename_, params, runs);
}
