#pragma once

#include "sim_setup.hpp"

#include <iosfwd>
#include <vector>

// Consumer of finished runs (console table, file writer, plotter)
class RunReporter {
public:
    virtual ~RunReporter() = default;
    virtual void report(const SimulationParams& params, const std::vector<RunRecord>& runs) = 0;
};

// Prints the first `head` and last `tail` samples of each run plus a summary
class TextReporter : public RunReporter {
public:
    explicit TextReporter(std::ostream& out, int head = 10, int tail = 5);

    void report(const SimulationParams& params, const std::vector<RunRecord>& runs) override;

private:
    std::ostream& out_;
    int head_;
    int tail_;
};

void printSummary(std::ostream& out, const PerformanceSummary& summary);
