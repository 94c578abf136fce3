#include "report.hpp"

#include <algorithm>
#include <iomanip>
#include <ostream>

namespace {

void printRow(std::ostream& out, const SimulationResult& res, size_t k) {
    // The last state sample has no outgoing transition; repeat the final one
    const size_t n_transitions = res.control.size();
    const size_t idx = std::min(k, n_transitions > 0 ? n_transitions - 1 : 0);
    const double e = n_transitions > 0 ? res.error[idx] : 0.0;
    const double u = n_transitions > 0 ? res.control[idx] : 0.0;

    out << "t=" << std::setw(6) << std::setprecision(1) << res.time[k] << "s"
        << "  y=" << std::setw(7) << std::setprecision(2) << res.measured[k]
        << "  r=" << std::setw(6) << std::setprecision(1) << res.setpoint[k]
        << "  e=" << std::setw(7) << std::setprecision(2) << e
        << "  u=" << std::setw(8) << std::setprecision(2) << u << "\n";
}

}  // namespace

TextReporter::TextReporter(std::ostream& out, int head, int tail)
    : out_(out), head_(std::max(0, head)), tail_(std::max(0, tail)) {}

void TextReporter::report(const SimulationParams& params, const std::vector<RunRecord>& runs) {
    const auto old_flags = out_.flags();
    const auto old_precision = out_.precision();
    out_ << std::fixed;

    out_ << "Scenario: steps=" << params.steps << " Ts=" << std::setprecision(3) << params.Ts
         << " setpoint=" << params.setpoint << " y0=" << params.initial_value
         << " ambient=" << params.ambient_initial;
    if (params.ambient_step) {
        out_ << " -> " << params.ambient_step->value << " at k=" << params.ambient_step->trigger_step;
    }
    out_ << "\n\n";

    for (const auto& run : runs) {
        const auto& res = run.result;
        out_ << "==== " << run.name << " (Kp=" << std::setprecision(3) << run.gains.Kp
             << ", Ki=" << run.gains.Ki
             << (run.anti_windup ? "" : ", no anti-windup") << ") ====\n";

        const size_t n = res.measured.size();
        const size_t head = std::min(n, static_cast<size_t>(head_));
        const size_t tail_start = n - std::min(n - head, static_cast<size_t>(tail_));
        for (size_t k = 0; k < head; ++k) {
            printRow(out_, res, k);
        }
        if (tail_start > head) {
            out_ << "... ...\n";
        }
        for (size_t k = std::max(head, tail_start); k < n; ++k) {
            printRow(out_, res, k);
        }
        printSummary(out_, run.summary);
        out_ << "\n";
    }

    out_.flags(old_flags);
    out_.precision(old_precision);
}

void printSummary(std::ostream& out, const PerformanceSummary& s) {
    out << std::setprecision(4)
        << "final error " << s.final_error
        << ", max |e| " << s.max_abs_error
        << ", IAE " << s.iae
        << ", ISE " << s.ise
        << ", overshoot " << s.overshoot
        << ", settling ";
    if (s.settling_time) {
        out << *s.settling_time << "s";
    } else {
        out << "never";
    }
    out << ", saturated " << s.saturated_steps << " steps\n";
}
