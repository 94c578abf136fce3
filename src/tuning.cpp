#include "tuning.hpp"

#include <nlopt.hpp>

#include <cmath>
#include <initializer_list>
#include <iostream>
#include <stdexcept>

namespace {

TunableGain parseGain(const Config& cfg, const std::string& name, double default_val) {
    TunableGain gain;
    gain.name = name;

    if (!cfg.has(name)) {
        gain.value = default_val;
        gain.min_bound = default_val;
        gain.max_bound = default_val;
        return gain;
    }

    std::string val = cfg.getString(name);
    if (val == "variable") {
        gain.is_variable = true;
        gain.min_bound = cfg.getDouble(name + "_min");
        gain.max_bound = cfg.getDouble(name + "_max");
        if (!std::isfinite(gain.min_bound) || !std::isfinite(gain.max_bound) ||
            gain.min_bound > gain.max_bound) {
            throw std::runtime_error("Invalid bounds for '" + name + "': [" +
                                     std::to_string(gain.min_bound) + ", " +
                                     std::to_string(gain.max_bound) + "]");
        }
        gain.value = (gain.min_bound + gain.max_bound) / 2.0;
    } else {
        gain.value = cfg.getDouble(name);
        gain.min_bound = gain.value;
        gain.max_bound = gain.value;
    }
    return gain;
}

// Context for NLopt objective callback
struct NLoptContext {
    TuningSetup* setup;
    const SimulationParams* params;
    int evaluations;
    double best_cost;            // Best cost seen, kept if NLopt aborts
    std::vector<double> best_x;
};

double nloptObjective(const std::vector<double>& x, std::vector<double>& grad, void* data) {
    (void)grad;
    auto* ctx = static_cast<NLoptContext*>(data);
    ctx->setup->setVariableValues(x);
    ctx->evaluations++;
    const double f = evaluateGains(ctx->setup->gains(), ctx->setup->anti_windup, *ctx->params,
                                   ctx->setup->metric);
    if (f < ctx->best_cost) {
        ctx->best_cost = f;
        ctx->best_x = x;
    }
    return f;
}

}  // namespace

std::vector<double> TuningSetup::variableValues() const {
    std::vector<double> values;
    for (const TunableGain* g : {&kp, &ki}) {
        if (g->is_variable) values.push_back(g->value);
    }
    return values;
}

void TuningSetup::setVariableValues(const std::vector<double>& x) {
    if (x.size() != numVariable()) {
        throw std::invalid_argument("setVariableValues: expected " +
            std::to_string(numVariable()) + " values, got " + std::to_string(x.size()));
    }
    size_t i = 0;
    for (TunableGain* g : {&kp, &ki}) {
        if (g->is_variable) g->value = x[i++];
    }
}

void TuningSetup::getVariableBounds(std::vector<double>& lb, std::vector<double>& ub) const {
    lb.clear();
    ub.clear();
    for (const TunableGain* g : {&kp, &ki}) {
        if (g->is_variable) {
            lb.push_back(g->min_bound);
            ub.push_back(g->max_bound);
        }
    }
}

size_t TuningSetup::numVariable() const {
    return (kp.is_variable ? 1 : 0) + (ki.is_variable ? 1 : 0);
}

TuningSetup TuningSetup::fromConfig(const Config& cfg) {
    TuningSetup setup;
    setup.kp = parseGain(cfg, "kp", 10.0);
    setup.ki = parseGain(cfg, "ki", 0.5);
    setup.anti_windup = cfg.getBool("anti_windup", true);
    setup.metric = parseCostMetric(cfg.getString("tune_metric", "ise"));
    setup.max_eval = cfg.getInt("tune_max_eval", 200);
    if (setup.max_eval <= 0) {
        throw std::runtime_error("tune_max_eval must be > 0");
    }
    return setup;
}

double evaluateGains(const PIGains& gains, bool anti_windup,
                     const SimulationParams& params, CostMetric metric) {
    SimulationParams quiet = params;
    quiet.noise_std = 0.0;

    PIController controller(gains, quiet.Ts, quiet.limits, anti_windup);
    SimulationResult result = runSimulation(quiet, controller);
    return cost(summarize(result, 0.0), metric);
}

TuningResult tuneGains(const TuningSetup& setup, const SimulationParams& params) {
    TuningSetup work = setup;
    TuningResult out;
    out.initial_cost = evaluateGains(work.gains(), work.anti_windup, params, work.metric);
    out.cost = out.initial_cost;
    out.gains = work.gains();
    out.evaluations = 1;

    size_t n = work.numVariable();
    if (n == 0) {
        return out;
    }

    std::vector<double> x = work.variableValues();
    NLoptContext ctx{&work, &params, 0, out.initial_cost, x};

    nlopt::opt opt(nlopt::LN_COBYLA, static_cast<unsigned>(n));

    std::vector<double> lb, ub;
    work.getVariableBounds(lb, ub);
    opt.set_lower_bounds(lb);
    opt.set_upper_bounds(ub);
    opt.set_min_objective(nloptObjective, &ctx);
    opt.set_maxeval(work.max_eval);
    opt.set_xtol_rel(1e-8);
    opt.set_ftol_rel(1e-10);

    double minf = out.initial_cost;

    try {
        opt.optimize(x, minf);
    } catch (const std::exception& e) {
        std::cerr << "NLopt failed: " << e.what() << std::endl;
    }

    work.setVariableValues(ctx.best_x);
    out.gains = work.gains();
    out.cost = ctx.best_cost;
    out.evaluations += ctx.evaluations;
    return out;
}
