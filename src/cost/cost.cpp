/**
 * @file cost.cpp
 * @brief Cost function evaluation
 */

#include "dsmash/cost/cost.hpp"
#include "dsmash/cost/metrics.hpp"
#include "dsmash/cost/signatures.hpp"
#include "dsmash/cost/regularization.hpp"
#include <algorithm>
#include <stdexcept>
#include <iostream>
#include <string>

namespace dsmash {

Real jobs_metric(JobsFunction f, const Vector& qo, const Vector& qs,
                 const Vector& po, const VectorI& mask_event) {
    switch (f) {
        case JobsFunction::NSE: return metrics::nse(qo, qs);
        case JobsFunction::KGE: return metrics::kge(qo, qs);
        case JobsFunction::KGE2: return metrics::kge2(qo, qs);
        case JobsFunction::SE: return metrics::se(qo, qs);
        case JobsFunction::RMSE: return metrics::rmse(qo, qs);
        case JobsFunction::Logarithmic: return metrics::logarithmic(qo, qs);
        default:
            return signatures::signature(po, qo, qs, mask_event, f);
    }
}

Real compute_jobs(const Grid& grid, const Config& config, const InputData& input,
                  const Output& output) {
    const CostConfig& cost = config.cost;
    const Real dt = config.model.dt;
    const Index ntime = output.qsim.cols();
    const Index start = std::min(cost.optimize_start_step, ntime);
    const Index n = ntime - start;

    if (cost.jobs_weights.size() != cost.jobs_functions.size()) {
        throw std::invalid_argument("jobs_weights has " + std::to_string(cost.jobs_weights.size()) +
            " values, expected " + std::to_string(cost.jobs_functions.size()));
    }

    bool needs_prcp = false;
    bool needs_events = false;
    for (auto f : cost.jobs_functions) {
        needs_prcp |= signatures::uses_precipitation(f);
        needs_events |= signatures::is_event_signature(f);
    }
    if (needs_prcp && input.mean_prcp.cols() != ntime) {
        throw std::invalid_argument("Signature cost requires mean_prcp for every gauge");
    }
    if (needs_events && input.mask_event.cols() != ntime) {
        throw std::invalid_argument("Event signature cost requires mask_event for every gauge");
    }

    Real jobs = 0.0;
    std::vector<Real> pooled;

    for (Index g = 0; g < grid.n_gauges(); ++g) {
        const Real wgauge = cost.gauge_weight(g);
        if (wgauge == 0.0) continue;

        const Gauge& gauge = grid.gauges[g];
        const Real drained = static_cast<Real>(grid.flow_accumulation(gauge.row, gauge.col)) *
                             grid.cell_area();

        const Vector qs = output.qsim.row(g).segment(start, n).transpose() * dt / gauge.area * 1e3;
        const Vector qo = input.qobs.row(g).segment(start, n).transpose() * dt / drained * 1e3;
        Vector po = Vector::Zero(n);
        if (needs_prcp) po = input.mean_prcp.row(g).segment(start, n).transpose();

        VectorI mask = VectorI::Zero(n);
        if (needs_events) mask = input.mask_event.row(g).segment(start, n).transpose();

        const bool any_observed = (qo.array() >= 0.0).any();

        // Held value used when the window has no observation
        Real j_value = 0.0;
        Real gauge_jobs = 0.0;
        for (Size j = 0; j < cost.jobs_functions.size(); ++j) {
            if (any_observed) {
                j_value = jobs_metric(cost.jobs_functions[j], qo, qs, po, mask);
            }
            gauge_jobs += cost.jobs_weights[j] * j_value;
        }

        if (wgauge > 0.0) {
            jobs += wgauge * gauge_jobs;
        } else {
            pooled.push_back(gauge_jobs);
        }
    }

    if (!pooled.empty()) {
        jobs += metrics::quantile(pooled, 0.5);
    }

    return jobs;
}

// ============================================================================
// NormalizationScope
// ============================================================================

NormalizationScope::NormalizationScope(Parameters& params, States& states, const Bounds& bounds)
    : params_(params)
    , states_(states)
    , saved_params_(params)
    , saved_states_(states)
{
    params_.normalize(bounds);
    states_.normalize(bounds);
}

NormalizationScope::~NormalizationScope() {
    params_ = std::move(saved_params_);
    states_ = std::move(saved_states_);
}

// ============================================================================
// compute_cost
// ============================================================================

Real compute_cost(const Grid& grid, const Config& config, const InputData& input,
                  Parameters& params, States& states, const Background& background,
                  Output& output) {
    const Real jobs = compute_jobs(grid, config, input, output);

    Real jreg = 0.0;
    if (!config.cost.jreg_functions.empty()) {
        if (config.cost.denormalize_forward) {
            NormalizationScope scope(params, states, config.bounds);
            jreg = compute_jreg(grid, config.cost, input, params, background.parameters,
                                states, background.states);
        } else {
            jreg = compute_jreg(grid, config.cost, input, params, background.parameters,
                                states, background.states);
        }
    }

    output.cost_jobs = jobs;
    output.cost_jreg = jreg;
    output.cost = jobs + config.cost.wjreg * jreg;

    if (config.model.verbose) {
        std::cerr << "  cost = " << output.cost << " (jobs = " << jobs
                  << ", jreg = " << jreg << ")\n";
    }

    return output.cost;
}

} // namespace dsmash
