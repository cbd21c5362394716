/**
 * @file cost.hpp
 * @brief Cost function: cost = jobs + wjreg * jreg
 * 
 * jobs compares simulated and observed discharge at gauges, jreg
 * penalizes the optimized parameter and state fields.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/grid.hpp"
#include "../core/config.hpp"
#include "../core/input_data.hpp"
#include "../core/parameters.hpp"
#include "../core/states.hpp"
#include "../core/output.hpp"

namespace dsmash {

/**
 * @brief Reference fields for prior and smoothing regularization
 */
struct Background {
    Parameters parameters;
    States states;
};

/**
 * @brief Fit term over all enabled gauges
 * 
 * Per gauge, discharge is converted to depth over the optimization window
 * (simulated by the gauge area, observed by the drained area of the gauge
 * cell) and the configured metrics are combined by weighted sum. Gauges
 * with positive weight add weight * gauge cost; the median of the gauges
 * with negative weight is added once.
 * 
 * @throws std::invalid_argument if a signature needs missing inputs
 */
Real compute_jobs(const Grid& grid, const Config& config, const InputData& input,
                  const Output& output);

/**
 * @brief Metric value for one gauge window
 * 
 * @param qo Observed depth (negative = missing)
 * @param qs Simulated depth
 * @param po Catchment mean precipitation
 * @param mask_event Event labels
 */
Real jobs_metric(JobsFunction f, const Vector& qo, const Vector& qs,
                 const Vector& po, const VectorI& mask_event);

/**
 * @brief Normalizes parameters and states for the lifetime of the scope
 * 
 * Physical values are restored exactly on destruction.
 */
class NormalizationScope {
public:
    NormalizationScope(Parameters& params, States& states, const Bounds& bounds);
    ~NormalizationScope();

    NormalizationScope(const NormalizationScope&) = delete;
    NormalizationScope& operator=(const NormalizationScope&) = delete;

private:
    Parameters& params_;
    States& states_;
    Parameters saved_params_;
    States saved_states_;
};

/**
 * @brief Full cost, written to output.cost, cost_jobs and cost_jreg
 * 
 * With denormalize_forward, jreg is evaluated on fields normalized by the
 * calibration bounds; params and states are unchanged on return.
 * 
 * @return output.cost
 */
Real compute_cost(const Grid& grid, const Config& config, const InputData& input,
                  Parameters& params, States& states, const Background& background,
                  Output& output);

} // namespace dsmash
