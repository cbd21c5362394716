/**
 * @file regularization.hpp
 * @brief Spatial and prior regularization of parameter and state fields
 */

#pragma once

#include "../core/types.hpp"
#include "../core/grid.hpp"
#include "../core/config.hpp"
#include "../core/input_data.hpp"
#include "../core/parameters.hpp"
#include "../core/states.hpp"

namespace dsmash {
namespace regularization {

/// sum (field - background)² over stored cells
Real prior(const Vector& field, const Vector& background);

/**
 * @brief Squared discrete second differences over active cells
 * 
 * For each active cell, (up - 2c + down)² + (left - 2c + right)². A
 * neighbor outside the grid or inactive is replaced by the center cell.
 * With a background the field is taken relative to it first.
 */
Real smoothing(const Grid& grid, const Vector& field, const Vector* background = nullptr);

/**
 * @brief Same-class pixel penalty under a categorical descriptor
 * 
 * For every class label 0..max(descriptor) and every pair of active cells
 * of that class (second after first in row-major order), adds
 * (v_i - v_j)² / max(1, distance)², then divides the class sum by the
 * class population.
 */
Real distance_correlation(const Grid& grid, const Vector& field, const Vector& descriptor);

} // namespace regularization

/**
 * @brief Regularization term jreg
 * 
 * Sums every configured term over the optimized parameter and state
 * fields. prior and distance_correlation are weighted by w, the
 * smoothing terms by w².
 */
Real compute_jreg(const Grid& grid, const CostConfig& cost, const InputData& input,
                  const Parameters& params, const Parameters& params_bgd,
                  const States& states, const States& states_bgd);

} // namespace dsmash
