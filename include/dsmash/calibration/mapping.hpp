/**
 * @file mapping.hpp
 * @brief Hyper-parameter mapping from spatial descriptors to cell fields
 * 
 * A field is expressed from normalized descriptors D_d as
 *   hyper-linear:     v = a0 + sum_d a_d D_d
 *   hyper-polynomial: v = a0 + sum_d a_d D_d^b_d
 * and bounded with p = lb + (ub - lb) / (1 + exp(-v)).
 */

#pragma once

#include "../core/types.hpp"
#include "../core/grid.hpp"
#include "../core/config.hpp"
#include "../core/parameters.hpp"
#include "../core/states.hpp"
#include <map>

namespace dsmash {

/// lb + (ub - lb) / (1 + exp(-v))
Real sigmoid_bound(Real v, const Bound& bound);

/// Inverse of sigmoid_bound, p clamped strictly inside the bound
Real logit_bound(Real p, const Bound& bound);

/**
 * @brief Coefficients of the optimized fields
 * 
 * Coefficient layout per field:
 * - HyperLinear:     [a0, a_1, ..., a_nd]
 * - HyperPolynomial: [a0, a_1, b_1, ..., a_nd, b_nd]
 */
class HyperParameters {
public:
    HyperParameters() = default;

    /**
     * @brief Zero coefficients (polynomial exponents 1) for the optimized fields
     * @throws std::invalid_argument if mapping is not a hyper mapping
     */
    HyperParameters(MappingType mapping, Index n_descriptors, const CostConfig& cost);

    MappingType mapping() const { return mapping_; }
    Index n_descriptors() const { return n_descriptors_; }

    /// Coefficients per field: 1 + nd (linear) or 1 + 2 nd (polynomial)
    Index n_coefficients() const;

    std::map<ParameterName, Vector> parameters;
    std::map<StateName, Vector> states;

    /**
     * @brief Start from spatially uniform fields
     * 
     * a0 = logit of the active-cell mean of the field, other terms 0.
     */
    void set_uniform(const Grid& grid, const Parameters& params, const States& states,
                     const Bounds& bounds);

    /**
     * @brief Map coefficients to the optimized fields of every stored cell
     * 
     * @param descriptors Normalized descriptors (n_storage x nd)
     */
    void to_fields(const Matrix& descriptors, const Bounds& bounds,
                   Parameters& params, States& states) const;

private:
    MappingType mapping_ = MappingType::HyperLinear;
    Index n_descriptors_ = 0;

    Vector map_field(const Vector& coef, const Matrix& descriptors, const Bound& bound) const;
};

} // namespace dsmash
