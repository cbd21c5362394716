/**
 * @file control.hpp
 * @brief Control vector seen by an optimizer
 * 
 * Flattens the optimized parameter and state fields for the configured
 * mapping. Layout: parameters in CostConfig::optim_parameters order, then
 * states in optim_states order.
 * - Uniform:     one value per field
 * - Distributed: one value per active cell per field (storage order)
 * - Hyper:       the field's hyper coefficients
 * 
 * With denormalize_forward, uniform and distributed values are expressed
 * in [0, 1] relative to the calibration bounds.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/grid.hpp"
#include "../core/config.hpp"
#include "../core/input_data.hpp"
#include "mapping.hpp"

namespace dsmash {

class Control {
public:
    /**
     * Grid and config must outlive the control.
     * @throws std::invalid_argument if a hyper mapping has no descriptors
     */
    Control(const Grid& grid, const Config& config, const InputData& input);

    MappingType mapping() const { return config_.cost.mapping; }

    /// Length of the control vector
    Index size() const;

    /// Control vector describing the given fields
    Vector pack(const Parameters& params, const States& states) const;

    /**
     * @brief Write the fields described by x
     * 
     * Only optimized fields are touched.
     * 
     * @throws std::invalid_argument if x has the wrong length
     */
    void unpack(const Vector& x, Parameters& params, States& states) const;

    /// Label of every control entry (e.g. "cp", "cp[12]", "cp:a0")
    std::vector<std::string> names() const;

private:
    const Grid& grid_;
    const Config& config_;
    Matrix descriptors_;            ///< Normalized descriptors
    std::vector<Index> active_;     ///< Storage indices of active cells

    Index n_fields() const;
    Index values_per_field() const;

    Real to_control(Real value, const Bound& bound) const;
    Real from_control(Real value, const Bound& bound) const;
};

} // namespace dsmash
