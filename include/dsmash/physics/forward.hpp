/**
 * @file forward.hpp
 * @brief Whole-domain, whole-period forward simulation
 * 
 * For every time step, cells run in topological order: local runoff from
 * the structure pipeline, upstream inflow, linear routing, then the cell
 * discharge that downstream cells read. Gauge discharge is sampled after
 * the cell loop.
 * 
 * With wavefront scheduling enabled, cells of equal dependency rank run
 * concurrently (OpenMP); results are identical to the sequential order.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/grid.hpp"
#include "../core/config.hpp"
#include "../core/input_data.hpp"
#include "../core/parameters.hpp"
#include "../core/states.hpp"
#include "../core/output.hpp"
#include "structure.hpp"

namespace dsmash {

/**
 * @brief Forward simulation over a grid and an input period
 * 
 * Holds references only; grid, config and inputs must outlive it.
 */
class Forward {
public:
    Forward(const Grid& grid, const Config& config, const InputData& input);

    /**
     * @brief Run all time steps
     * 
     * states holds the initial condition on entry and the final states on
     * return. output is reallocated.
     * 
     * @throws std::invalid_argument on shape mismatch
     */
    RunResult run(const Parameters& params, States& states, Output& output,
                  const OutputCallback& callback = nullptr) const;

    /**
     * @brief Advance one cell by one time step
     * 
     * Reads upstream discharge from q and writes the cell's own discharge.
     */
    CellFlux step_cell(Index t, const CellIndex& cell, const Parameters& params,
                       States& states, Vector& q) const;

    const StructureDescriptor& structure() const { return structure_; }

private:
    const Grid& grid_;
    const Config& config_;
    const InputData& input_;
    const StructureDescriptor& structure_;

    void check_inputs(const Parameters& params, const States& states) const;
    void sweep(Index t, const Parameters& params, States& states, Vector& q,
               Output& output) const;
};

} // namespace dsmash
