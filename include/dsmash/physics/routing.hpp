/**
 * @file routing.hpp
 * @brief D8 upstream discharge and cell discharge conversion
 * 
 * Cells are visited in topological order, so the discharge of every
 * upstream neighbor is final when a cell reads it. The order is a
 * precondition; nothing here checks it.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/grid.hpp"

namespace dsmash {
namespace routing {

/**
 * @brief Sum of discharge [m³/s] of neighbors draining into (row, col)
 * 
 * Out-of-bounds and unstored neighbors contribute zero.
 */
Real upstream_sum(const Grid& grid, Index row, Index col, const Vector& q);

/**
 * @brief Upstream inflow as a depth over the drained area [mm]
 * 
 * qup = sum * dt / (1e-3 * dx² * (flow_accumulation - 1)), and exactly 0
 * for cells without contributors (flow_accumulation <= 1).
 */
Real upstream_discharge(const Grid& grid, Real dt, Index row, Index col, const Vector& q);

/**
 * @brief Cell discharge [m³/s] from local and routed depths
 * 
 * q = (qt + qrout * (flow_accumulation - 1)) * dx² * 1e-3 / dt
 */
Real cell_discharge(const Grid& grid, Real dt, Index row, Index col, Real qt, Real qrout);

} // namespace routing
} // namespace dsmash
