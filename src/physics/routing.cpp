/**
 * @file routing.cpp
 * @brief D8 upstream discharge and cell discharge conversion
 */

#include "dsmash/physics/routing.hpp"

namespace dsmash {
namespace routing {

Real upstream_sum(const Grid& grid, Index row, Index col, const Vector& q) {
    Real sum = 0.0;
    for (int code = 1; code <= 8; ++code) {
        const Index r = row - d8::ROW_OFFSET[code];
        const Index c = col - d8::COL_OFFSET[code];
        if (!grid.in_bounds(r, c)) continue;
        if (grid.flow_direction(r, c) != code) continue;

        const Index k = grid.storage_index(r, c);
        if (k >= 0) {
            sum += q(k);
        }
    }
    return sum;
}

Real upstream_discharge(const Grid& grid, Real dt, Index row, Index col, const Vector& q) {
    const Index flwacc = grid.flow_accumulation(row, col);
    if (flwacc <= 1) return 0.0;

    const Real sum = upstream_sum(grid, row, col, q);
    return sum * dt / (constants::MM_TO_M * grid.cell_area() * static_cast<Real>(flwacc - 1));
}

Real cell_discharge(const Grid& grid, Real dt, Index row, Index col, Real qt, Real qrout) {
    const Real upstream = static_cast<Real>(grid.flow_accumulation(row, col) - 1);
    return (qt + qrout * upstream) * grid.cell_area() * constants::MM_TO_M / dt;
}

} // namespace routing
} // namespace dsmash
