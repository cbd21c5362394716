/**
 * @file grid.cpp
 * @brief Grid validation, storage mapping and wavefront construction
 */

#include "dsmash/core/grid.hpp"
#include <stdexcept>
#include <algorithm>

namespace dsmash {

namespace {

std::string shape_string(Index rows, Index cols) {
    return std::to_string(rows) + "x" + std::to_string(cols);
}

void check_raster(const MatrixI& raster, Index nrow, Index ncol, const std::string& name) {
    if (raster.rows() != nrow || raster.cols() != ncol) {
        throw std::invalid_argument(name + " has shape " +
            shape_string(raster.rows(), raster.cols()) + ", grid is " +
            shape_string(nrow, ncol));
    }
}

} // anonymous namespace

// ============================================================================
// Construction and Finalization
// ============================================================================

Grid::Grid(Index nrow, Index ncol, Real dx)
    : nrow_(nrow), ncol_(ncol), dx_(dx)
{
    if (nrow <= 0 || ncol <= 0) {
        throw std::invalid_argument("Grid dimensions must be positive");
    }
    if (dx <= 0.0) {
        throw std::invalid_argument("Grid cell size must be positive");
    }

    flow_direction = MatrixI::Zero(nrow, ncol);
    flow_accumulation = MatrixI::Ones(nrow, ncol);
    active_cell = MatrixI::Zero(nrow, ncol);
    local_active_cell = MatrixI::Ones(nrow, ncol);
}

void Grid::finalize(StorageLayout layout) {
    if (local_active_cell.size() == 0) {
        local_active_cell = MatrixI::Ones(nrow_, ncol_);
    }
    validate();

    layout_ = layout;
    n_active_ = (active_cell.array() == 1).count();

    build_storage_index();
    build_wavefronts();
    finalized_ = true;
}

void Grid::validate() const {
    if (nrow_ <= 0 || ncol_ <= 0) {
        throw std::invalid_argument("Grid has no cells");
    }
    check_raster(flow_direction, nrow_, ncol_, "flow_direction");
    check_raster(flow_accumulation, nrow_, ncol_, "flow_accumulation");
    check_raster(active_cell, nrow_, ncol_, "active_cell");
    check_raster(local_active_cell, nrow_, ncol_, "local_active_cell");

    for (const auto& c : cell_order) {
        if (!in_bounds(c.row, c.col)) {
            throw std::invalid_argument("cell_order entry (" + std::to_string(c.row) +
                ", " + std::to_string(c.col) + ") is outside the grid");
        }
    }

    for (const auto& g : gauges) {
        if (!in_bounds(g.row, g.col)) {
            throw std::invalid_argument("Gauge " + g.code + " is outside the grid");
        }
    }
}

void Grid::build_storage_index() {
    index_map_ = MatrixI::Constant(nrow_, ncol_, -1);
    storage_cells_.clear();

    // Column-major traversal keeps dense indices equal to row + col * nrow
    for (Index col = 0; col < ncol_; ++col) {
        for (Index row = 0; row < nrow_; ++row) {
            if (layout_ == StorageLayout::Sparse && !is_active(row, col)) continue;
            index_map_(row, col) = static_cast<int>(storage_cells_.size());
            storage_cells_.push_back({row, col});
        }
    }
}

void Grid::build_wavefronts() {
    MatrixI rank = MatrixI::Constant(nrow_, ncol_, -1);
    wavefronts_.clear();

    for (const auto& c : cell_order) {
        if (!is_processed(c.row, c.col)) continue;

        int r = 0;
        for (const auto& up : upstream_cells(c.row, c.col)) {
            if (rank(up.row, up.col) >= 0) {
                r = std::max(r, rank(up.row, up.col) + 1);
            }
        }
        rank(c.row, c.col) = r;

        if (static_cast<Size>(r) >= wavefronts_.size()) {
            wavefronts_.resize(r + 1);
        }
        wavefronts_[r].push_back(c);
    }
}

// ============================================================================
// Storage Mapping
// ============================================================================

Index Grid::gauge_index(Index g) const {
    const auto& gauge = gauges[g];
    return storage_index(gauge.row, gauge.col);
}

Vector Grid::from_raster(const Matrix& raster) const {
    if (raster.rows() != nrow_ || raster.cols() != ncol_) {
        throw std::invalid_argument("Raster has shape " +
            shape_string(raster.rows(), raster.cols()) + ", grid is " +
            shape_string(nrow_, ncol_));
    }
    Vector field(n_storage());
    for (Index k = 0; k < n_storage(); ++k) {
        field(k) = raster(storage_cells_[k].row, storage_cells_[k].col);
    }
    return field;
}

Matrix Grid::to_raster(const Vector& field) const {
    if (field.size() != n_storage()) {
        throw std::invalid_argument("Field has " + std::to_string(field.size()) +
            " values, grid stores " + std::to_string(n_storage()));
    }
    Matrix raster = Matrix::Zero(nrow_, ncol_);
    for (Index k = 0; k < n_storage(); ++k) {
        raster(storage_cells_[k].row, storage_cells_[k].col) = field(k);
    }
    return raster;
}

// ============================================================================
// Topology
// ============================================================================

std::optional<CellIndex> Grid::downstream(Index row, Index col) const {
    const int code = flow_direction(row, col);
    if (!d8::is_valid(code)) return std::nullopt;

    const Index r = row + d8::ROW_OFFSET[code];
    const Index c = col + d8::COL_OFFSET[code];
    if (!in_bounds(r, c)) return std::nullopt;
    return CellIndex{r, c};
}

std::vector<CellIndex> Grid::upstream_cells(Index row, Index col) const {
    std::vector<CellIndex> upstream;
    for (int code = 1; code <= 8; ++code) {
        const Index r = row - d8::ROW_OFFSET[code];
        const Index c = col - d8::COL_OFFSET[code];
        if (in_bounds(r, c) && flow_direction(r, c) == code) {
            upstream.push_back({r, c});
        }
    }
    return upstream;
}

void Grid::print_summary(std::ostream& os) const {
    os << "Grid: " << nrow_ << " x " << ncol_ << " cells, dx = " << dx_ << " m\n";
    os << "  Active cells: " << n_active_ << "\n";
    os << "  Storage:      " << grid_io::to_string(layout_) << " (" << n_storage() << " values)\n";
    os << "  Gauges:       " << gauges.size() << "\n";
    os << "  Wavefronts:   " << wavefronts_.size() << "\n";
}

// ============================================================================
// grid_io helpers
// ============================================================================

namespace grid_io {

std::string to_string(StorageLayout layout) {
    switch (layout) {
        case StorageLayout::Dense: return "dense";
        case StorageLayout::Sparse: return "sparse";
        default: return "unknown";
    }
}

StorageLayout storage_layout_from_string(const std::string& s) {
    if (s == "dense") return StorageLayout::Dense;
    if (s == "sparse") return StorageLayout::Sparse;
    throw std::invalid_argument("Unknown storage layout: " + s);
}

} // namespace grid_io

} // namespace dsmash
