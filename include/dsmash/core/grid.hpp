/**
 * @file grid.hpp
 * @brief Raster grid, D8 drainage topology and storage layout for dSMASH
 * 
 * The grid is built by an external mesh builder (flow direction, flow
 * accumulation, active masks, gauges and the topological cell order) and
 * finalized once. Finalization selects the storage layout used by every
 * per-cell field:
 * - Dense: all raster cells are stored, k = row + col * nrow
 * - Sparse: only active cells are stored, numbered in column-major order
 */

#pragma once

#include "types.hpp"
#include <optional>
#include <ostream>
#include <span>

namespace dsmash {

// ============================================================================
// Cell and Gauge Descriptors
// ============================================================================

/**
 * @brief Raster position of a cell
 */
struct CellIndex {
    Index row = 0;
    Index col = 0;

    bool operator==(const CellIndex&) const = default;
};

/**
 * @brief Discharge monitoring point
 */
struct Gauge {
    std::string code;           ///< Gauge identifier
    Index row = 0;              ///< Raster row of the outlet cell
    Index col = 0;              ///< Raster column of the outlet cell
    Real area = 0.0;            ///< Drainage area [m²]
};

// ============================================================================
// D8 Flow Directions
// ============================================================================

/**
 * Codes 1..8 run clockwise from north. A cell with code c drains into
 * (row + ROW_OFFSET[c], col + COL_OFFSET[c]). Index 0 is unused.
 */
namespace d8 {
    constexpr std::array<Index, 9> ROW_OFFSET = {0, -1, -1, 0, 1, 1, 1, 0, -1};
    constexpr std::array<Index, 9> COL_OFFSET = {0, 0, 1, 1, 1, 0, -1, -1, -1};

    constexpr bool is_valid(int code) { return code >= 1 && code <= 8; }
}

// ============================================================================
// Grid
// ============================================================================

/**
 * @brief Watershed raster with drainage topology
 * 
 * Example usage:
 * @code
 * Grid grid(3, 3, 1000.0);
 * grid.flow_direction << ...;
 * grid.flow_accumulation << ...;
 * grid.active_cell.setOnes();
 * grid.cell_order = {...};
 * grid.gauges.push_back({"outlet", 2, 2, 9.0e6});
 * grid.finalize(StorageLayout::Sparse);
 * @endcode
 * 
 * The rasters are public so the mesh builder can fill them; they must not
 * change after finalize().
 */
class Grid {
public:
    Grid() = default;
    Grid(Index nrow, Index ncol, Real dx);

    // Rasters (nrow x ncol)
    MatrixI flow_direction;         ///< D8 code, anything outside 1..8 is no flow
    MatrixI flow_accumulation;      ///< Contributing cells, self included
    MatrixI active_cell;            ///< Global active mask
    MatrixI local_active_cell;      ///< Subdomain mask (defaults to all ones)

    /// Upstream-to-downstream processing order (precomputed, assumed acyclic)
    std::vector<CellIndex> cell_order;

    /// Gauges in output order
    std::vector<Gauge> gauges;

    /**
     * @brief Validate rasters and build storage index and wavefronts
     * @throws std::invalid_argument on shape or bounds mismatch
     */
    void finalize(StorageLayout layout = StorageLayout::Dense);
    bool is_finalized() const { return finalized_; }

    // Dimensions
    Index nrow() const { return nrow_; }
    Index ncol() const { return ncol_; }
    Real dx() const { return dx_; }
    Real cell_area() const { return dx_ * dx_; }
    Index n_gauges() const { return static_cast<Index>(gauges.size()); }
    Index n_active() const { return n_active_; }

    // ========================================================================
    // Storage Layout
    // ========================================================================

    StorageLayout layout() const { return layout_; }

    /// Number of stored cells (length of every per-cell field)
    Index n_storage() const { return static_cast<Index>(storage_cells_.size()); }

    /// Storage index of a raster cell, -1 if the cell is not stored
    Index storage_index(Index row, Index col) const {
        return index_map_(row, col);
    }

    /// Raster position of a storage index
    const CellIndex& storage_cell(Index k) const { return storage_cells_[k]; }

    /// Storage index of gauge g
    Index gauge_index(Index g) const;

    /// Gather a raster into a per-cell field
    Vector from_raster(const Matrix& raster) const;

    /// Scatter a per-cell field into a raster (unstored cells are 0)
    Matrix to_raster(const Vector& field) const;

    // ========================================================================
    // Topology
    // ========================================================================

    bool in_bounds(Index row, Index col) const {
        return row >= 0 && row < nrow_ && col >= 0 && col < ncol_;
    }

    bool is_active(Index row, Index col) const {
        return active_cell(row, col) == 1;
    }

    /// Active in both the global and the local mask
    bool is_processed(Index row, Index col) const {
        return active_cell(row, col) == 1 && local_active_cell(row, col) == 1;
    }

    /// Receiving cell, empty for outlets or invalid codes
    std::optional<CellIndex> downstream(Index row, Index col) const;

    /// In-bound neighbors whose flow direction points into (row, col)
    std::vector<CellIndex> upstream_cells(Index row, Index col) const;

    /// Processing order
    std::span<const CellIndex> order() const { return cell_order; }

    /**
     * @brief Processed cells grouped by dependency rank
     * 
     * Rank 0 holds cells without processed upstream neighbors, rank r holds
     * cells whose deepest upstream neighbor has rank r-1. Cells in one
     * wavefront never depend on each other.
     */
    const std::vector<std::vector<CellIndex>>& wavefronts() const { return wavefronts_; }

    void print_summary(std::ostream& os) const;

private:
    Index nrow_ = 0;
    Index ncol_ = 0;
    Real dx_ = 0.0;
    Index n_active_ = 0;
    bool finalized_ = false;
    StorageLayout layout_ = StorageLayout::Dense;

    MatrixI index_map_;
    std::vector<CellIndex> storage_cells_;
    std::vector<std::vector<CellIndex>> wavefronts_;

    void validate() const;
    void build_storage_index();
    void build_wavefronts();
};

namespace grid_io {
    std::string to_string(StorageLayout layout);
    StorageLayout storage_layout_from_string(const std::string& s);
}

} // namespace dsmash
