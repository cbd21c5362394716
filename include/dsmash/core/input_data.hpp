/**
 * @file input_data.hpp
 * @brief Forcing, observations and spatial descriptors for dSMASH
 * 
 * Time series are stored as (n x ntime) matrices: per-cell forcing uses
 * the grid's storage index for rows, gauge series use the gauge order.
 * A negative value marks missing data.
 */

#pragma once

#include "types.hpp"
#include "grid.hpp"

namespace dsmash {

/**
 * @brief Inputs consumed by the forward model and the cost engine
 */
class InputData {
public:
    // Atmospheric forcing (n_storage x ntime)
    Matrix prcp;                    ///< Precipitation [mm/dt]
    Matrix pet;                     ///< Potential evapotranspiration [mm/dt]

    // Gauge series (n_gauges x ntime)
    Matrix qobs;                    ///< Observed discharge [m³/s]
    Matrix mean_prcp;               ///< Catchment mean precipitation [mm/dt]
    MatrixI mask_event;             ///< Flood event labels, 0 outside events

    // Spatial descriptors (n_storage x n_descriptors)
    Matrix descriptors;

    /// Allocate zero forcing, missing observations and no descriptors
    void initialize(const Grid& grid, Index ntime);

    /**
     * @brief Check forcing and observation shapes against the grid
     * 
     * mean_prcp, mask_event and descriptors may be empty; they are checked
     * where they are consumed.
     * 
     * @throws std::invalid_argument on mismatch
     */
    void validate(const Grid& grid, Index ntime) const;

    Index n_descriptors() const { return descriptors.cols(); }

    /**
     * @brief Descriptors rescaled to [0, 1] over active cells
     * 
     * A descriptor with zero range maps to 0.
     */
    Matrix normalized_descriptors(const Grid& grid) const;

    /// Set per-cell forcing for one step from rasters
    void set_forcing_step(const Grid& grid, Index t, const Matrix& prcp_raster,
                          const Matrix& pet_raster);
};

} // namespace dsmash
