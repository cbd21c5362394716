/**
 * @file input_data.cpp
 * @brief Input data allocation and shape checks
 */

#include "dsmash/core/input_data.hpp"
#include <stdexcept>
#include <limits>
#include <algorithm>

namespace dsmash {

namespace {

void check_shape(const Matrix& m, Index rows, Index cols, const std::string& name) {
    if (m.rows() != rows || m.cols() != cols) {
        throw std::invalid_argument(name + " has shape " + std::to_string(m.rows()) +
            "x" + std::to_string(m.cols()) + ", expected " + std::to_string(rows) +
            "x" + std::to_string(cols));
    }
}

} // anonymous namespace

void InputData::initialize(const Grid& grid, Index ntime) {
    prcp = Matrix::Zero(grid.n_storage(), ntime);
    pet = Matrix::Zero(grid.n_storage(), ntime);
    qobs = Matrix::Constant(grid.n_gauges(), ntime, -99.0);
    mean_prcp = Matrix::Zero(grid.n_gauges(), ntime);
    mask_event = MatrixI::Zero(grid.n_gauges(), ntime);
    descriptors.resize(grid.n_storage(), 0);
}

void InputData::validate(const Grid& grid, Index ntime) const {
    check_shape(prcp, grid.n_storage(), ntime, "prcp");
    check_shape(pet, grid.n_storage(), ntime, "pet");
    check_shape(qobs, grid.n_gauges(), ntime, "qobs");

    if (mean_prcp.size() > 0) {
        check_shape(mean_prcp, grid.n_gauges(), ntime, "mean_prcp");
    }
    if (mask_event.size() > 0 &&
        (mask_event.rows() != grid.n_gauges() || mask_event.cols() != ntime)) {
        throw std::invalid_argument("mask_event does not match gauges x time steps");
    }
    if (descriptors.cols() > 0 && descriptors.rows() != grid.n_storage()) {
        throw std::invalid_argument("descriptors have " + std::to_string(descriptors.rows()) +
            " rows, grid stores " + std::to_string(grid.n_storage()));
    }
}

Matrix InputData::normalized_descriptors(const Grid& grid) const {
    Matrix normed = Matrix::Zero(descriptors.rows(), descriptors.cols());

    for (Index d = 0; d < descriptors.cols(); ++d) {
        Real lo = std::numeric_limits<Real>::max();
        Real hi = std::numeric_limits<Real>::lowest();
        for (Index k = 0; k < descriptors.rows(); ++k) {
            const auto& c = grid.storage_cell(k);
            if (!grid.is_active(c.row, c.col)) continue;
            lo = std::min(lo, descriptors(k, d));
            hi = std::max(hi, descriptors(k, d));
        }

        const Real range = hi - lo;
        if (range <= 0.0) continue;

        for (Index k = 0; k < descriptors.rows(); ++k) {
            normed(k, d) = (descriptors(k, d) - lo) / range;
        }
    }
    return normed;
}

void InputData::set_forcing_step(const Grid& grid, Index t, const Matrix& prcp_raster,
                                 const Matrix& pet_raster) {
    if (t < 0 || t >= prcp.cols()) {
        throw std::invalid_argument("Time step " + std::to_string(t) + " out of range");
    }
    prcp.col(t) = grid.from_raster(prcp_raster);
    pet.col(t) = grid.from_raster(pet_raster);
}

} // namespace dsmash
