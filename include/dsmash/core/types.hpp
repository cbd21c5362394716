/**
 * @file types.hpp
 * @brief Core type definitions for dSMASH
 * 
 * This file defines the fundamental types used throughout dSMASH,
 * including scalar types, array types, and configuration enums.
 */

#pragma once

#include <Eigen/Core>
#include <cstdint>
#include <memory>
#include <vector>
#include <array>
#include <functional>
#include <string>

namespace dsmash {

// ============================================================================
// Scalar Types
// ============================================================================

using Real = double;
using Index = int64_t;
using Size = size_t;

// ============================================================================
// Array Types (Eigen-based)
// ============================================================================

// Dense vectors
using Vector = Eigen::VectorXd;
using VectorI = Eigen::VectorXi;
using VectorRef = Eigen::Ref<Vector>;
using VectorConstRef = Eigen::Ref<const Vector>;

// Dense matrices (rasters are nrow x ncol, time series are n x ntime)
using Matrix = Eigen::MatrixXd;
using MatrixI = Eigen::MatrixXi;
using MatrixRef = Eigen::Ref<Matrix>;
using MatrixConstRef = Eigen::Ref<const Matrix>;

// ============================================================================
// Model Decision Enums
// ============================================================================

/**
 * @brief Model structure (operator chain run in every cell)
 */
enum class StructureType {
    GrA,                ///< Instant interception, production, exchange, one transfer store
    GrB,                ///< gr_a with an interception store
    GrC,                ///< gr_b with an additional slow transfer store
    GrD,                ///< Production and a single transfer store, no exchange
    VicA,               ///< Variable infiltration curve, three soil layers
};

/**
 * @brief Storage layout for per-cell fields
 */
enum class StorageLayout {
    Dense,              ///< Every raster cell is stored
    Sparse,             ///< Only active cells are stored
};

/**
 * @brief Fit-to-observation functions (jobs)
 */
enum class JobsFunction {
    NSE,                ///< Raw squared-error ratio (lower is better)
    KGE,                ///< Kling-Gupta efficiency distance
    KGE2,               ///< KGE squared
    SE,                 ///< Sum of squared errors
    RMSE,               ///< Root mean squared error
    Logarithmic,        ///< Log ratio weighted by observation
    Crc,                ///< Continuous runoff coefficient
    Cfp2,               ///< Flow percentile 2%
    Cfp10,              ///< Flow percentile 10%
    Cfp50,              ///< Flow percentile 50%
    Cfp90,              ///< Flow percentile 90%
    Epf,                ///< Event peak flow
    Elt,                ///< Event lag time
    Erc,                ///< Event runoff coefficient
};

/**
 * @brief Regularization functions (jreg)
 */
enum class JregFunction {
    Prior,              ///< Squared deviation from background
    Smoothing,          ///< Laplacian of deviation from background
    HardSmoothing,      ///< Laplacian of the field itself
    DistanceCorrelation,///< Same-class pixel penalty under a descriptor map
};

/**
 * @brief Mapping from control vector to per-cell fields
 */
enum class MappingType {
    Uniform,            ///< One value per optimized field
    Distributed,        ///< One value per active cell per optimized field
    HyperLinear,        ///< a0 + sum(a_d * D_d), sigmoid bounded
    HyperPolynomial,    ///< a0 + sum(a_d * D_d^b_d), sigmoid bounded
};

/**
 * @brief Names of the per-cell parameters
 */
enum class ParameterName {
    ci, cp, beta, cft, cst, alpha, exc, lr,
    b, cusl1, cusl2, clsl, ks, ds, dsm, ws,
};

/**
 * @brief Names of the per-cell states
 */
enum class StateName {
    hi, hp, hft, hst, hlr, husl1, husl2, hlsl,
};

constexpr Index N_PARAMETERS = 16;
constexpr Index N_STATES = 8;

// ============================================================================
// Forward Declarations
// ============================================================================

class Grid;
class InputData;
class Parameters;
class States;
class Output;
class Config;
class Model;

struct StructureDescriptor;

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

template<typename T>
using Ptr = std::shared_ptr<T>;

template<typename T>
using UniquePtr = std::unique_ptr<T>;

// ============================================================================
// Function Types for Callbacks
// ============================================================================

/// Scalar function of a control vector: J(x)
using CostFunc = std::function<Real(const Vector& x)>;

/// Linear operator on a vector (tangent or adjoint action)
using LinearOperatorFunc = std::function<Vector(const Vector& v)>;

/// Output callback: called after each time step with the domain discharge
using OutputCallback = std::function<void(Index step, const Vector& q)>;

// ============================================================================
// Result Types
// ============================================================================

/**
 * @brief Fluxes produced by one cell over one time step
 */
struct CellFlux {
    Real qt = 0.0;          ///< Local discharge depth [mm]
    Real qup = 0.0;         ///< Normalized upstream inflow [mm]
    Real qrout = 0.0;       ///< Routed outflow [mm]
    Real q = 0.0;           ///< Cell discharge [m3/s]
};

/**
 * @brief Summary of a forward run
 */
struct RunResult {
    Index steps = 0;
    Index cells_processed = 0;
    Real run_time_ms = 0.0;
};

// ============================================================================
// Constants
// ============================================================================

namespace constants {
    constexpr Real STORE_FLOOR = 1e-6;          ///< Minimum relative store level
    constexpr Real STORE_CEIL = 1.0 - 1e-6;     ///< Maximum relative store level
    constexpr Real MM_TO_M = 1e-3;              ///< mm to m
    constexpr Real LAG_UNIT = 60.0;             ///< Routing lag unit [s per min]
    constexpr Real TRANSFER_EXPONENT = 5.0;     ///< n of the transfer power law
    constexpr Real EXCHANGE_EXPONENT = 3.5;     ///< Exchange power law exponent
    constexpr int NO_FLOW = 0;                  ///< D8 code for no outflow
    constexpr Real EPSILON = 1e-15;             ///< Numerical zero
}

} // namespace dsmash
