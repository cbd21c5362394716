/**
 * @file parameters.hpp
 * @brief Per-cell model parameters for dSMASH
 * 
 * Contains every spatially-distributed parameter used by the structures:
 * - GR family: interception, production, transfer, exchange, routing
 * - VIC family: infiltration curve, soil layer capacities, baseflow
 * 
 * Each field is a Vector of length Grid::n_storage().
 */

#pragma once

#include "types.hpp"

namespace dsmash {

/**
 * @brief Closed calibration interval of a field
 */
struct Bound {
    Real lower = 0.0;
    Real upper = 1.0;

    Real width() const { return upper - lower; }
};

/**
 * @brief Calibration bounds for all parameters and states
 */
struct Bounds {
    std::array<Bound, N_PARAMETERS> parameters;
    std::array<Bound, N_STATES> states;

    /// Default calibration bounds
    static Bounds defaults();

    Bound& operator[](ParameterName name) { return parameters[static_cast<Size>(name)]; }
    const Bound& operator[](ParameterName name) const { return parameters[static_cast<Size>(name)]; }
    Bound& operator[](StateName name) { return states[static_cast<Size>(name)]; }
    const Bound& operator[](StateName name) const { return states[static_cast<Size>(name)]; }
};

/**
 * @brief Per-cell parameter fields
 */
class Parameters {
public:
    // Interception and production
    Vector ci;                      ///< Interception capacity [mm]
    Vector cp;                      ///< Production capacity [mm]
    Vector beta;                    ///< Percolation shape [-]

    // Transfer and exchange
    Vector cft;                     ///< Fast transfer capacity [mm]
    Vector cst;                     ///< Slow transfer capacity [mm]
    Vector alpha;                   ///< Transfer partition [-]
    Vector exc;                     ///< Exchange coefficient [mm/dt]

    // Routing
    Vector lr;                      ///< Routing lag [min]

    // VIC soil column
    Vector b;                       ///< Infiltration curve shape [-]
    Vector cusl1;                   ///< Upper soil layer 1 capacity [mm]
    Vector cusl2;                   ///< Upper soil layer 2 capacity [mm]
    Vector clsl;                    ///< Lower soil layer capacity [mm]
    Vector ks;                      ///< Saturated drainage rate [mm/dt]
    Vector ds;                      ///< Baseflow nonlinearity onset fraction [-]
    Vector dsm;                     ///< Maximum baseflow fraction [-]
    Vector ws;                      ///< Baseflow threshold level [-]

    /// Allocate every field with its default value
    void initialize(Index n_storage);

    /**
     * @brief Check that every field has n_storage values
     * @throws std::invalid_argument on mismatch
     */
    void validate(Index n_storage) const;

    Index size() const { return cp.size(); }

    Vector& field(ParameterName name);
    const Vector& field(ParameterName name) const;

    /// Set a field to a spatially uniform value
    void set_uniform(ParameterName name, Real value);

    /// x <- (x - lb) / (ub - lb) on every field
    void normalize(const Bounds& bounds);

    /// x <- x * (ub - lb) + lb on every field
    void denormalize(const Bounds& bounds);
};

// ============================================================================
// Defaults and Names
// ============================================================================

namespace default_params {
    constexpr Real ci = 1.0;
    constexpr Real cp = 200.0;
    constexpr Real beta = 1000.0;
    constexpr Real cft = 500.0;
    constexpr Real cst = 500.0;
    constexpr Real alpha = 0.9;
    constexpr Real exc = 0.0;
    constexpr Real lr = 5.0;
    constexpr Real b = 0.1;
    constexpr Real cusl1 = 100.0;
    constexpr Real cusl2 = 500.0;
    constexpr Real clsl = 2000.0;
    constexpr Real ks = 20.0;
    constexpr Real ds = 0.02;
    constexpr Real dsm = 0.33;
    constexpr Real ws = 0.8;

    Real value(ParameterName name);
}

/// All parameter names in declaration order
const std::array<ParameterName, N_PARAMETERS>& all_parameters();

std::string to_string(ParameterName name);
ParameterName parameter_from_string(const std::string& s);

} // namespace dsmash
