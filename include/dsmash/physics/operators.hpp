/**
 * @file operators.hpp
 * @brief Cell-level hydrological operators
 * 
 * Each operator reads forcing and parameters of one cell, updates that
 * cell's stores through explicit references and returns its fluxes.
 * Depths are in mm per time step, store levels are relative to capacity.
 * 
 * GR family:
 *   interception -> production -> exchange -> transfer
 * VIC family:
 *   infiltration -> vertical transfer -> interflow / baseflow
 */

#pragma once

#include "../core/types.hpp"

namespace dsmash {
namespace operators {

// ============================================================================
// GR Operators
// ============================================================================

/**
 * @brief Interception fluxes
 */
struct InterceptionFlux {
    Real pn = 0.0;              ///< Net precipitation [mm]
    Real ei = 0.0;              ///< Interception evaporation [mm]
};

/**
 * @brief Interception store with capacity ci
 * 
 * ei = min(pet, prcp + hi * ci)
 * pn = max(0, prcp - ci * (1 - hi) - ei)
 */
InterceptionFlux interception(Real prcp, Real pet, Real ci, Real& hi);

/**
 * @brief Interception without a store: evaporation up to the rainfall
 */
InterceptionFlux instant_interception(Real prcp, Real pet);

/**
 * @brief Production fluxes
 */
struct ProductionFlux {
    Real pr = 0.0;              ///< Runoff excess [mm]
    Real perc = 0.0;            ///< Percolation [mm]
};

/**
 * @brief Soil moisture accounting store (hyperbolic tangent curves)
 * 
 * Fill by pn and depletion by en are followed by percolation
 * perc = h cp (1 - (1 + (h / beta)^4)^(-1/4)).
 */
ProductionFlux production(Real pn, Real en, Real cp, Real beta, Real& hp);

/// Groundwater exchange l = exc * hft^3.5 (negative is a loss)
Real exchange(Real exc, Real hft);

/**
 * @brief Nonlinear transfer store with an n-th power storage law
 * 
 * When prcp < 0 (missing forcing) the inflow is replaced by the amount the
 * store would drain in one step, keeping the store in equilibrium.
 * The level is floored at 1e-6 before drainage.
 * 
 * @return Outflow [mm]
 */
Real transfer(Real n, Real prcp, Real pr, Real ct, Real& ht);

// ============================================================================
// Routing
// ============================================================================

/**
 * @brief Linear reservoir: hlr' = (hlr + qup) exp(-dt / (lr * 60))
 * @return Routed outflow [mm]
 */
Real linear_routing(Real dt, Real qup, Real lr, Real& hlr);

// ============================================================================
// VIC Operators
// ============================================================================

/**
 * @brief ARNO variable infiltration curve over both upper layers
 * 
 * Infiltration fills layer 1 first, the excess goes to layer 2.
 * 
 * @return Surface runoff [mm]
 */
Real vic_infiltration(Real prcp, Real cusl1, Real cusl2, Real b,
                      Real& husl1, Real& husl2);

/**
 * @brief Evaporation from the upper layers and gravity drainage downward
 */
void vic_vertical_transfer(Real pet, Real cusl1, Real cusl2, Real clsl, Real ks,
                           Real& husl1, Real& husl2, Real& hlsl);

/// Interflow from upper layer 2, drained as a transfer store without inflow
Real vic_interflow(Real n, Real cusl2, Real& husl2);

/// ARNO baseflow from the lower layer
Real vic_baseflow(Real clsl, Real ds, Real dsm, Real ws, Real& hlsl);

} // namespace operators
} // namespace dsmash
