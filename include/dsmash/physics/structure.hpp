/**
 * @file structure.hpp
 * @brief Model structure descriptors and the local runoff pipeline
 * 
 * A structure is described by data only: which operators run and with
 * which partition coefficients. One executor runs every structure in the
 * fixed order interception -> production -> exchange -> transfer(s).
 */

#pragma once

#include "../core/types.hpp"
#include "../core/parameters.hpp"
#include "../core/states.hpp"

namespace dsmash {

/**
 * @brief Interception variant
 */
enum class InterceptionKind {
    Instant,            ///< ei = min(pet, prcp), no store
    Store,              ///< Interception store (ci, hi)
};

/**
 * @brief Soil process family
 */
enum class ProcessFamily {
    Gr,                 ///< Production store + transfer stores
    Vic,                ///< Variable infiltration curve + soil layers
};

/**
 * @brief Static description of a model structure
 */
struct StructureDescriptor {
    StructureType type = StructureType::GrA;
    std::string name;

    ProcessFamily family = ProcessFamily::Gr;
    InterceptionKind interception = InterceptionKind::Instant;
    bool exchange = false;          ///< Exchange added to fast and direct paths
    bool slow_transfer = false;     ///< Second transfer store (cst, hst)
    bool direct_path = false;       ///< Direct runoff branch

    // Fractions of pr + perc routed to each path
    Real fast_fraction = 1.0;
    Real slow_fraction = 0.0;
    Real direct_fraction = 0.0;

    Real transfer_exponent = constants::TRANSFER_EXPONENT;

    std::vector<ParameterName> parameters;
    std::vector<StateName> states;

    bool uses(ParameterName name) const;
    bool uses(StateName name) const;
};

/**
 * @brief Descriptor of a structure
 * @throws std::invalid_argument for an unknown structure id
 */
const StructureDescriptor& structure_descriptor(StructureType type);

/**
 * @brief Local discharge depth qt [mm] of cell k for one step
 * 
 * Production and exchange only run when prcp >= 0 and pet >= 0; transfer
 * stores always drain.
 */
Real local_runoff(const StructureDescriptor& structure, Real prcp, Real pet,
                  const Parameters& params, States& states, Index k);

} // namespace dsmash
