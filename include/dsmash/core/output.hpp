/**
 * @file output.hpp
 * @brief Simulation output for dSMASH
 */

#pragma once

#include "types.hpp"
#include "grid.hpp"

namespace dsmash {

/**
 * @brief Discharge series and cost terms of one evaluation
 */
class Output {
public:
    Matrix qsim;                    ///< Simulated discharge at gauges [m³/s] (n_gauges x ntime)
    Matrix qsim_domain;             ///< Discharge of every stored cell [m³/s] (optional)
    Matrix net_prcp_domain;         ///< Local discharge depth qt [mm] (optional)

    Real cost = 0.0;
    Real cost_jobs = 0.0;
    Real cost_jreg = 0.0;

    /**
     * @brief Allocate series for a run
     * 
     * Domain matrices stay empty unless requested.
     */
    void initialize(const Grid& grid, Index ntime, bool save_qsim_domain,
                    bool save_net_prcp_domain);

    bool has_qsim_domain() const { return qsim_domain.size() > 0; }
    bool has_net_prcp_domain() const { return net_prcp_domain.size() > 0; }
};

} // namespace dsmash
