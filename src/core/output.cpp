/**
 * @file output.cpp
 * @brief Output allocation
 */

#include "dsmash/core/output.hpp"

namespace dsmash {

void Output::initialize(const Grid& grid, Index ntime, bool save_qsim_domain,
                        bool save_net_prcp_domain) {
    qsim = Matrix::Zero(grid.n_gauges(), ntime);

    if (save_qsim_domain) {
        qsim_domain = Matrix::Zero(grid.n_storage(), ntime);
    } else {
        qsim_domain.resize(0, 0);
    }

    if (save_net_prcp_domain) {
        net_prcp_domain = Matrix::Zero(grid.n_storage(), ntime);
    } else {
        net_prcp_domain.resize(0, 0);
    }

    cost = 0.0;
    cost_jobs = 0.0;
    cost_jreg = 0.0;
}

} // namespace dsmash
