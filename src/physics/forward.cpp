/**
 * @file forward.cpp
 * @brief Forward simulation loop
 */

#include "dsmash/physics/forward.hpp"
#include "dsmash/physics/operators.hpp"
#include "dsmash/physics/routing.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <stdexcept>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace dsmash {

Forward::Forward(const Grid& grid, const Config& config, const InputData& input)
    : grid_(grid)
    , config_(config)
    , input_(input)
    , structure_(structure_descriptor(config.model.structure))
{
    if (!grid_.is_finalized()) {
        throw std::invalid_argument("Grid must be finalized before simulation");
    }
}

void Forward::check_inputs(const Parameters& params, const States& states) const {
    const Index n = grid_.n_storage();
    params.validate(n);
    states.validate(n);
    input_.validate(grid_, config_.model.ntime_step);
}

RunResult Forward::run(const Parameters& params, States& states, Output& output,
                       const OutputCallback& callback) const {
    check_inputs(params, states);

    auto start = std::chrono::high_resolution_clock::now();

    const Index ntime = config_.model.ntime_step;
    output.initialize(grid_, ntime, config_.output.save_qsim_domain,
                      config_.output.save_net_prcp_domain);

    // Cells outside the processed set keep zero discharge
    Vector q = Vector::Zero(grid_.n_storage());

    RunResult result;
    const Index report_every = std::max<Index>(1, ntime / 10);

    for (Index t = 0; t < ntime; ++t) {
        sweep(t, params, states, q, output);

        for (Index g = 0; g < grid_.n_gauges(); ++g) {
            const Index k = grid_.gauge_index(g);
            output.qsim(g, t) = (k >= 0) ? q(k) : 0.0;
        }

        if (callback) {
            callback(t, q);
        }

        if (config_.model.verbose && (t + 1) % report_every == 0) {
            std::cerr << "  step " << (t + 1) << "/" << ntime << "\n";
        }
        ++result.steps;
    }

    auto end = std::chrono::high_resolution_clock::now();
    result.run_time_ms = std::chrono::duration<Real, std::milli>(end - start).count();
    for (const auto& front : grid_.wavefronts()) {
        result.cells_processed += result.steps * static_cast<Index>(front.size());
    }

    return result;
}

void Forward::sweep(Index t, const Parameters& params, States& states, Vector& q,
                    Output& output) const {
    auto record = [&](const CellIndex& cell, const CellFlux& flux) {
        const Index k = grid_.storage_index(cell.row, cell.col);
        if (output.has_net_prcp_domain()) output.net_prcp_domain(k, t) = flux.qt;
        if (output.has_qsim_domain()) output.qsim_domain(k, t) = flux.q;
    };

    if (config_.parallel.wavefront) {
#ifdef _OPENMP
        const int threads = (config_.parallel.num_threads > 0) ? config_.parallel.num_threads
                                                               : omp_get_max_threads();
#endif
        for (const auto& front : grid_.wavefronts()) {
            const Index n = static_cast<Index>(front.size());

            #pragma omp parallel for schedule(static) num_threads(threads)
            for (Index i = 0; i < n; ++i) {
                const CellFlux flux = step_cell(t, front[i], params, states, q);
                record(front[i], flux);
            }
        }
        return;
    }

    for (const auto& cell : grid_.order()) {
        if (!grid_.is_processed(cell.row, cell.col)) continue;
        const CellFlux flux = step_cell(t, cell, params, states, q);
        record(cell, flux);
    }
}

CellFlux Forward::step_cell(Index t, const CellIndex& cell, const Parameters& params,
                            States& states, Vector& q) const {
    const Real dt = config_.model.dt;
    const Index k = grid_.storage_index(cell.row, cell.col);

    const Real prcp = input_.prcp(k, t);
    const Real pet = input_.pet(k, t);

    CellFlux flux;
    flux.qt = local_runoff(structure_, prcp, pet, params, states, k);
    flux.qup = routing::upstream_discharge(grid_, dt, cell.row, cell.col, q);
    flux.qrout = operators::linear_routing(dt, flux.qup, params.lr(k), states.hlr(k));
    flux.q = routing::cell_discharge(grid_, dt, cell.row, cell.col, flux.qt, flux.qrout);

    q(k) = flux.q;
    return flux;
}

} // namespace dsmash
