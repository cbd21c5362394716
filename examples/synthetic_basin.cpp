/**
 * @file synthetic_basin.cpp
 * @brief Example: forward simulation of a synthetic comb-shaped basin
 * 
 * Every column drains south into the bottom row, which drains east to
 * the outlet in the bottom-right corner.
 * 
 * This demonstrates:
 * - Grid setup from code (flow directions, accumulation, ordering)
 * - Forcing input one raster at a time
 * - Running every model structure on the same basin
 * - Wavefront-parallel sweeps
 */

#include <dsmash/dsmash.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>

using namespace dsmash;

/**
 * @brief n x n comb basin with the outlet gauge at (n-1, n-1)
 */
Ptr<Grid> make_comb_basin(Index n, Real dx) {
    auto grid = std::make_shared<Grid>(n, n, dx);

    for (Index row = 0; row < n; ++row) {
        for (Index col = 0; col < n; ++col) {
            if (row < n - 1) {
                grid->flow_direction(row, col) = 5;                 // south
                grid->flow_accumulation(row, col) = static_cast<int>(row + 1);
            } else if (col < n - 1) {
                grid->flow_direction(row, col) = 3;                 // east
                grid->flow_accumulation(row, col) = static_cast<int>(n * (col + 1));
            } else {
                grid->flow_direction(row, col) = constants::NO_FLOW;
                grid->flow_accumulation(row, col) = static_cast<int>(n * n);
            }
        }
    }
    grid->active_cell.setOnes();

    // Increasing accumulation is a valid upstream-to-downstream order
    for (Index col = 0; col < n; ++col)
        for (Index row = 0; row < n; ++row)
            grid->cell_order.push_back({row, col});
    std::stable_sort(grid->cell_order.begin(), grid->cell_order.end(),
        [&](const CellIndex& a, const CellIndex& b) {
            return grid->flow_accumulation(a.row, a.col) < grid->flow_accumulation(b.row, b.col);
        });

    grid->gauges.push_back({"outlet", n - 1, n - 1, static_cast<Real>(n * n) * dx * dx});
    return grid;
}

int main() {
    std::cout << "=== dSMASH Synthetic Basin ===" << std::endl;

    const Index n = 20;
    const Real dx = 1000.0;            // 1 km cells
    const Index ntime = 240;            // 10 days of hourly steps

    auto grid = make_comb_basin(n, dx);
    grid->finalize(StorageLayout::Dense);
    grid->print_summary(std::cout);

    // Forcing: a two-day storm moving west to east, constant PET
    auto input = std::make_shared<InputData>();
    input->initialize(*grid, ntime);
    for (Index t = 0; t < ntime; ++t) {
        Matrix prcp = Matrix::Zero(n, n);
        Matrix pet = Matrix::Constant(n, n, 0.1);
        if (t >= 12 && t < 60) {
            const Index front = (t - 12) * n / 48;
            for (Index col = 0; col <= front && col < n; ++col) {
                prcp.col(col).setConstant(4.0);
            }
        }
        input->set_forcing_step(*grid, t, prcp, pet);
    }

    std::ofstream outfile("synthetic_basin_qsim.csv");
    outfile << "structure,step,qsim\n";

    for (auto structure : {StructureType::GrA, StructureType::GrB, StructureType::GrC,
                           StructureType::GrD, StructureType::VicA}) {
        Config config;
        config.model.structure = structure;
        config.model.ntime_step = ntime;
        config.parallel.wavefront = true;

        Model model;
        model.set_grid(grid);
        model.set_config(config);
        model.set_input_data(input);
        model.initialize();

        auto result = model.run();
        const Matrix& qsim = model.output().qsim;

        Index t_peak = 0;
        const Real q_peak = qsim.row(0).maxCoeff(&t_peak);

        std::cout << config_io::to_string(structure) << ": peak " << q_peak
                  << " m3/s at step " << t_peak << " (" << result.run_time_ms << " ms)"
                  << std::endl;

        for (Index t = 0; t < ntime; ++t) {
            outfile << config_io::to_string(structure) << "," << t << "," << qsim(0, t) << "\n";
        }
    }

    std::cout << "Hydrographs written to synthetic_basin_qsim.csv" << std::endl;
    return 0;
}
