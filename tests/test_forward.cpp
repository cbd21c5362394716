/**
 * @file test_forward.cpp
 * @brief Forward simulation over the synthetic basin
 */

#include <catch2/catch.hpp>
#include "basin_fixture.hpp"
#include <cmath>

#ifdef _OPENMP
#include <omp.h>
#endif

using namespace dsmash;
using namespace dsmash_test;
using Catch::Detail::Approx;

namespace {

States empty_states(Index n) {
    States s;
    s.initialize(n);
    for (auto name : all_states()) {
        s.set_uniform(name, constants::STORE_FLOOR);
    }
    return s;
}

Real stored_water(const StructureDescriptor& st, const Parameters& p, const States& s) {
    if (st.family == ProcessFamily::Vic) {
        return s.husl1(0) * p.cusl1(0) + s.husl2(0) * p.cusl2(0) + s.hlsl(0) * p.clsl(0);
    }
    Real w = s.hp(0) * p.cp(0) + s.hft(0) * p.cft(0);
    if (st.interception == InterceptionKind::Store) w += s.hi(0) * p.ci(0);
    if (st.slow_transfer) w += s.hst(0) * p.cst(0);
    return w;
}

} // anonymous namespace

TEST_CASE("Rain on an empty basin", "[forward]") {
    auto grid = make_basin(StorageLayout::Dense, true);
    auto input = make_input(*grid, 1, 10.0, 0.0);
    Config config = make_config(StructureType::GrA, 1);
    config.output.save_qsim_domain = true;

    Parameters params;
    params.initialize(grid->n_storage());
    States states = empty_states(grid->n_storage());

    Forward forward(*grid, config, *input);
    Output output;
    auto result = forward.run(params, states, output);

    REQUIRE(result.steps == 1);
    REQUIRE(result.cells_processed == 8);
    REQUIRE(output.qsim.rows() == 1);
    REQUIRE(output.qsim.cols() == 1);
    REQUIRE(output.qsim(0, 0) > 0.0);

    REQUIRE(output.qsim_domain(grid->storage_index(0, 0), 0) == 0.0);
    REQUIRE(output.qsim_domain(grid->storage_index(0, 1), 0) > 0.0);
    REQUIRE(output.qsim(0, 0) == output.qsim_domain(grid->gauge_index(0), 0));
}

TEST_CASE("Local runoff closes the water balance", "[forward][balance]") {
    const StructureType types[] = {StructureType::GrA, StructureType::GrB, StructureType::GrC,
                                   StructureType::GrD, StructureType::VicA};

    for (auto type : types) {
        const auto& st = structure_descriptor(type);
        INFO("structure " << st.name);

        Parameters p;
        p.initialize(1);
        p.set_uniform(ParameterName::exc, 0.0);
        States s;
        s.initialize(1);

        const Real w0 = stored_water(st, p, s);
        const Real qt = local_runoff(st, 10.0, 0.0, p, s, 0);
        const Real w1 = stored_water(st, p, s);

        REQUIRE(qt >= 0.0);
        REQUIRE(qt + (w1 - w0) == Approx(10.0).epsilon(1e-9));
    }
}

TEST_CASE("Routing carries all local runoff to the outlet", "[forward][balance][routing]") {
    auto grid = make_basin();
    const Real to_volume = grid->cell_area() * constants::MM_TO_M;

    SECTION("Instant routing in one step") {
        auto input = make_input(*grid, 1, 10.0, 0.0);
        Config config = make_config(StructureType::GrA, 1);
        config.output.save_net_prcp_domain = true;

        Parameters params;
        params.initialize(grid->n_storage());
        params.set_uniform(ParameterName::exc, 0.0);
        params.set_uniform(ParameterName::lr, 1e-6);
        States states;
        states.initialize(grid->n_storage());
        states.hlr.setZero();

        Output output;
        Forward(*grid, config, *input).run(params, states, output);

        const Real runoff = output.net_prcp_domain.col(0).sum() * to_volume / config.model.dt;
        REQUIRE(runoff > 0.0);
        REQUIRE(output.qsim(0, 0) == Approx(runoff));
    }

    SECTION("Routing stores hold the difference over a storm") {
        const Index ntime = 24;
        auto input = make_input(*grid, ntime, 0.0, 0.0);
        fill_storm(*input);
        Config config = make_config(StructureType::GrA, ntime);
        config.output.save_net_prcp_domain = true;

        Parameters params;
        params.initialize(grid->n_storage());
        params.set_uniform(ParameterName::exc, 0.0);
        params.set_uniform(ParameterName::lr, 120.0);
        States states;
        states.initialize(grid->n_storage());
        states.hlr.setZero();

        Output output;
        Forward(*grid, config, *input).run(params, states, output);

        const Real inflow = output.net_prcp_domain.sum() * to_volume;
        const Real outflow = output.qsim.row(0).sum() * config.model.dt;

        // Each routing store holds a depth over its upstream area
        Real stored = 0.0;
        for (Index r = 0; r < grid->nrow(); ++r) {
            for (Index c = 0; c < grid->ncol(); ++c) {
                const Index k = grid->storage_index(r, c);
                const Real upstream = static_cast<Real>(grid->flow_accumulation(r, c) - 1);
                stored += states.hlr(k) * upstream * to_volume;
            }
        }

        REQUIRE(outflow > 0.0);
        REQUIRE(stored > 0.0);
        REQUIRE(outflow + stored == Approx(inflow).epsilon(1e-9));
    }
}

TEST_CASE("Structure descriptors", "[forward][structure]") {
    const auto& gr_a = structure_descriptor(StructureType::GrA);
    REQUIRE(gr_a.name == "gr_a");
    REQUIRE(gr_a.uses(ParameterName::exc));
    REQUIRE_FALSE(gr_a.uses(ParameterName::ci));

    const auto& gr_c = structure_descriptor(StructureType::GrC);
    REQUIRE(gr_c.fast_fraction + gr_c.slow_fraction + gr_c.direct_fraction == Approx(1.0));
    REQUIRE(gr_c.uses(StateName::hst));

    const auto& vic = structure_descriptor(StructureType::VicA);
    REQUIRE(vic.family == ProcessFamily::Vic);
    REQUIRE(vic.uses(ParameterName::ks));

    REQUIRE_THROWS_AS(structure_descriptor(static_cast<StructureType>(42)), std::invalid_argument);
}

TEST_CASE("Wavefront sweep matches sequential order", "[forward][parallel]") {
    auto grid = make_basin();
    auto input = make_input(*grid, 24, 0.0, 0.0);
    fill_storm(*input);

    Parameters params;
    params.initialize(grid->n_storage());
    for (Index k = 0; k < grid->n_storage(); ++k) params.cp(k) = 150.0 + 20.0 * k;

    for (auto type : {StructureType::GrB, StructureType::VicA}) {
        Config sequential = make_config(type, 24);
        Config parallel = sequential;
        parallel.parallel.wavefront = true;

        States s1, s2;
        s1.initialize(grid->n_storage());
        s2.initialize(grid->n_storage());
        Output o1, o2;

        Forward(*grid, sequential, *input).run(params, s1, o1);
        Forward(*grid, parallel, *input).run(params, s2, o2);

        for (Index t = 0; t < 24; ++t) {
            REQUIRE(o2.qsim(0, t) == Approx(o1.qsim(0, t)).epsilon(1e-12));
        }
        REQUIRE((s1.hlr - s2.hlr).cwiseAbs().maxCoeff() < 1e-12);
    }
}

TEST_CASE("Thread count stays local to the sweep", "[forward][parallel]") {
    auto grid = make_basin();
    auto input = make_input(*grid, 6, 0.0, 0.0);
    fill_storm(*input);

    Config sequential = make_config(StructureType::GrA, 6);
    Config parallel = sequential;
    parallel.parallel.wavefront = true;
    parallel.parallel.num_threads = 2;

    Parameters params;
    params.initialize(grid->n_storage());

#ifdef _OPENMP
    const int before = omp_get_max_threads();
#endif

    States s1, s2;
    s1.initialize(grid->n_storage());
    s2.initialize(grid->n_storage());
    Output o1, o2;
    Forward(*grid, sequential, *input).run(params, s1, o1);
    Forward(*grid, parallel, *input).run(params, s2, o2);

#ifdef _OPENMP
    REQUIRE(omp_get_max_threads() == before);
#endif
    REQUIRE((o1.qsim - o2.qsim).cwiseAbs().maxCoeff() < 1e-12);
}

TEST_CASE("Sparse storage matches dense storage", "[forward][storage]") {
    auto dense = make_basin(StorageLayout::Dense, true);
    auto sparse = make_basin(StorageLayout::Sparse, true);

    auto in_dense = make_input(*dense, 12, 0.0, 0.0);
    auto in_sparse = make_input(*sparse, 12, 0.0, 0.0);
    for (Index t = 0; t < 12; ++t) {
        Matrix p = Matrix::Constant(3, 3, t < 6 ? 12.0 : 0.0);
        Matrix e = Matrix::Constant(3, 3, 0.5);
        in_dense->set_forcing_step(*dense, t, p, e);
        in_sparse->set_forcing_step(*sparse, t, p, e);
    }

    Config c_dense = make_config(StructureType::GrC, 12, StorageLayout::Dense);
    Config c_sparse = make_config(StructureType::GrC, 12, StorageLayout::Sparse);

    Parameters p_dense, p_sparse;
    p_dense.initialize(dense->n_storage());
    p_sparse.initialize(sparse->n_storage());
    States s_dense, s_sparse;
    s_dense.initialize(dense->n_storage());
    s_sparse.initialize(sparse->n_storage());

    Output o_dense, o_sparse;
    Forward(*dense, c_dense, *in_dense).run(p_dense, s_dense, o_dense);
    Forward(*sparse, c_sparse, *in_sparse).run(p_sparse, s_sparse, o_sparse);

    for (Index t = 0; t < 12; ++t) {
        REQUIRE(o_sparse.qsim(0, t) == Approx(o_dense.qsim(0, t)).epsilon(1e-12));
    }
}

TEST_CASE("Missing forcing still drains the stores", "[forward]") {
    auto grid = make_basin();
    auto input = make_input(*grid, 6, 5.0, 0.0);
    input->prcp.rightCols(3).setConstant(-99.0);
    Config config = make_config(StructureType::GrA, 6);

    Parameters params;
    params.initialize(grid->n_storage());
    States states;
    states.initialize(grid->n_storage());
    Output output;

    Forward(*grid, config, *input).run(params, states, output);

    for (Index t = 0; t < 6; ++t) {
        REQUIRE(std::isfinite(output.qsim(0, t)));
        REQUIRE(output.qsim(0, t) > 0.0);
    }
}

TEST_CASE("Per-step callback and domain outputs", "[forward]") {
    auto grid = make_basin();
    auto input = make_input(*grid, 5, 4.0, 1.0);
    Config config = make_config(StructureType::GrD, 5);
    config.output.save_net_prcp_domain = true;

    Parameters params;
    params.initialize(grid->n_storage());
    States states;
    states.initialize(grid->n_storage());
    Output output;

    Index calls = 0;
    Forward(*grid, config, *input).run(params, states, output,
        [&](Index step, const Vector& q) {
            REQUIRE(step == calls);
            REQUIRE(q.size() == grid->n_storage());
            ++calls;
        });

    REQUIRE(calls == 5);
    REQUIRE(output.has_net_prcp_domain());
    REQUIRE_FALSE(output.has_qsim_domain());
    REQUIRE(output.net_prcp_domain.rows() == 9);
}

TEST_CASE("Forward rejects inconsistent inputs", "[forward][errors]") {
    auto grid = make_basin();
    auto input = make_input(*grid, 4, 1.0, 0.0);
    Config config = make_config(StructureType::GrA, 4);

    Parameters params;
    params.initialize(grid->n_storage());
    States states;
    states.initialize(grid->n_storage());
    Output output;

    SECTION("Grid not finalized") {
        Grid raw(3, 3, 1000.0);
        REQUIRE_THROWS_AS(Forward(raw, config, *input), std::invalid_argument);
    }

    SECTION("Forcing shape") {
        input->prcp = Matrix::Zero(9, 3);
        Forward forward(*grid, config, *input);
        REQUIRE_THROWS_AS(forward.run(params, states, output), std::invalid_argument);
    }

    SECTION("Parameter length") {
        params.cp = Vector::Constant(4, 200.0);
        Forward forward(*grid, config, *input);
        REQUIRE_THROWS_AS(forward.run(params, states, output), std::invalid_argument);
    }

    SECTION("Unknown structure") {
        config.model.structure = static_cast<StructureType>(9);
        REQUIRE_THROWS_AS(Forward(*grid, config, *input), std::invalid_argument);
    }
}
