/**
 * @file test_cost.cpp
 * @brief Observation cost, gauge aggregation and the full cost
 */

#include <catch2/catch.hpp>
#include "basin_fixture.hpp"
#include <cmath>

using namespace dsmash;
using namespace dsmash_test;
using Catch::Detail::Approx;

namespace {

constexpr Index NTIME = 4;

/**
 * @brief Three gauges observing 1 m3/s, simulated with offsets 1, 2 and 3
 * 
 * With dt = 3600 s the depth factors are 0.4 (outlet) and 1.2 (others),
 * so the per-gauge SE is 0.64, 23.04 and 51.84.
 */
struct GaugeFixture {
    Ptr<Grid> grid = make_basin(StorageLayout::Dense, false, true);
    Ptr<InputData> input = make_input(*grid, NTIME, 0.0, 0.0);
    Config config = make_config(StructureType::GrA, NTIME);
    Output output;

    GaugeFixture() {
        input->qobs.setConstant(1.0);
        output.initialize(*grid, NTIME, false, false);
        for (Index g = 0; g < 3; ++g) {
            output.qsim.row(g).setConstant(1.0 + static_cast<Real>(g + 1));
        }
        config.cost.jobs_functions = {JobsFunction::SE};
        config.cost.jobs_weights = {1.0};
    }
};

} // anonymous namespace

TEST_CASE("Perfect simulation costs nothing", "[cost]") {
    auto grid = make_basin();
    auto input = make_input(*grid, NTIME, 0.0, 0.0);
    Config config = make_config(StructureType::GrA, NTIME);

    Output output;
    output.initialize(*grid, NTIME, false, false);
    for (Index t = 0; t < NTIME; ++t) {
        input->qobs(0, t) = 1.0 + t;
        output.qsim(0, t) = 1.0 + t;
    }

    for (auto f : {JobsFunction::NSE, JobsFunction::KGE, JobsFunction::SE, JobsFunction::RMSE}) {
        config.cost.jobs_functions = {f};
        REQUIRE(compute_jobs(*grid, config, *input, output) == Approx(0.0).margin(1e-6));
    }
}

TEST_CASE("Gauge weights", "[cost][gauges]") {
    GaugeFixture fx;

    SECTION("Default weights use the first gauge only") {
        REQUIRE(compute_jobs(*fx.grid, fx.config, *fx.input, fx.output) == Approx(0.64));
    }

    SECTION("Positive weights add") {
        fx.config.cost.gauge_weights = {0.0, 2.0, 0.0};
        REQUIRE(compute_jobs(*fx.grid, fx.config, *fx.input, fx.output) == Approx(46.08));
    }

    SECTION("Negative weights pool into a median") {
        fx.config.cost.gauge_weights = {-1.0, -1.0, -1.0};
        REQUIRE(compute_jobs(*fx.grid, fx.config, *fx.input, fx.output) == Approx(23.04));
    }

    SECTION("Weighted gauges and the pooled median combine") {
        fx.config.cost.gauge_weights = {1.0, -1.0, -1.0};
        REQUIRE(compute_jobs(*fx.grid, fx.config, *fx.input, fx.output) ==
                Approx(0.64 + 0.5 * (23.04 + 51.84)));
    }
}

TEST_CASE("Several metrics per gauge", "[cost]") {
    GaugeFixture fx;
    fx.config.cost.jobs_functions = {JobsFunction::SE, JobsFunction::RMSE};
    fx.config.cost.jobs_weights = {1.0, 0.5};

    REQUIRE(compute_jobs(*fx.grid, fx.config, *fx.input, fx.output) ==
            Approx(0.64 + 0.5 * 0.4));
}

TEST_CASE("Optimization window", "[cost]") {
    GaugeFixture fx;
    fx.output.qsim.row(0).tail(2).setConstant(1.0);

    fx.config.cost.optimize_start_step = 2;
    REQUIRE(compute_jobs(*fx.grid, fx.config, *fx.input, fx.output) == Approx(0.0).margin(1e-12));

    fx.config.cost.optimize_start_step = 0;
    REQUIRE(compute_jobs(*fx.grid, fx.config, *fx.input, fx.output) == Approx(0.32));
}

TEST_CASE("Gauge without observations", "[cost][missing]") {
    GaugeFixture fx;
    fx.input->qobs.row(0).setConstant(-99.0);

    REQUIRE(compute_jobs(*fx.grid, fx.config, *fx.input, fx.output) == 0.0);
}

TEST_CASE("Signatures need their extra inputs", "[cost][errors]") {
    GaugeFixture fx;
    fx.config.cost.jobs_functions = {JobsFunction::Crc};

    fx.input->mean_prcp.setConstant(2.0);
    REQUIRE_NOTHROW(compute_jobs(*fx.grid, fx.config, *fx.input, fx.output));

    fx.input->mean_prcp.resize(0, 0);
    REQUIRE_THROWS_AS(compute_jobs(*fx.grid, fx.config, *fx.input, fx.output),
                      std::invalid_argument);

    fx.config.cost.jobs_functions = {JobsFunction::Epf};
    fx.input->mean_prcp = Matrix::Constant(3, NTIME, 2.0);
    fx.input->mask_event.resize(0, 0);
    REQUIRE_THROWS_AS(compute_jobs(*fx.grid, fx.config, *fx.input, fx.output),
                      std::invalid_argument);
}

TEST_CASE("Metric weights must match the metrics", "[cost][errors]") {
    GaugeFixture fx;
    fx.config.cost.jobs_functions = {JobsFunction::SE, JobsFunction::RMSE};
    fx.config.cost.jobs_weights = {1.0};
    REQUIRE_THROWS_AS(compute_jobs(*fx.grid, fx.config, *fx.input, fx.output),
                      std::invalid_argument);

    fx.config.cost.jobs_weights = {1.0, 0.5};
    REQUIRE_NOTHROW(compute_jobs(*fx.grid, fx.config, *fx.input, fx.output));
}

TEST_CASE("Normalization scope restores the fields", "[cost][normalization]") {
    Parameters params;
    params.initialize(5);
    params.cp(2) = 321.123456789;
    States states;
    states.initialize(5);
    states.hlr.setConstant(17.3);

    const Parameters p0 = params;
    const States s0 = states;
    const Bounds bounds = Bounds::defaults();

    {
        NormalizationScope scope(params, states, bounds);
        REQUIRE(params.cp.maxCoeff() <= 1.0);
        REQUIRE(params.cp.minCoeff() >= 0.0);
        REQUIRE(states.hlr(0) == Approx((17.3 - 1e-6) / (1e3 - 1e-6)));
    }

    REQUIRE(params.cp == p0.cp);
    REQUIRE(params.exc == p0.exc);
    REQUIRE(states.hlr == s0.hlr);
}

TEST_CASE("Full cost with regularization", "[cost]") {
    GaugeFixture fx;
    fx.config.cost.optim_parameters = {ParameterName::cp};
    fx.config.cost.jreg_functions = {JregFunction::Prior};
    fx.config.cost.jreg_weights = {1.0};
    fx.config.cost.wjreg = 0.5;

    Background bgd;
    bgd.parameters.initialize(9);
    bgd.states.initialize(9);

    Parameters params = bgd.parameters;
    params.cp.array() += 1.0;
    States states = bgd.states;

    const Real cost = compute_cost(*fx.grid, fx.config, *fx.input, params, states, bgd,
                                   fx.output);

    REQUIRE(fx.output.cost_jobs == Approx(0.64));
    REQUIRE(fx.output.cost_jreg == Approx(9.0));
    REQUIRE(cost == Approx(0.64 + 4.5));
    REQUIRE(fx.output.cost == cost);

    SECTION("Normalized regularization leaves the fields untouched") {
        fx.config.cost.denormalize_forward = true;
        const Parameters before = params;

        compute_cost(*fx.grid, fx.config, *fx.input, params, states, bgd, fx.output);

        REQUIRE(params.cp == before.cp);
        REQUIRE(fx.output.cost_jreg != Approx(9.0));
    }
}
