/**
 * @file test_control.cpp
 * @brief Control vectors and hyper-parameter mapping
 */

#include <catch2/catch.hpp>
#include "basin_fixture.hpp"
#include <cmath>

using namespace dsmash;
using namespace dsmash_test;
using Catch::Detail::Approx;

namespace {

struct ControlFixture {
    Ptr<Grid> grid = make_basin(StorageLayout::Dense, true);
    Ptr<InputData> input = make_input(*grid, 2, 1.0, 0.0);
    Config config = make_config(StructureType::GrA, 2);
    Parameters params;
    States states;

    ControlFixture() {
        params.initialize(grid->n_storage());
        states.initialize(grid->n_storage());
        config.cost.optim_parameters = {ParameterName::cp, ParameterName::cft};
        config.cost.optim_states = {StateName::hp};

        input->descriptors = Matrix(9, 2);
        for (Index k = 0; k < 9; ++k) {
            input->descriptors(k, 0) = 100.0 + 10.0 * k;
            input->descriptors(k, 1) = (k % 3 == 0) ? 1.0 : 0.0;
        }
        for (Index k = 0; k < 9; ++k) params.cp(k) = 100.0 + 25.0 * k;
    }

    Real active_mean(const Vector& field) const {
        Real sum = 0.0;
        Index n = 0;
        for (Index k = 0; k < field.size(); ++k) {
            const auto& c = grid->storage_cell(k);
            if (!grid->is_active(c.row, c.col)) continue;
            sum += field(k);
            ++n;
        }
        return sum / n;
    }
};

} // anonymous namespace

TEST_CASE("Bounded sigmoid and logit", "[control][mapping]") {
    const Bound bd{0.0, 10.0};
    REQUIRE(sigmoid_bound(0.0, bd) == Approx(5.0));
    REQUIRE(logit_bound(5.0, bd) == Approx(0.0).margin(1e-12));
    REQUIRE(sigmoid_bound(logit_bound(7.3, bd), bd) == Approx(7.3));

    REQUIRE(sigmoid_bound(50.0, bd) <= 10.0);
    REQUIRE(sigmoid_bound(-50.0, bd) >= 0.0);
}

TEST_CASE("Uniform control", "[control]") {
    ControlFixture fx;
    Control control(*fx.grid, fx.config, *fx.input);

    REQUIRE(control.size() == 3);
    auto names = control.names();
    REQUIRE(names.size() == 3);
    REQUIRE(names[0] == "cp");
    REQUIRE(names[2] == "hp");

    Vector x = control.pack(fx.params, fx.states);
    REQUIRE(x(0) == Approx(fx.active_mean(fx.params.cp)));
    REQUIRE(x(1) == Approx(default_params::cft));

    const Real inactive_cp = fx.params.cp(fx.grid->storage_index(0, 0));
    x(0) = 321.0;
    control.unpack(x, fx.params, fx.states);

    REQUIRE(fx.params.cp(fx.grid->storage_index(2, 2)) == 321.0);
    REQUIRE(fx.params.cp(fx.grid->storage_index(0, 0)) == inactive_cp);
}

TEST_CASE("Distributed control", "[control]") {
    ControlFixture fx;
    fx.config.cost.mapping = MappingType::Distributed;
    Control control(*fx.grid, fx.config, *fx.input);

    REQUIRE(control.size() == 3 * 8);
    REQUIRE(control.names().size() == 24);

    Vector x = control.pack(fx.params, fx.states);
    Parameters p = fx.params;
    p.cp.setZero();
    States s = fx.states;
    control.unpack(x, p, s);

    for (Index k = 1; k < 9; ++k) {
        REQUIRE(p.cp(k) == fx.params.cp(k));
    }
}

TEST_CASE("Normalized control values", "[control]") {
    ControlFixture fx;
    fx.config.cost.denormalize_forward = true;
    Control control(*fx.grid, fx.config, *fx.input);

    fx.params.cft.setConstant(500.0);
    Vector x = control.pack(fx.params, fx.states);

    const Bound& bd = fx.config.bounds[ParameterName::cft];
    REQUIRE(x(1) == Approx((500.0 - bd.lower) / bd.width()));

    control.unpack(x, fx.params, fx.states);
    REQUIRE(fx.params.cft(4) == Approx(500.0));
}

TEST_CASE("Hyper-linear control", "[control][mapping]") {
    ControlFixture fx;
    fx.config.cost.mapping = MappingType::HyperLinear;
    Control control(*fx.grid, fx.config, *fx.input);

    REQUIRE(control.size() == 3 * 3);

    // Zero slopes reproduce the active mean everywhere
    Vector x = control.pack(fx.params, fx.states);
    REQUIRE(x(1) == 0.0);
    REQUIRE(x(2) == 0.0);

    const Real mean_cp = fx.active_mean(fx.params.cp);
    control.unpack(x, fx.params, fx.states);
    for (Index k = 0; k < 9; ++k) {
        REQUIRE(fx.params.cp(k) == Approx(mean_cp));
    }

    // A positive slope on the first descriptor orders the cells
    x(1) = 2.0;
    control.unpack(x, fx.params, fx.states);
    const Bound& bd = fx.config.bounds[ParameterName::cp];
    for (Index k = 1; k < 9; ++k) {
        REQUIRE(fx.params.cp(k) > fx.params.cp(k - 1));
        REQUIRE(fx.params.cp(k) < bd.upper);
    }
}

TEST_CASE("Hyper-polynomial control", "[control][mapping]") {
    ControlFixture fx;
    fx.config.cost.mapping = MappingType::HyperPolynomial;
    Control control(*fx.grid, fx.config, *fx.input);

    REQUIRE(control.size() == 3 * 5);
    REQUIRE(control.names().size() == 15);

    Vector x = control.pack(fx.params, fx.states);
    REQUIRE(x(2) == 1.0);   // exponent of the first descriptor
    REQUIRE(x(4) == 1.0);

    HyperParameters hyper(MappingType::HyperPolynomial, 2, fx.config.cost);
    REQUIRE(hyper.n_coefficients() == 5);
    REQUIRE(hyper.parameters.at(ParameterName::cp)(2) == 1.0);
    REQUIRE(hyper.states.count(StateName::hp) == 1);
}

TEST_CASE("Control errors", "[control][errors]") {
    ControlFixture fx;

    SECTION("Hyper mapping without descriptors") {
        fx.config.cost.mapping = MappingType::HyperLinear;
        fx.input->descriptors.resize(9, 0);
        REQUIRE_THROWS_AS(Control(*fx.grid, fx.config, *fx.input), std::invalid_argument);
    }

    SECTION("Wrong control size") {
        Control control(*fx.grid, fx.config, *fx.input);
        REQUIRE_THROWS_AS(control.unpack(Vector::Zero(7), fx.params, fx.states),
                          std::invalid_argument);
    }

    SECTION("Hyper parameters need a hyper mapping") {
        REQUIRE_THROWS_AS(HyperParameters(MappingType::Uniform, 2, fx.config.cost),
                          std::invalid_argument);
    }

    SECTION("Descriptor count mismatch") {
        HyperParameters hyper(MappingType::HyperLinear, 3, fx.config.cost);
        REQUIRE_THROWS_AS(hyper.to_fields(Matrix::Zero(9, 2), fx.config.bounds,
                                          fx.params, fx.states),
                          std::invalid_argument);
    }
}
