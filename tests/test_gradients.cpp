/**
 * @file test_gradients.cpp
 * @brief Gradient tooling: finite differences, Taylor test, scalar product test
 * 
 * The model-level case checks that the finite-difference gradient of the
 * full cost passes the gradient test, which is what a calibration driver
 * relies on before trusting a descent direction.
 */

#include <catch2/catch.hpp>
#include "basin_fixture.hpp"
#include <random>

using namespace dsmash;
using namespace dsmash_test;
using Catch::Detail::Approx;

// Tolerance for gradient comparisons
constexpr double GRAD_TOL = 1e-5;

namespace {

/**
 * @brief f(x) = 0.5 x'Ax + b'x with a fixed SPD matrix
 */
struct Quadratic {
    Matrix A;
    Vector b;

    Quadratic() : A(3, 3), b(3) {
        A << 4, 1, 0,
             1, 3, 1,
             0, 1, 2;
        b << 1, -2, 0.5;
    }

    Real operator()(const Vector& x) const { return 0.5 * x.dot(A * x) + b.dot(x); }
    Vector gradient(const Vector& x) const { return A * x + b; }
};

} // anonymous namespace

TEST_CASE("Finite-difference gradient of a quadratic", "[gradients]") {
    Quadratic f;
    Vector x(3);
    x << 0.3, -1.2, 2.0;

    Vector fd = finite_difference_gradient(f, x);
    Vector exact = f.gradient(x);

    for (Index i = 0; i < 3; ++i) {
        REQUIRE(fd(i) == Approx(exact(i)).margin(GRAD_TOL));
    }

    Vector d(3);
    d << 1.0, 0.0, -1.0;
    REQUIRE(directional_derivative(f, x, d) == Approx(exact.dot(d)).margin(GRAD_TOL));
}

TEST_CASE("Gradient test accepts the exact gradient", "[gradients]") {
    Quadratic f;
    Vector x(3);
    x << 0.3, -1.2, 2.0;
    Vector grad = f.gradient(x);
    Vector d = grad.normalized();

    auto result = gradient_test(f, x, grad, d, 12);

    REQUIRE(result.alpha.size() == 12);
    REQUIRE(result.alpha[0] == 1.0);
    REQUIRE(result.alpha[3] == 0.125);
    for (Size n = 1; n < 8; ++n) {
        REQUIRE(result.ia[n] < result.ia[n - 1]);
    }
    REQUIRE(result.min_ia < 1e-3);
}

TEST_CASE("Gradient test rejects a wrong gradient", "[gradients]") {
    Quadratic f;
    Vector x(3);
    x << 0.3, -1.2, 2.0;
    Vector grad = 2.0 * f.gradient(x);

    auto result = gradient_test(f, x, grad, grad.normalized());
    REQUIRE(result.min_ia > 0.3);

    Vector orthogonal(3);
    orthogonal << grad(1), -grad(0), 0.0;
    REQUIRE_THROWS_AS(gradient_test(f, x, grad, orthogonal), std::invalid_argument);
    REQUIRE_THROWS_AS(gradient_test(f, x, grad, Vector::Ones(2)), std::invalid_argument);
}

TEST_CASE("Scalar product test", "[gradients][adjoint]") {
    std::mt19937 rng(42);
    std::uniform_real_distribution<double> dist(-1.0, 1.0);

    Matrix A(4, 3);
    for (Index i = 0; i < A.size(); ++i) A.data()[i] = dist(rng);
    Vector dx(3), dy(4);
    for (Index i = 0; i < 3; ++i) dx(i) = dist(rng);
    for (Index i = 0; i < 4; ++i) dy(i) = dist(rng);

    auto tangent = [&](const Vector& v) -> Vector { return A * v; };
    auto adjoint = [&](const Vector& v) -> Vector { return A.transpose() * v; };
    auto bad_adjoint = [&](const Vector& v) -> Vector { return 2.0 * A.transpose() * v; };

    auto good = scalar_product_test(tangent, adjoint, dx, dy);
    REQUIRE(good.tangent_product == Approx(good.adjoint_product));
    REQUIRE(good.relative_error < 1e-12);

    auto bad = scalar_product_test(tangent, bad_adjoint, dx, dy);
    REQUIRE(bad.relative_error == Approx(1.0));
}

TEST_CASE("Model cost gradient passes the gradient test", "[gradients][model]") {
    auto grid = make_basin();
    const Index ntime = 36;
    auto input = make_input(*grid, ntime, 0.0, 0.0);
    fill_storm(*input);

    Config config = make_config(StructureType::GrA, ntime);
    config.cost.optim_parameters = {ParameterName::cp, ParameterName::cft};

    // Synthetic observations from a different parameter set
    Model truth;
    truth.set_grid(grid);
    truth.set_config(config);
    truth.set_input_data(input);
    Parameters p_true;
    p_true.initialize(grid->n_storage());
    p_true.set_uniform(ParameterName::cp, 300.0);
    p_true.set_uniform(ParameterName::cft, 300.0);
    truth.set_parameters(p_true);
    truth.initialize();
    truth.run();
    input->qobs = truth.output().qsim;

    Model model;
    model.set_grid(grid);
    model.set_config(config);
    model.set_input_data(input);
    model.initialize();

    Vector x = model.control_vector();
    REQUIRE(x.size() == 2);

    Vector grad = model.compute_gradient(x);
    REQUIRE(grad.norm() > 0.0);

    auto result = model.check_gradient(x, grad, grad.normalized());
    REQUIRE(result.min_ia < 1e-2);
}
