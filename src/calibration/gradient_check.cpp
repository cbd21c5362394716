/**
 * @file gradient_check.cpp
 * @brief Finite differences, gradient test and scalar product test
 */

#include "dsmash/calibration/gradient_check.hpp"
#include <cmath>
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace dsmash {

Vector finite_difference_gradient(const CostFunc& f, const Vector& x, Real eps) {
    const Index n = x.size();
    Vector grad(n);
    Vector xp = x;

    for (Index i = 0; i < n; ++i) {
        const Real orig = x(i);
        const Real h = eps * std::max(1.0, std::abs(orig));

        xp(i) = orig + h;
        const Real fp = f(xp);
        xp(i) = orig - h;
        const Real fm = f(xp);
        xp(i) = orig;

        grad(i) = (fp - fm) / (2.0 * h);
    }
    return grad;
}

Real directional_derivative(const CostFunc& f, const Vector& x, const Vector& d, Real eps) {
    if (d.size() != x.size()) {
        throw std::invalid_argument("Direction and control vector differ in size");
    }
    const Real h = eps * std::max(1.0, x.lpNorm<Eigen::Infinity>());
    return (f(x + h * d) - f(x - h * d)) / (2.0 * h);
}

GradientTestResult gradient_test(const CostFunc& f, const Vector& x, const Vector& grad,
                                 const Vector& direction, Index n_steps) {
    if (grad.size() != x.size() || direction.size() != x.size()) {
        throw std::invalid_argument("Gradient test vectors differ in size");
    }

    const Real slope = grad.dot(direction);
    if (slope == 0.0) {
        throw std::invalid_argument("Gradient test direction is orthogonal to the gradient");
    }

    const Real f0 = f(x);

    GradientTestResult result;
    result.min_ia = std::numeric_limits<Real>::max();

    for (Index n = 0; n < n_steps; ++n) {
        const Real a = std::pow(2.0, -static_cast<Real>(n));
        const Real ratio = (f(x + a * direction) - f0) / (a * slope);
        const Real ia = std::abs(ratio - 1.0);

        result.alpha.push_back(a);
        result.ia.push_back(ia);
        if (ia < result.min_ia) {
            result.min_ia = ia;
            result.best = n;
        }
    }
    return result;
}

ScalarProductResult scalar_product_test(const LinearOperatorFunc& tangent,
                                        const LinearOperatorFunc& adjoint,
                                        const Vector& dx, const Vector& dy) {
    ScalarProductResult result;
    result.tangent_product = tangent(dx).dot(dy);
    result.adjoint_product = dx.dot(adjoint(dy));

    const Real scale = std::max(std::abs(result.tangent_product), constants::EPSILON);
    result.relative_error = std::abs(result.tangent_product - result.adjoint_product) / scale;
    return result;
}

} // namespace dsmash
