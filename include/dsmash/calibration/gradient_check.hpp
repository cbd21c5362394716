/**
 * @file gradient_check.hpp
 * @brief Gradient evaluation and validation of tangent/adjoint codes
 * 
 * The cost J(x) is a pure function of the control vector. Any gradient
 * provider (hand-written adjoint, AD tool or finite differences) is
 * validated with:
 * - the gradient test: (J(x + a d) - J(x)) / (a <grad, d>) -> 1 as a -> 0
 * - the scalar product test: <T dx, dy> == <dx, A dy> for tangent T and
 *   adjoint A
 */

#pragma once

#include "../core/types.hpp"

namespace dsmash {

/**
 * @brief Central finite-difference gradient
 * 
 * Step h_i = eps * max(1, |x_i|).
 */
Vector finite_difference_gradient(const CostFunc& f, const Vector& x, Real eps = 1e-6);

/**
 * @brief Directional derivative <grad J(x), d> by central differences
 */
Real directional_derivative(const CostFunc& f, const Vector& x, const Vector& d,
                            Real eps = 1e-6);

/**
 * @brief Result of the gradient (Taylor) test
 */
struct GradientTestResult {
    std::vector<Real> alpha;        ///< a_n = 2^-n
    std::vector<Real> ia;           ///< |ratio_n - 1|
    Real min_ia = 0.0;
    Index best = 0;                 ///< n of min_ia
};

/**
 * @brief Gradient test over a = 2^0 .. 2^-(n_steps-1)
 * 
 * @throws std::invalid_argument if sizes differ or <grad, d> is zero
 */
GradientTestResult gradient_test(const CostFunc& f, const Vector& x, const Vector& grad,
                                 const Vector& direction, Index n_steps = 16);

/**
 * @brief Result of the scalar product test
 */
struct ScalarProductResult {
    Real tangent_product = 0.0;     ///< <T dx, dy>
    Real adjoint_product = 0.0;     ///< <dx, A dy>
    Real relative_error = 0.0;
};

ScalarProductResult scalar_product_test(const LinearOperatorFunc& tangent,
                                        const LinearOperatorFunc& adjoint,
                                        const Vector& dx, const Vector& dy);

} // namespace dsmash
