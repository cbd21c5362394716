/**
 * @file metrics.hpp
 * @brief Goodness-of-fit metrics between observed and simulated series
 * 
 * Convention: x is observed, y is simulated. Indices with x < 0 are
 * missing and skipped. Every metric returns 0 when no valid index exists.
 * All metrics are "lower is better".
 */

#pragma once

#include "../core/types.hpp"

namespace dsmash {
namespace metrics {

/**
 * @brief Squared-error ratio (sum (x - y)²) / (sum (x - mean x)²)
 * 
 * This is the raw ratio, not 1 - ratio: 0 is a perfect fit.
 */
Real nse(const Vector& x, const Vector& y);

/**
 * @brief Kling-Gupta components from population moments
 */
struct KgeComponents {
    Real r = 0.0;           ///< Linear correlation
    Real alpha = 0.0;       ///< Variability ratio std(y) / std(x)
    Real beta = 0.0;        ///< Bias ratio mean(y) / mean(x)
};

KgeComponents kge_components(const Vector& x, const Vector& y);

/// sqrt((r - 1)² + (alpha - 1)² + (beta - 1)²)
Real kge(const Vector& x, const Vector& y);

/// kge squared
Real kge2(const Vector& x, const Vector& y);

/// Sum of squared errors
Real se(const Vector& x, const Vector& y);

/// sqrt(se / n)
Real rmse(const Vector& x, const Vector& y);

/// sum x * ln(y / x)² over indices where x > 0 and y > 0
Real logarithmic(const Vector& x, const Vector& y);

/**
 * @brief Quantile with linear interpolation between order statistics
 * 
 * frac = (n - 1) p + 1 on 1-based ranks, matching the default quantile of
 * common statistical packages. Empty input gives 0.
 */
Real quantile(std::vector<Real> data, Real p);

} // namespace metrics
} // namespace dsmash
