/**
 * @file metrics.cpp
 * @brief Goodness-of-fit metrics
 */

#include "dsmash/cost/metrics.hpp"
#include <algorithm>
#include <cmath>

namespace dsmash {
namespace metrics {

namespace {

struct Moments {
    Index n = 0;
    Real sum_x = 0.0;
    Real sum_y = 0.0;
    Real sum_xx = 0.0;
    Real sum_yy = 0.0;
    Real sum_xy = 0.0;
};

Moments masked_moments(const Vector& x, const Vector& y) {
    Moments m;
    for (Index i = 0; i < x.size(); ++i) {
        if (x(i) < 0.0) continue;
        ++m.n;
        m.sum_x += x(i);
        m.sum_y += y(i);
        m.sum_xx += x(i) * x(i);
        m.sum_yy += y(i) * y(i);
        m.sum_xy += x(i) * y(i);
    }
    return m;
}

} // anonymous namespace

Real nse(const Vector& x, const Vector& y) {
    const Moments m = masked_moments(x, y);
    if (m.n == 0) return 0.0;

    const Real mean_x = m.sum_x / m.n;
    const Real num = m.sum_xx - 2.0 * m.sum_xy + m.sum_yy;
    const Real den = m.sum_xx - m.n * mean_x * mean_x;
    return num / den;
}

KgeComponents kge_components(const Vector& x, const Vector& y) {
    KgeComponents c;
    const Moments m = masked_moments(x, y);
    if (m.n == 0) return c;

    const Real mean_x = m.sum_x / m.n;
    const Real mean_y = m.sum_y / m.n;
    const Real var_x = m.sum_xx / m.n - mean_x * mean_x;
    const Real var_y = m.sum_yy / m.n - mean_y * mean_y;
    const Real cov = m.sum_xy / m.n - mean_x * mean_y;

    c.r = (cov / std::sqrt(var_x)) / std::sqrt(var_y);
    c.alpha = std::sqrt(var_y) / std::sqrt(var_x);
    c.beta = mean_y / mean_x;
    return c;
}

Real kge(const Vector& x, const Vector& y) {
    if (masked_moments(x, y).n == 0) return 0.0;

    const KgeComponents c = kge_components(x, y);
    return std::sqrt((c.r - 1.0) * (c.r - 1.0) +
                     (c.alpha - 1.0) * (c.alpha - 1.0) +
                     (c.beta - 1.0) * (c.beta - 1.0));
}

Real kge2(const Vector& x, const Vector& y) {
    const Real k = kge(x, y);
    return k * k;
}

Real se(const Vector& x, const Vector& y) {
    Real res = 0.0;
    for (Index i = 0; i < x.size(); ++i) {
        if (x(i) < 0.0) continue;
        res += (x(i) - y(i)) * (x(i) - y(i));
    }
    return res;
}

Real rmse(const Vector& x, const Vector& y) {
    const Index n = (x.array() >= 0.0).count();
    if (n == 0) return 0.0;
    return std::sqrt(se(x, y) / n);
}

Real logarithmic(const Vector& x, const Vector& y) {
    Real res = 0.0;
    for (Index i = 0; i < x.size(); ++i) {
        if (x(i) > 0.0 && y(i) > 0.0) {
            const Real lr = std::log(y(i) / x(i));
            res += x(i) * lr * lr;
        }
    }
    return res;
}

Real quantile(std::vector<Real> data, Real p) {
    const Index n = static_cast<Index>(data.size());
    if (n == 0) return 0.0;
    if (n == 1) return data[0];

    std::sort(data.begin(), data.end());

    const Real frac = (n - 1) * p + 1.0;
    if (frac <= 1.0) return data.front();
    if (frac >= static_cast<Real>(n)) return data.back();

    // 1-based rank floor(frac) and its successor
    const Index lo = static_cast<Index>(frac);
    const Real w = frac - lo;
    return data[lo - 1] + w * (data[lo] - data[lo - 1]);
}

} // namespace metrics
} // namespace dsmash
