/**
 * @file mapping.cpp
 * @brief Hyper-parameter mapping
 */

#include "dsmash/calibration/mapping.hpp"
#include <cmath>
#include <algorithm>
#include <stdexcept>

namespace dsmash {

namespace {

Real active_mean(const Grid& grid, const Vector& field) {
    Real sum = 0.0;
    Index n = 0;
    for (Index k = 0; k < field.size(); ++k) {
        const auto& c = grid.storage_cell(k);
        if (!grid.is_active(c.row, c.col)) continue;
        sum += field(k);
        ++n;
    }
    return n > 0 ? sum / n : 0.0;
}

} // anonymous namespace

Real sigmoid_bound(Real v, const Bound& bound) {
    return bound.width() / (1.0 + std::exp(-v)) + bound.lower;
}

Real logit_bound(Real p, const Bound& bound) {
    constexpr Real eps = 1e-12;
    const Real r = std::clamp((p - bound.lower) / bound.width(), eps, 1.0 - eps);
    return std::log(r / (1.0 - r));
}

// ============================================================================
// HyperParameters
// ============================================================================

HyperParameters::HyperParameters(MappingType mapping, Index n_descriptors, const CostConfig& cost)
    : mapping_(mapping)
    , n_descriptors_(n_descriptors)
{
    if (mapping != MappingType::HyperLinear && mapping != MappingType::HyperPolynomial) {
        throw std::invalid_argument("HyperParameters require a hyper mapping, got " +
            config_io::to_string(mapping));
    }

    Vector zero = Vector::Zero(n_coefficients());
    if (mapping_ == MappingType::HyperPolynomial) {
        for (Index d = 0; d < n_descriptors_; ++d) {
            zero(2 + 2 * d) = 1.0;
        }
    }

    for (auto name : cost.optim_parameters) parameters[name] = zero;
    for (auto name : cost.optim_states) states[name] = zero;
}

Index HyperParameters::n_coefficients() const {
    return mapping_ == MappingType::HyperPolynomial ? 1 + 2 * n_descriptors_
                                                    : 1 + n_descriptors_;
}

void HyperParameters::set_uniform(const Grid& grid, const Parameters& params,
                                  const States& st, const Bounds& bounds) {
    for (auto& [name, coef] : parameters) {
        coef.tail(coef.size() - 1).setZero();
        coef(0) = logit_bound(active_mean(grid, params.field(name)), bounds[name]);
    }
    for (auto& [name, coef] : states) {
        coef.tail(coef.size() - 1).setZero();
        coef(0) = logit_bound(active_mean(grid, st.field(name)), bounds[name]);
    }
    if (mapping_ == MappingType::HyperPolynomial) {
        for (auto& [name, coef] : parameters)
            for (Index d = 0; d < n_descriptors_; ++d) coef(2 + 2 * d) = 1.0;
        for (auto& [name, coef] : states)
            for (Index d = 0; d < n_descriptors_; ++d) coef(2 + 2 * d) = 1.0;
    }
}

Vector HyperParameters::map_field(const Vector& coef, const Matrix& descriptors,
                                  const Bound& bound) const {
    const Index n = descriptors.rows();
    Vector out(n);

    for (Index k = 0; k < n; ++k) {
        Real v = coef(0);
        for (Index d = 0; d < n_descriptors_; ++d) {
            if (mapping_ == MappingType::HyperPolynomial) {
                v += coef(1 + 2 * d) * std::pow(descriptors(k, d), coef(2 + 2 * d));
            } else {
                v += coef(1 + d) * descriptors(k, d);
            }
        }
        out(k) = sigmoid_bound(v, bound);
    }
    return out;
}

void HyperParameters::to_fields(const Matrix& descriptors, const Bounds& bounds,
                                Parameters& params, States& st) const {
    if (descriptors.cols() != n_descriptors_) {
        throw std::invalid_argument("Hyper mapping built for " + std::to_string(n_descriptors_) +
            " descriptors, got " + std::to_string(descriptors.cols()));
    }
    for (const auto& [name, coef] : parameters) {
        params.field(name) = map_field(coef, descriptors, bounds[name]);
    }
    for (const auto& [name, coef] : states) {
        st.field(name) = map_field(coef, descriptors, bounds[name]);
    }
}

} // namespace dsmash
