/**
 * @file regularization.cpp
 * @brief Spatial and prior regularization
 */

#include "dsmash/cost/regularization.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace dsmash {
namespace regularization {

Real prior(const Vector& field, const Vector& background) {
    return (field - background).squaredNorm();
}

Real smoothing(const Grid& grid, const Vector& field, const Vector* background) {
    const Index nrow = grid.nrow();
    const Index ncol = grid.ncol();

    auto value = [&](Index row, Index col) {
        const Index k = grid.storage_index(row, col);
        return background ? field(k) - (*background)(k) : field(k);
    };

    Real res = 0.0;
    for (Index col = 0; col < ncol; ++col) {
        for (Index row = 0; row < nrow; ++row) {
            if (!grid.is_active(row, col)) continue;

            Index min_col = std::max<Index>(0, col - 1);
            Index max_col = std::min<Index>(ncol - 1, col + 1);
            Index min_row = std::max<Index>(0, row - 1);
            Index max_row = std::min<Index>(nrow - 1, row + 1);

            if (!grid.is_active(row, min_col)) min_col = col;
            if (!grid.is_active(row, max_col)) max_col = col;
            if (!grid.is_active(min_row, col)) min_row = row;
            if (!grid.is_active(max_row, col)) max_row = row;

            const Real c = value(row, col);
            const Real d_row = value(max_row, col) - 2.0 * c + value(min_row, col);
            const Real d_col = value(row, max_col) - 2.0 * c + value(row, min_col);
            res += d_row * d_row + d_col * d_col;
        }
    }
    return res;
}

Real distance_correlation(const Grid& grid, const Vector& field, const Vector& descriptor) {
    struct Pixel { Index row; Index col; Real value; };

    // Active cells in row-major order, grouped by class label
    int max_label = 0;
    for (Index row = 0; row < grid.nrow(); ++row) {
        for (Index col = 0; col < grid.ncol(); ++col) {
            if (!grid.is_active(row, col)) continue;
            max_label = std::max(max_label, static_cast<int>(descriptor(grid.storage_index(row, col))));
        }
    }

    std::vector<std::vector<Pixel>> classes(max_label + 1);
    for (Index row = 0; row < grid.nrow(); ++row) {
        for (Index col = 0; col < grid.ncol(); ++col) {
            if (!grid.is_active(row, col)) continue;
            const Index k = grid.storage_index(row, col);
            const int label = static_cast<int>(descriptor(k));
            if (label < 0) continue;
            classes[label].push_back({row, col, field(k)});
        }
    }

    Real penalty = 0.0;
    for (const auto& members : classes) {
        const Index n = static_cast<Index>(members.size());
        Real penalty_class = 0.0;

        #pragma omp parallel for reduction(+:penalty_class) schedule(dynamic, 16)
        for (Index i = 0; i < n; ++i) {
            for (Index j = i + 1; j < n; ++j) {
                const Real di = static_cast<Real>(members[j].row - members[i].row);
                const Real dj = static_cast<Real>(members[j].col - members[i].col);
                const Real dist = std::max(1.0, std::sqrt(di * di + dj * dj));
                const Real diff = members[i].value - members[j].value;
                penalty_class += diff * diff / (dist * dist);
            }
        }

        penalty += (n >= 1) ? penalty_class / static_cast<Real>(n) : penalty_class;
    }
    return penalty;
}

} // namespace regularization

// ============================================================================
// compute_jreg
// ============================================================================

namespace {

Real descriptor_penalty(const Grid& grid, const InputData& input, const Vector& field,
                        const std::vector<Index>& descriptor_indices) {
    Real res = 0.0;
    for (Index d : descriptor_indices) {
        if (d < 0 || d >= input.n_descriptors()) {
            throw std::invalid_argument("Descriptor index " + std::to_string(d) +
                " out of range for distance correlation");
        }
        res += regularization::distance_correlation(grid, field, input.descriptors.col(d));
    }
    return res;
}

template<typename Name, typename Fields>
Real field_terms(const Grid& grid, const InputData& input, JregFunction f, Real w,
                 const std::vector<Name>& names, const Fields& fields, const Fields& bgd,
                 const std::map<Name, std::vector<Index>>& reg_descriptors) {
    Real res = 0.0;
    for (auto name : names) {
        const Vector& m = fields.field(name);
        const Vector& m_bgd = bgd.field(name);

        switch (f) {
            case JregFunction::Prior:
                res += w * regularization::prior(m, m_bgd);
                break;
            case JregFunction::Smoothing:
                res += w * w * regularization::smoothing(grid, m, &m_bgd);
                break;
            case JregFunction::HardSmoothing:
                res += w * w * regularization::smoothing(grid, m);
                break;
            case JregFunction::DistanceCorrelation: {
                auto it = reg_descriptors.find(name);
                if (it != reg_descriptors.end()) {
                    res += w * descriptor_penalty(grid, input, m, it->second);
                }
                break;
            }
        }
    }
    return res;
}

} // anonymous namespace

Real compute_jreg(const Grid& grid, const CostConfig& cost, const InputData& input,
                  const Parameters& params, const Parameters& params_bgd,
                  const States& states, const States& states_bgd) {
    if (cost.jreg_weights.size() != cost.jreg_functions.size()) {
        throw std::invalid_argument("jreg_weights has " + std::to_string(cost.jreg_weights.size()) +
            " values, expected " + std::to_string(cost.jreg_functions.size()));
    }

    Real jreg = 0.0;

    for (Size i = 0; i < cost.jreg_functions.size(); ++i) {
        const JregFunction f = cost.jreg_functions[i];
        const Real w = cost.jreg_weights[i];

        jreg += field_terms(grid, input, f, w, cost.optim_parameters, params, params_bgd,
                            cost.reg_descriptors_parameters);
        jreg += field_terms(grid, input, f, w, cost.optim_states, states, states_bgd,
                            cost.reg_descriptors_states);
    }

    return jreg;
}

} // namespace dsmash
