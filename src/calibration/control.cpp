/**
 * @file control.cpp
 * @brief Control vector packing
 */

#include "dsmash/calibration/control.hpp"
#include <stdexcept>

namespace dsmash {

Control::Control(const Grid& grid, const Config& config, const InputData& input)
    : grid_(grid)
    , config_(config)
{
    for (Index k = 0; k < grid_.n_storage(); ++k) {
        const auto& c = grid_.storage_cell(k);
        if (grid_.is_active(c.row, c.col)) active_.push_back(k);
    }

    const MappingType m = config_.cost.mapping;
    if (m == MappingType::HyperLinear || m == MappingType::HyperPolynomial) {
        if (input.n_descriptors() == 0) {
            throw std::invalid_argument("Hyper mapping requires spatial descriptors");
        }
        descriptors_ = input.normalized_descriptors(grid_);
    }
}

Index Control::n_fields() const {
    return static_cast<Index>(config_.cost.optim_parameters.size() +
                              config_.cost.optim_states.size());
}

Index Control::values_per_field() const {
    switch (config_.cost.mapping) {
        case MappingType::Uniform: return 1;
        case MappingType::Distributed: return static_cast<Index>(active_.size());
        case MappingType::HyperLinear: return 1 + descriptors_.cols();
        case MappingType::HyperPolynomial: return 1 + 2 * descriptors_.cols();
    }
    return 0;
}

Index Control::size() const {
    return n_fields() * values_per_field();
}

Real Control::to_control(Real value, const Bound& bound) const {
    return config_.cost.denormalize_forward ? (value - bound.lower) / bound.width() : value;
}

Real Control::from_control(Real value, const Bound& bound) const {
    return config_.cost.denormalize_forward ? value * bound.width() + bound.lower : value;
}

Vector Control::pack(const Parameters& params, const States& states) const {
    const CostConfig& cost = config_.cost;
    const Index per_field = values_per_field();
    Vector x(size());

    if (cost.mapping == MappingType::HyperLinear || cost.mapping == MappingType::HyperPolynomial) {
        HyperParameters hyper(cost.mapping, descriptors_.cols(), cost);
        hyper.set_uniform(grid_, params, states, config_.bounds);

        Index offset = 0;
        for (auto name : cost.optim_parameters) {
            x.segment(offset, per_field) = hyper.parameters.at(name);
            offset += per_field;
        }
        for (auto name : cost.optim_states) {
            x.segment(offset, per_field) = hyper.states.at(name);
            offset += per_field;
        }
        return x;
    }

    auto pack_field = [&](const Vector& field, const Bound& bound, Index offset) {
        if (cost.mapping == MappingType::Uniform) {
            Real sum = 0.0;
            for (Index k : active_) sum += field(k);
            const Real mean = active_.empty() ? 0.0 : sum / static_cast<Real>(active_.size());
            x(offset) = to_control(mean, bound);
        } else {
            for (Size i = 0; i < active_.size(); ++i) {
                x(offset + static_cast<Index>(i)) = to_control(field(active_[i]), bound);
            }
        }
    };

    Index offset = 0;
    for (auto name : cost.optim_parameters) {
        pack_field(params.field(name), config_.bounds[name], offset);
        offset += per_field;
    }
    for (auto name : cost.optim_states) {
        pack_field(states.field(name), config_.bounds[name], offset);
        offset += per_field;
    }
    return x;
}

void Control::unpack(const Vector& x, Parameters& params, States& states) const {
    if (x.size() != size()) {
        throw std::invalid_argument("Control vector has " + std::to_string(x.size()) +
            " values, expected " + std::to_string(size()));
    }

    const CostConfig& cost = config_.cost;
    const Index per_field = values_per_field();

    if (cost.mapping == MappingType::HyperLinear || cost.mapping == MappingType::HyperPolynomial) {
        HyperParameters hyper(cost.mapping, descriptors_.cols(), cost);

        Index offset = 0;
        for (auto name : cost.optim_parameters) {
            hyper.parameters[name] = x.segment(offset, per_field);
            offset += per_field;
        }
        for (auto name : cost.optim_states) {
            hyper.states[name] = x.segment(offset, per_field);
            offset += per_field;
        }
        hyper.to_fields(descriptors_, config_.bounds, params, states);
        return;
    }

    auto unpack_field = [&](Vector& field, const Bound& bound, Index offset) {
        if (cost.mapping == MappingType::Uniform) {
            const Real value = from_control(x(offset), bound);
            for (Index k : active_) field(k) = value;
        } else {
            for (Size i = 0; i < active_.size(); ++i) {
                field(active_[i]) = from_control(x(offset + static_cast<Index>(i)), bound);
            }
        }
    };

    Index offset = 0;
    for (auto name : cost.optim_parameters) {
        unpack_field(params.field(name), config_.bounds[name], offset);
        offset += per_field;
    }
    for (auto name : cost.optim_states) {
        unpack_field(states.field(name), config_.bounds[name], offset);
        offset += per_field;
    }
}

std::vector<std::string> Control::names() const {
    const CostConfig& cost = config_.cost;
    std::vector<std::string> labels;
    labels.reserve(size());

    auto add_field = [&](const std::string& name) {
        switch (cost.mapping) {
            case MappingType::Uniform:
                labels.push_back(name);
                break;
            case MappingType::Distributed:
                for (Index k : active_) labels.push_back(name + "[" + std::to_string(k) + "]");
                break;
            case MappingType::HyperLinear:
                labels.push_back(name + ":a0");
                for (Index d = 0; d < descriptors_.cols(); ++d)
                    labels.push_back(name + ":a" + std::to_string(d + 1));
                break;
            case MappingType::HyperPolynomial:
                labels.push_back(name + ":a0");
                for (Index d = 0; d < descriptors_.cols(); ++d) {
                    labels.push_back(name + ":a" + std::to_string(d + 1));
                    labels.push_back(name + ":b" + std::to_string(d + 1));
                }
                break;
        }
    };

    for (auto name : cost.optim_parameters) add_field(dsmash::to_string(name));
    for (auto name : cost.optim_states) add_field(dsmash::to_string(name));
    return labels;
}

} // namespace dsmash
