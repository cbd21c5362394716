/**
 * @file states.cpp
 * @brief State defaults and field access
 */

#include "dsmash/core/states.hpp"
#include <stdexcept>

namespace dsmash {

void States::initialize(Index n_storage) {
    for (auto name : all_states()) {
        field(name) = Vector::Constant(n_storage, default_states::value(name));
    }
}

void States::validate(Index n_storage) const {
    for (auto name : all_states()) {
        if (field(name).size() != n_storage) {
            throw std::invalid_argument("State " + to_string(name) + " has " +
                std::to_string(field(name).size()) + " values, expected " +
                std::to_string(n_storage));
        }
    }
}

Vector& States::field(StateName name) {
    return const_cast<Vector&>(static_cast<const States&>(*this).field(name));
}

const Vector& States::field(StateName name) const {
    switch (name) {
        case StateName::hi: return hi;
        case StateName::hp: return hp;
        case StateName::hft: return hft;
        case StateName::hst: return hst;
        case StateName::hlr: return hlr;
        case StateName::husl1: return husl1;
        case StateName::husl2: return husl2;
        case StateName::hlsl: return hlsl;
    }
    throw std::invalid_argument("Unknown state");
}

void States::set_uniform(StateName name, Real value) {
    field(name).setConstant(value);
}

void States::normalize(const Bounds& bounds) {
    for (auto name : all_states()) {
        const Bound& bd = bounds[name];
        field(name) = (field(name).array() - bd.lower) / bd.width();
    }
}

void States::denormalize(const Bounds& bounds) {
    for (auto name : all_states()) {
        const Bound& bd = bounds[name];
        field(name) = field(name).array() * bd.width() + bd.lower;
    }
}

namespace default_states {

Real value(StateName name) {
    switch (name) {
        case StateName::hi: return hi;
        case StateName::hp: return hp;
        case StateName::hft: return hft;
        case StateName::hst: return hst;
        case StateName::hlr: return hlr;
        case StateName::husl1: return husl1;
        case StateName::husl2: return husl2;
        case StateName::hlsl: return hlsl;
    }
    throw std::invalid_argument("Unknown state");
}

} // namespace default_states

const std::array<StateName, N_STATES>& all_states() {
    static const std::array<StateName, N_STATES> names = {
        StateName::hi, StateName::hp, StateName::hft, StateName::hst,
        StateName::hlr, StateName::husl1, StateName::husl2, StateName::hlsl,
    };
    return names;
}

std::string to_string(StateName name) {
    switch (name) {
        case StateName::hi: return "hi";
        case StateName::hp: return "hp";
        case StateName::hft: return "hft";
        case StateName::hst: return "hst";
        case StateName::hlr: return "hlr";
        case StateName::husl1: return "husl1";
        case StateName::husl2: return "husl2";
        case StateName::hlsl: return "hlsl";
        default: return "unknown";
    }
}

StateName state_from_string(const std::string& s) {
    for (auto name : all_states()) {
        if (to_string(name) == s) return name;
    }
    throw std::invalid_argument("Unknown state: " + s);
}

} // namespace dsmash
