/**
 * @file parameters.cpp
 * @brief Parameter defaults, bounds and field access
 */

#include "dsmash/core/parameters.hpp"
#include <stdexcept>

namespace dsmash {

// ============================================================================
// Bounds
// ============================================================================

Bounds Bounds::defaults() {
    Bounds bounds;

    bounds[ParameterName::ci] = {1e-6, 1e2};
    bounds[ParameterName::cp] = {1e-6, 1e3};
    bounds[ParameterName::beta] = {1e-6, 1e3};
    bounds[ParameterName::cft] = {1e-6, 1e3};
    bounds[ParameterName::cst] = {1e-6, 1e4};
    bounds[ParameterName::alpha] = {1e-6, 0.999999};
    bounds[ParameterName::exc] = {-50.0, 50.0};
    bounds[ParameterName::lr] = {1e-6, 1e3};
    bounds[ParameterName::b] = {1e-3, 10.0};
    bounds[ParameterName::cusl1] = {1e-6, 1e3};
    bounds[ParameterName::cusl2] = {1e-6, 2e3};
    bounds[ParameterName::clsl] = {1e-6, 2e4};
    bounds[ParameterName::ks] = {1e-6, 1e4};
    bounds[ParameterName::ds] = {1e-6, 0.999999};
    bounds[ParameterName::dsm] = {1e-6, 0.999999};
    bounds[ParameterName::ws] = {1e-6, 0.999999};

    for (auto& s : bounds.states) {
        s = {1e-6, 0.999999};
    }
    bounds[StateName::hlr] = {1e-6, 1e3};

    return bounds;
}

// ============================================================================
// Parameters
// ============================================================================

void Parameters::initialize(Index n_storage) {
    for (auto name : all_parameters()) {
        field(name) = Vector::Constant(n_storage, default_params::value(name));
    }
}

void Parameters::validate(Index n_storage) const {
    for (auto name : all_parameters()) {
        if (field(name).size() != n_storage) {
            throw std::invalid_argument("Parameter " + to_string(name) + " has " +
                std::to_string(field(name).size()) + " values, expected " +
                std::to_string(n_storage));
        }
    }
}

Vector& Parameters::field(ParameterName name) {
    return const_cast<Vector&>(static_cast<const Parameters&>(*this).field(name));
}

const Vector& Parameters::field(ParameterName name) const {
    switch (name) {
        case ParameterName::ci: return ci;
        case ParameterName::cp: return cp;
        case ParameterName::beta: return beta;
        case ParameterName::cft: return cft;
        case ParameterName::cst: return cst;
        case ParameterName::alpha: return alpha;
        case ParameterName::exc: return exc;
        case ParameterName::lr: return lr;
        case ParameterName::b: return b;
        case ParameterName::cusl1: return cusl1;
        case ParameterName::cusl2: return cusl2;
        case ParameterName::clsl: return clsl;
        case ParameterName::ks: return ks;
        case ParameterName::ds: return ds;
        case ParameterName::dsm: return dsm;
        case ParameterName::ws: return ws;
    }
    throw std::invalid_argument("Unknown parameter");
}

void Parameters::set_uniform(ParameterName name, Real value) {
    field(name).setConstant(value);
}

void Parameters::normalize(const Bounds& bounds) {
    for (auto name : all_parameters()) {
        const Bound& bd = bounds[name];
        field(name) = (field(name).array() - bd.lower) / bd.width();
    }
}

void Parameters::denormalize(const Bounds& bounds) {
    for (auto name : all_parameters()) {
        const Bound& bd = bounds[name];
        field(name) = field(name).array() * bd.width() + bd.lower;
    }
}

// ============================================================================
// Defaults and Names
// ============================================================================

namespace default_params {

Real value(ParameterName name) {
    switch (name) {
        case ParameterName::ci: return ci;
        case ParameterName::cp: return cp;
        case ParameterName::beta: return beta;
        case ParameterName::cft: return cft;
        case ParameterName::cst: return cst;
        case ParameterName::alpha: return alpha;
        case ParameterName::exc: return exc;
        case ParameterName::lr: return lr;
        case ParameterName::b: return b;
        case ParameterName::cusl1: return cusl1;
        case ParameterName::cusl2: return cusl2;
        case ParameterName::clsl: return clsl;
        case ParameterName::ks: return ks;
        case ParameterName::ds: return ds;
        case ParameterName::dsm: return dsm;
        case ParameterName::ws: return ws;
    }
    throw std::invalid_argument("Unknown parameter");
}

} // namespace default_params

const std::array<ParameterName, N_PARAMETERS>& all_parameters() {
    static const std::array<ParameterName, N_PARAMETERS> names = {
        ParameterName::ci, ParameterName::cp, ParameterName::beta,
        ParameterName::cft, ParameterName::cst, ParameterName::alpha,
        ParameterName::exc, ParameterName::lr, ParameterName::b,
        ParameterName::cusl1, ParameterName::cusl2, ParameterName::clsl,
        ParameterName::ks, ParameterName::ds, ParameterName::dsm,
        ParameterName::ws,
    };
    return names;
}

std::string to_string(ParameterName name) {
    switch (name) {
        case ParameterName::ci: return "ci";
        case ParameterName::cp: return "cp";
        case ParameterName::beta: return "beta";
        case ParameterName::cft: return "cft";
        case ParameterName::cst: return "cst";
        case ParameterName::alpha: return "alpha";
        case ParameterName::exc: return "exc";
        case ParameterName::lr: return "lr";
        case ParameterName::b: return "b";
        case ParameterName::cusl1: return "cusl1";
        case ParameterName::cusl2: return "cusl2";
        case ParameterName::clsl: return "clsl";
        case ParameterName::ks: return "ks";
        case ParameterName::ds: return "ds";
        case ParameterName::dsm: return "dsm";
        case ParameterName::ws: return "ws";
        default: return "unknown";
    }
}

ParameterName parameter_from_string(const std::string& s) {
    for (auto name : all_parameters()) {
        if (to_string(name) == s) return name;
    }
    throw std::invalid_argument("Unknown parameter: " + s);
}

} // namespace dsmash
