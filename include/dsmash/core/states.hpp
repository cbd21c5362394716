/**
 * @file states.hpp
 * @brief Per-cell reservoir states for dSMASH
 * 
 * States are relative fill levels in (0, 1), except the routing store hlr
 * which is a depth [mm]. They are updated in place by the cell operators
 * and must be reset before every independent evaluation.
 */

#pragma once

#include "types.hpp"
#include "parameters.hpp"

namespace dsmash {

/**
 * @brief Per-cell state fields
 */
class States {
public:
    Vector hi;                      ///< Interception store level [-]
    Vector hp;                      ///< Production store level [-]
    Vector hft;                     ///< Fast transfer store level [-]
    Vector hst;                     ///< Slow transfer store level [-]
    Vector hlr;                     ///< Routing store depth [mm]
    Vector husl1;                   ///< Upper soil layer 1 level [-]
    Vector husl2;                   ///< Upper soil layer 2 level [-]
    Vector hlsl;                    ///< Lower soil layer level [-]

    /// Allocate every field with its default value
    void initialize(Index n_storage);

    /**
     * @brief Check that every field has n_storage values
     * @throws std::invalid_argument on mismatch
     */
    void validate(Index n_storage) const;

    Index size() const { return hp.size(); }

    Vector& field(StateName name);
    const Vector& field(StateName name) const;

    void set_uniform(StateName name, Real value);

    void normalize(const Bounds& bounds);
    void denormalize(const Bounds& bounds);
};

namespace default_states {
    constexpr Real hi = 0.01;
    constexpr Real hp = 0.01;
    constexpr Real hft = 0.01;
    constexpr Real hst = 0.01;
    constexpr Real hlr = 1e-6;
    constexpr Real husl1 = 0.01;
    constexpr Real husl2 = 0.01;
    constexpr Real hlsl = 0.01;

    Real value(StateName name);
}

const std::array<StateName, N_STATES>& all_states();

std::string to_string(StateName name);
StateName state_from_string(const std::string& s);

} // namespace dsmash
