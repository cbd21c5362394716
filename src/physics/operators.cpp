/**
 * @file operators.cpp
 * @brief Cell-level hydrological operators
 */

#include "dsmash/physics/operators.hpp"
#include <cmath>
#include <algorithm>

namespace dsmash {
namespace operators {

using constants::STORE_FLOOR;
using constants::STORE_CEIL;

// ============================================================================
// GR Operators
// ============================================================================

InterceptionFlux interception(Real prcp, Real pet, Real ci, Real& hi) {
    InterceptionFlux flux;
    flux.ei = std::min(pet, prcp + hi * ci);
    flux.pn = std::max(0.0, prcp - ci * (1.0 - hi) - flux.ei);
    hi += (prcp - flux.ei - flux.pn) / ci;
    return flux;
}

InterceptionFlux instant_interception(Real prcp, Real pet) {
    InterceptionFlux flux;
    flux.ei = std::min(pet, prcp);
    flux.pn = std::max(0.0, prcp - flux.ei);
    return flux;
}

ProductionFlux production(Real pn, Real en, Real cp, Real beta, Real& hp) {
    ProductionFlux flux;
    const Real inv_cp = 1.0 / cp;

    const Real tp = std::tanh(pn * inv_cp);
    const Real ps = cp * (1.0 - hp * hp) * tp / (1.0 + hp * tp);

    const Real te = std::tanh(en * inv_cp);
    const Real es = hp * cp * (2.0 - hp) * te / (1.0 + (1.0 - hp) * te);

    const Real hp_imd = hp + (ps - es) * inv_cp;

    if (pn > 0.0) {
        flux.pr = pn - (hp_imd - hp) * cp;
    }

    const Real ratio = hp_imd / beta;
    flux.perc = hp_imd * cp * (1.0 - std::pow(1.0 + ratio * ratio * ratio * ratio, -0.25));

    hp = hp_imd - flux.perc * inv_cp;
    return flux;
}

Real exchange(Real exc, Real hft) {
    return exc * std::pow(hft, constants::EXCHANGE_EXPONENT);
}

Real transfer(Real n, Real prcp, Real pr, Real ct, Real& ht) {
    const Real nm1 = n - 1.0;
    const Real d = 1.0 / nm1;

    Real pr_imd = pr;
    if (prcp < 0.0) {
        pr_imd = std::pow(std::pow(ht * ct, -nm1) - std::pow(ct, -nm1), -d) - ht * ct;
    }

    const Real ht_imd = std::max(STORE_FLOOR, ht + pr_imd / ct);

    ht = std::pow(std::pow(ht_imd * ct, -nm1) + std::pow(ct, -nm1), -d) / ct;

    return (ht_imd - ht) * ct;
}

// ============================================================================
// Routing
// ============================================================================

Real linear_routing(Real dt, Real qup, Real lr, Real& hlr) {
    const Real hr_imd = hlr + qup;
    hlr = hr_imd * std::exp(-dt / (lr * constants::LAG_UNIT));
    return hr_imd - hlr;
}

// ============================================================================
// VIC Operators
// ============================================================================

Real vic_infiltration(Real prcp, Real cusl1, Real cusl2, Real b,
                      Real& husl1, Real& husl2) {
    if (prcp <= 0.0) return 0.0;

    const Real cap = cusl1 + cusl2;
    const Real w = husl1 * cusl1 + husl2 * cusl2;
    const Real bp1 = 1.0 + b;
    const Real wmax = cap * bp1;

    // Point capacity currently filled on the infiltration curve
    const Real sat = std::clamp(1.0 - w / cap, 0.0, 1.0);
    const Real i0 = wmax * (1.0 - std::pow(sat, 1.0 / bp1));

    Real infiltration;
    if (prcp + i0 >= wmax) {
        infiltration = cap - w;
    } else {
        infiltration = (cap - w) - cap * std::pow(1.0 - (i0 + prcp) / wmax, bp1);
    }
    infiltration = std::clamp(infiltration, 0.0, prcp);

    const Real to_l1 = std::min(infiltration, (1.0 - husl1) * cusl1);
    const Real to_l2 = infiltration - to_l1;

    husl1 = std::clamp(husl1 + to_l1 / cusl1, STORE_FLOOR, STORE_CEIL);
    husl2 = std::clamp(husl2 + to_l2 / cusl2, STORE_FLOOR, STORE_CEIL);

    return prcp - infiltration;
}

void vic_vertical_transfer(Real pet, Real cusl1, Real cusl2, Real clsl, Real ks,
                           Real& husl1, Real& husl2, Real& hlsl) {
    // Evaporation: layer 1 first, remaining demand limited by layer 2 wetness
    const Real e1 = std::clamp(pet, 0.0, husl1 * cusl1);
    husl1 = std::max(STORE_FLOOR, husl1 - e1 / cusl1);

    const Real e2 = std::clamp((pet - e1) * husl2, 0.0, husl2 * cusl2);
    husl2 = std::max(STORE_FLOOR, husl2 - e2 / cusl2);

    // Gravity drainage, limited by supply and by receiver space
    const Real d12 = std::max(0.0, std::min({ks * husl1 * husl1, husl1 * cusl1,
                                             (1.0 - husl2) * cusl2}));
    husl1 = std::max(STORE_FLOOR, husl1 - d12 / cusl1);
    husl2 = husl2 + d12 / cusl2;

    const Real d2l = std::max(0.0, std::min({ks * husl2 * husl2, husl2 * cusl2,
                                             (1.0 - hlsl) * clsl}));
    husl2 = std::max(STORE_FLOOR, husl2 - d2l / cusl2);
    hlsl = std::max(STORE_FLOOR, hlsl + d2l / clsl);
}

Real vic_interflow(Real n, Real cusl2, Real& husl2) {
    return transfer(n, 0.0, 0.0, cusl2, husl2);
}

Real vic_baseflow(Real clsl, Real ds, Real dsm, Real ws, Real& hlsl) {
    Real rate = dsm * ds / ws * hlsl;
    if (hlsl > ws) {
        const Real excess = (hlsl - ws) / (1.0 - ws);
        rate += dsm * (1.0 - ds / ws) * excess * excess;
    }

    const Real qb = std::min(rate * clsl, hlsl * clsl);
    const Real h_old = hlsl;
    hlsl = std::max(STORE_FLOOR, hlsl - qb / clsl);

    return (h_old - hlsl) * clsl;
}

} // namespace operators
} // namespace dsmash
