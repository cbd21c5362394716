/**
 * @file structure.cpp
 * @brief Structure descriptors and the local runoff pipeline
 */

#include "dsmash/physics/structure.hpp"
#include "dsmash/physics/operators.hpp"
#include <stdexcept>
#include <algorithm>

namespace dsmash {

namespace {

using P = ParameterName;
using S = StateName;

StructureDescriptor make_gr_a() {
    StructureDescriptor st;
    st.type = StructureType::GrA;
    st.name = "gr_a";
    st.interception = InterceptionKind::Instant;
    st.exchange = true;
    st.direct_path = true;
    st.fast_fraction = 0.9;
    st.direct_fraction = 0.1;
    st.parameters = {P::cp, P::beta, P::cft, P::exc, P::lr};
    st.states = {S::hp, S::hft, S::hlr};
    return st;
}

StructureDescriptor make_gr_b() {
    StructureDescriptor st = make_gr_a();
    st.type = StructureType::GrB;
    st.name = "gr_b";
    st.interception = InterceptionKind::Store;
    st.parameters = {P::ci, P::cp, P::beta, P::cft, P::exc, P::lr};
    st.states = {S::hi, S::hp, S::hft, S::hlr};
    return st;
}

StructureDescriptor make_gr_c() {
    StructureDescriptor st = make_gr_b();
    st.type = StructureType::GrC;
    st.name = "gr_c";
    st.slow_transfer = true;
    st.fast_fraction = 0.9 * 0.6;
    st.slow_fraction = 0.9 * 0.4;
    st.direct_fraction = 0.1;
    st.parameters = {P::ci, P::cp, P::beta, P::cft, P::cst, P::exc, P::lr};
    st.states = {S::hi, S::hp, S::hft, S::hst, S::hlr};
    return st;
}

StructureDescriptor make_gr_d() {
    StructureDescriptor st;
    st.type = StructureType::GrD;
    st.name = "gr_d";
    st.interception = InterceptionKind::Instant;
    st.fast_fraction = 1.0;
    st.parameters = {P::cp, P::beta, P::cft, P::lr};
    st.states = {S::hp, S::hft, S::hlr};
    return st;
}

StructureDescriptor make_vic_a() {
    StructureDescriptor st;
    st.type = StructureType::VicA;
    st.name = "vic_a";
    st.family = ProcessFamily::Vic;
    st.fast_fraction = 0.0;
    st.parameters = {P::b, P::cusl1, P::cusl2, P::clsl, P::ks, P::ds, P::dsm, P::ws, P::lr};
    st.states = {S::husl1, S::husl2, S::hlsl, S::hlr};
    return st;
}

Real gr_runoff(const StructureDescriptor& st, Real prcp, Real pet,
               const Parameters& p, States& s, Index k) {
    Real pr = 0.0;
    Real perc = 0.0;
    Real l = 0.0;

    if (prcp >= 0.0 && pet >= 0.0) {
        operators::InterceptionFlux ic;
        if (st.interception == InterceptionKind::Store) {
            ic = operators::interception(prcp, pet, p.ci(k), s.hi(k));
        } else {
            ic = operators::instant_interception(prcp, pet);
        }

        const Real en = pet - ic.ei;
        const auto prod = operators::production(ic.pn, en, p.cp(k), p.beta(k), s.hp(k));
        pr = prod.pr;
        perc = prod.perc;

        if (st.exchange) {
            l = operators::exchange(p.exc(k), s.hft(k));
        }
    }

    const Real runoff = pr + perc;
    const Real n = st.transfer_exponent;

    Real qt = operators::transfer(n, prcp, st.fast_fraction * runoff + l, p.cft(k), s.hft(k));

    if (st.slow_transfer) {
        qt += operators::transfer(n, prcp, st.slow_fraction * runoff, p.cst(k), s.hst(k));
    }

    if (st.direct_path) {
        qt += std::max(0.0, st.direct_fraction * runoff + l);
    }

    return qt;
}

Real vic_runoff(const StructureDescriptor& st, Real prcp, Real pet,
                const Parameters& p, States& s, Index k) {
    Real runoff = 0.0;

    if (prcp >= 0.0 && pet >= 0.0) {
        runoff = operators::vic_infiltration(prcp, p.cusl1(k), p.cusl2(k), p.b(k),
                                             s.husl1(k), s.husl2(k));
        operators::vic_vertical_transfer(pet, p.cusl1(k), p.cusl2(k), p.clsl(k), p.ks(k),
                                         s.husl1(k), s.husl2(k), s.hlsl(k));
    }

    const Real qi = operators::vic_interflow(st.transfer_exponent, p.cusl2(k), s.husl2(k));
    const Real qb = operators::vic_baseflow(p.clsl(k), p.ds(k), p.dsm(k), p.ws(k), s.hlsl(k));

    return runoff + qi + qb;
}

} // anonymous namespace

// ============================================================================
// StructureDescriptor
// ============================================================================

bool StructureDescriptor::uses(ParameterName name) const {
    return std::find(parameters.begin(), parameters.end(), name) != parameters.end();
}

bool StructureDescriptor::uses(StateName name) const {
    return std::find(states.begin(), states.end(), name) != states.end();
}

const StructureDescriptor& structure_descriptor(StructureType type) {
    static const StructureDescriptor gr_a = make_gr_a();
    static const StructureDescriptor gr_b = make_gr_b();
    static const StructureDescriptor gr_c = make_gr_c();
    static const StructureDescriptor gr_d = make_gr_d();
    static const StructureDescriptor vic_a = make_vic_a();

    switch (type) {
        case StructureType::GrA: return gr_a;
        case StructureType::GrB: return gr_b;
        case StructureType::GrC: return gr_c;
        case StructureType::GrD: return gr_d;
        case StructureType::VicA: return vic_a;
    }
    throw std::invalid_argument("Unknown structure id: " +
        std::to_string(static_cast<int>(type)));
}

// ============================================================================
// Pipeline
// ============================================================================

Real local_runoff(const StructureDescriptor& structure, Real prcp, Real pet,
                  const Parameters& params, States& states, Index k) {
    switch (structure.family) {
        case ProcessFamily::Gr:
            return gr_runoff(structure, prcp, pet, params, states, k);
        case ProcessFamily::Vic:
            return vic_runoff(structure, prcp, pet, params, states, k);
    }
    throw std::invalid_argument("Unknown process family for structure " + structure.name);
}

} // namespace dsmash
