/**
 * @file signatures.cpp
 * @brief Hydrological signature metrics
 */

#include "dsmash/cost/signatures.hpp"
#include "dsmash/cost/metrics.hpp"
#include "dsmash/core/config.hpp"
#include <cmath>
#include <stdexcept>
#include <tuple>

namespace dsmash {
namespace signatures {

namespace {

Real relative_error(Real num, Real den) {
    return (den > 0.0) ? std::abs(num / den - 1.0) : 0.0;
}

/**
 * @brief Sums and peak positions over one event window
 *
 * Peak positions are 1-based; 0 means no positive value was seen.
 */
struct EventStats {
    Real sum_qo = 0.0;
    Real sum_qs = 0.0;
    Real sum_po = 0.0;
    Real max_qo = 0.0;
    Real max_qs = 0.0;
    Real max_po = 0.0;
    Index pos_qo = 0;
    Index pos_qs = 0;
    Index pos_po = 0;
};

EventStats event_stats(const Vector& po, const Vector& qo, const Vector& qs,
                       Index start, Index length) {
    EventStats e;
    for (Index j = start; j < start + length; ++j) {
        if (qo(j) < 0.0 || po(j) < 0.0) continue;

        e.sum_qo += qo(j);
        e.sum_qs += qs(j);
        e.sum_po += po(j);

        if (qo(j) > e.max_qo) { e.max_qo = qo(j); e.pos_qo = j + 1; }
        if (qs(j) > e.max_qs) { e.max_qs = qs(j); e.pos_qs = j + 1; }
        if (po(j) > e.max_po) { e.max_po = po(j); e.pos_po = j + 1; }
    }
    return e;
}

Real event_signature(const Vector& po, const Vector& qo, const Vector& qs,
                     const VectorI& mask_event, JobsFunction f) {
    const Index n_event = count_events(mask_event);
    if (n_event == 0) return 0.0;

    Real res = 0.0;
    for (Index label = 1; label <= n_event; ++label) {
        Index start = -1;
        Index length = 0;
        for (Index j = 0; j < mask_event.size(); ++j) {
            if (mask_event(j) != label) continue;
            if (start < 0) start = j;
            ++length;
        }
        if (start < 0) continue;

        const EventStats e = event_stats(po, qo, qs, start, length);

        Real num = 0.0;
        Real den = 0.0;
        switch (f) {
            case JobsFunction::Epf:
                num = e.max_qs;
                den = e.max_qo;
                break;
            case JobsFunction::Elt:
                num = static_cast<Real>(e.pos_qs - e.pos_po);
                den = static_cast<Real>(e.pos_qo - e.pos_po);
                break;
            case JobsFunction::Erc:
                if (e.sum_po > 0.0) {
                    num = e.sum_qs / e.sum_po;
                    den = e.sum_qo / e.sum_po;
                }
                break;
            default:
                break;
        }
        res += relative_error(num, den);
    }

    return res / static_cast<Real>(n_event);
}

Real continuous_signature(const Vector& po, const Vector& qo, const Vector& qs,
                          JobsFunction f) {
    Real num = 0.0;
    Real den = 0.0;

    switch (f) {
        case JobsFunction::Crc: {
            Real sum_qo = 0.0, sum_qs = 0.0, sum_po = 0.0;
            for (Index i = 0; i < qo.size(); ++i) {
                if (qo(i) < 0.0 || po(i) < 0.0) continue;
                sum_qo += qo(i);
                sum_qs += qs(i);
                sum_po += po(i);
            }
            if (sum_po > 0.0) {
                num = sum_qs / sum_po;
                den = sum_qo / sum_po;
            }
            break;
        }
        case JobsFunction::Cfp2:
            std::tie(num, den) = flow_percentile(qo, qs, 0.02);
            break;
        case JobsFunction::Cfp10:
            std::tie(num, den) = flow_percentile(qo, qs, 0.1);
            break;
        case JobsFunction::Cfp50:
            std::tie(num, den) = flow_percentile(qo, qs, 0.5);
            break;
        case JobsFunction::Cfp90:
            std::tie(num, den) = flow_percentile(qo, qs, 0.9);
            break;
        default:
            break;
    }

    return relative_error(num, den);
}

} // anonymous namespace

bool is_signature(JobsFunction f) {
    switch (f) {
        case JobsFunction::Crc:
        case JobsFunction::Cfp2:
        case JobsFunction::Cfp10:
        case JobsFunction::Cfp50:
        case JobsFunction::Cfp90:
        case JobsFunction::Epf:
        case JobsFunction::Elt:
        case JobsFunction::Erc:
            return true;
        default:
            return false;
    }
}

bool is_event_signature(JobsFunction f) {
    return f == JobsFunction::Epf || f == JobsFunction::Elt || f == JobsFunction::Erc;
}

bool uses_precipitation(JobsFunction f) {
    return f == JobsFunction::Crc || is_event_signature(f);
}

Real signature(const Vector& po, const Vector& qo, const Vector& qs,
               const VectorI& mask_event, JobsFunction f) {
    if (!is_signature(f)) {
        throw std::invalid_argument("Not a signature: " + config_io::to_string(f));
    }
    if (is_event_signature(f)) {
        return event_signature(po, qo, qs, mask_event, f);
    }
    return continuous_signature(po, qo, qs, f);
}

std::pair<Real, Real> flow_percentile(const Vector& qo, const Vector& qs, Real p) {
    std::vector<Real> pos_qo, pos_qs;
    pos_qo.reserve(qo.size());
    pos_qs.reserve(qs.size());

    for (Index i = 0; i < qo.size(); ++i) {
        if (qo(i) >= 0.0 && qs(i) >= 0.0) {
            pos_qo.push_back(qo(i));
            pos_qs.push_back(qs(i));
        }
    }

    return {metrics::quantile(pos_qs, p), metrics::quantile(pos_qo, p)};
}

Index count_events(const VectorI& mask_event) {
    for (Index i = mask_event.size() - 1; i >= 0; --i) {
        if (mask_event(i) > 0) return mask_event(i);
    }
    return 0;
}

} // namespace signatures
} // namespace dsmash
