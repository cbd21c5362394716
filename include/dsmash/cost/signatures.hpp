/**
 * @file signatures.hpp
 * @brief Hydrological signature metrics
 * 
 * A signature compares a scalar derived from the simulated series (num)
 * with the same scalar derived from the observed series (den), giving
 * |num / den - 1| when den > 0 and 0 otherwise.
 * 
 * Continuous signatures use the whole window. Event signatures average
 * over the flood events labelled 1..n_event in the event mask, each event
 * being one contiguous run of its label.
 */

#pragma once

#include "../core/types.hpp"
#include <utility>

namespace dsmash {
namespace signatures {

/// True for Crc, Cfp*, Epf, Elt, Erc
bool is_signature(JobsFunction f);

/// True for Epf, Elt, Erc
bool is_event_signature(JobsFunction f);

/// True for signatures reading catchment precipitation (Crc and events)
bool uses_precipitation(JobsFunction f);

/**
 * @brief Evaluate a signature metric
 * 
 * @param po Catchment mean precipitation
 * @param qo Observed discharge (negative = missing)
 * @param qs Simulated discharge
 * @param mask_event Event labels (used by event signatures only)
 * @param f Signature identifier
 * @throws std::invalid_argument if f is not a signature
 */
Real signature(const Vector& po, const Vector& qo, const Vector& qs,
               const VectorI& mask_event, JobsFunction f);

/**
 * @brief Quantiles of simulated (first) and observed (second) discharge
 * 
 * Only indices where both series are >= 0 are used.
 */
std::pair<Real, Real> flow_percentile(const Vector& qo, const Vector& qs, Real p);

/// Number of events: the last positive label of the mask
Index count_events(const VectorI& mask_event);

} // namespace signatures
} // namespace dsmash
