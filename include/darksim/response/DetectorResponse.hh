#pragma once
#include <optional>

#include "darksim/physics/Sampler.hh"

namespace darksim {

class EfficiencyCurve;

namespace response {

// Flat acceptance then Gaussian smearing:
//   uniform(0,1) > efficiency      -> std::nullopt (not detected)
//   else observed ~ N(E, E*resolution), clamped at 0.
// Thresholding is left to the caller.
std::optional<double> Respond(Rng& rng, double true_energy_keV,
                              double resolution, double efficiency);

// Same, with the acceptance evaluated on the curve at the true energy.
std::optional<double> Respond(Rng& rng, double true_energy_keV,
                              double resolution, const EfficiencyCurve& curve);

} // namespace response
} // namespace darksim
