#include "darksim/response/DetectorResponse.hh"
#include "darksim/response/EfficiencyCurve.hh"

#include <algorithm>
#include <random>

namespace darksim::response {

std::optional<double> Respond(Rng& rng, double true_energy_keV,
                              double resolution, double efficiency) {
  std::uniform_real_distribution<double> uni(0.0, 1.0);
  if (uni(rng) > efficiency) return std::nullopt;

  const double sigma = true_energy_keV * resolution;
  if (!(sigma > 0.0)) return std::max(0.0, true_energy_keV);

  std::normal_distribution<double> gaus(true_energy_keV, sigma);
  return std::max(0.0, gaus(rng));
}

std::optional<double> Respond(Rng& rng, double true_energy_keV,
                              double resolution, const EfficiencyCurve& curve) {
  return Respond(rng, true_energy_keV, resolution, curve.Evaluate(true_energy_keV));
}

} // namespace darksim::response
