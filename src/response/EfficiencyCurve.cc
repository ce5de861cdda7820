#include "darksim/response/EfficiencyCurve.hh"
#include "darksim/core/Errors.hh"

#include <algorithm>

namespace darksim {

EfficiencyCurve EfficiencyCurve::Flat(double plateau) {
  if (!(plateau >= 0.0 && plateau <= 1.0))
    throw ConfigurationError("efficiency plateau must be in [0,1]");
  EfficiencyCurve c;
  c.plateau_ = plateau;
  return c;
}

EfficiencyCurve EfficiencyCurve::TurnOn(double threshold_keV, double mid_keV, double plateau) {
  if (!(plateau >= 0.0 && plateau <= 1.0))
    throw ConfigurationError("efficiency plateau must be in [0,1]");
  if (threshold_keV < 0.0)
    throw ConfigurationError("efficiency threshold must be >= 0");
  if (!(mid_keV > threshold_keV))
    throw ConfigurationError("efficiency mid-energy must be > threshold");
  EfficiencyCurve c;
  c.turn_on_       = true;
  c.plateau_       = plateau;
  c.threshold_keV_ = threshold_keV;
  c.mid_keV_       = mid_keV;
  return c;
}

double EfficiencyCurve::Evaluate(double E_keV) const {
  if (!turn_on_) return plateau_;
  if (E_keV < threshold_keV_) return 0.0;
  if (E_keV >= mid_keV_) return plateau_;
  const double t = (E_keV - threshold_keV_) / (mid_keV_ - threshold_keV_);
  return std::clamp(plateau_ * t, 0.0, plateau_);
}

} // namespace darksim
