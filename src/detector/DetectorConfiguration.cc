#include "darksim/detector/DetectorConfiguration.hh"
#include "darksim/core/Errors.hh"
#include "darksim/physics/Kinematics.hh"

#include <cmath>
#include <sstream>

namespace darksim {

namespace {

void require_range(const char* what, double v, double lo, double hi, bool lo_open) {
  const bool ok = std::isfinite(v) && (lo_open ? v > lo : v >= lo) && v <= hi;
  if (ok) return;
  std::ostringstream os;
  os << what << " must be in " << (lo_open ? "(" : "[") << lo << ", " << hi
     << "], got " << v;
  throw ConfigurationError(os.str());
}

} // namespace

DetectorConfiguration::DetectorConfiguration(DetectorKind kind, const DetectorSettings& s)
  : kind_(kind)
{
  const auto& p = ParamsFor(kind);
  kind_name_ = p.name;
  Z_ = p.Z;
  A_ = p.A;

  mass_kg_         = s.mass_kg;
  temperature_mK_  = s.temperature_mK;
  exposure_days_   = s.exposure_days;
  threshold_keV_   = s.threshold_keV.value_or(p.threshold_keV);
  resolution_      = s.resolution.value_or(p.resolution);
  background_rate_ = s.background_rate_per_kg_day.value_or(p.background_rate_per_kg_day);
  quenching_       = s.quenching_factor;

  require_range("mass_kg",          mass_kg_,         0.0, limits::kMaxMass_kg,        true);
  require_range("temperature_mK",   temperature_mK_,  0.0, limits::kMaxTemperature_mK, true);
  require_range("threshold_keV",    threshold_keV_,   0.0, limits::kMaxThreshold_keV,  false);
  require_range("resolution",       resolution_,      0.0, 1.0,                        false);
  require_range("background_rate",  background_rate_, 0.0, limits::kMaxBackgroundRate, false);
  require_range("exposure_days",    exposure_days_,   0.0, limits::kMaxExposure_days,  true);
  require_range("quenching_factor", quenching_,       0.0, 1.0,                        true);

  const double plateau = s.efficiency_plateau.value_or(p.efficiency_plateau);
  require_range("efficiency", plateau, 0.0, 1.0, false);

  if (s.efficiency_mid_keV.has_value())
    efficiency_ = EfficiencyCurve::TurnOn(threshold_keV_, *s.efficiency_mid_keV, plateau);
  else
    efficiency_ = EfficiencyCurve::Flat(plateau);
}

double DetectorConfiguration::nucleus_mass_GeV() const {
  return kinematics::NucleusMass_GeV(static_cast<double>(A_));
}

DetectorConfiguration Configure(DetectorKind kind, double mass_kg, double temperature_mK,
                                double threshold_keV, double background_rate_per_kg_day,
                                double exposure_days) {
  DetectorSettings s;
  s.mass_kg                    = mass_kg;
  s.temperature_mK             = temperature_mK;
  s.threshold_keV              = threshold_keV;
  s.background_rate_per_kg_day = background_rate_per_kg_day;
  s.exposure_days              = exposure_days;
  return DetectorConfiguration(kind, s);
}

DetectorConfiguration Configure(const std::string& kind_name, double mass_kg,
                                double temperature_mK, double threshold_keV,
                                double background_rate_per_kg_day, double exposure_days) {
  return Configure(ParseDetectorKind(kind_name), mass_kg, temperature_mK,
                   threshold_keV, background_rate_per_kg_day, exposure_days);
}

} // namespace darksim
