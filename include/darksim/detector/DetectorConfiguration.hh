#pragma once
#include <optional>
#include <string>

#include "darksim/detector/DetectorKind.hh"
#include "darksim/response/EfficiencyCurve.hh"

namespace darksim {

// Caller-supplied values; unset optionals take the detector table defaults.
struct DetectorSettings {
  double mass_kg        = 1.0;
  double temperature_mK = 15.0;
  double exposure_days  = 365.0;

  std::optional<double> threshold_keV;
  std::optional<double> resolution;
  std::optional<double> background_rate_per_kg_day;
  std::optional<double> efficiency_plateau;

  // Energy-dependent turn-on; flat efficiency when unset.
  std::optional<double> efficiency_mid_keV;

  double quenching_factor = 1.0;  // fraction of recoil energy seen, (0,1]
};

// Physically valid, immutable detector description for one run.
class DetectorConfiguration {
public:
  DetectorConfiguration(DetectorKind kind, const DetectorSettings& settings);

  DetectorKind kind() const noexcept { return kind_; }
  const std::string& kind_name() const noexcept { return kind_name_; }
  int    Z() const noexcept { return Z_; }
  int    A() const noexcept { return A_; }

  double mass_kg()                    const noexcept { return mass_kg_; }
  double temperature_mK()             const noexcept { return temperature_mK_; }
  double threshold_keV()              const noexcept { return threshold_keV_; }
  double resolution()                 const noexcept { return resolution_; }
  double background_rate_per_kg_day() const noexcept { return background_rate_; }
  double exposure_days()              const noexcept { return exposure_days_; }
  double quenching_factor()           const noexcept { return quenching_; }
  const EfficiencyCurve& efficiency() const noexcept { return efficiency_; }

  double exposure_kg_day() const { return mass_kg_ * exposure_days_; }
  double nucleus_mass_GeV() const;

private:
  DetectorKind    kind_;
  std::string     kind_name_;
  int             Z_ = 0;
  int             A_ = 0;
  double          mass_kg_        = 0.0;
  double          temperature_mK_ = 0.0;
  double          threshold_keV_  = 0.0;
  double          resolution_     = 0.0;
  double          background_rate_= 0.0;
  double          exposure_days_  = 0.0;
  double          quenching_      = 1.0;
  EfficiencyCurve efficiency_;
};

// Range limits enforced by DetectorConfiguration.
namespace limits {
constexpr double kMaxMass_kg          = 1.0e5;
constexpr double kMaxTemperature_mK   = 4.0e5;
constexpr double kMaxThreshold_keV    = 1000.0;
constexpr double kMaxBackgroundRate   = 1.0e6;   // events / kg / day
constexpr double kMaxExposure_days    = 1.0e5;
} // namespace limits

DetectorConfiguration Configure(DetectorKind kind, double mass_kg, double temperature_mK,
                                double threshold_keV, double background_rate_per_kg_day,
                                double exposure_days);

DetectorConfiguration Configure(const std::string& kind_name, double mass_kg,
                                double temperature_mK, double threshold_keV,
                                double background_rate_per_kg_day, double exposure_days);

} // namespace darksim
