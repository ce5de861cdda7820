#pragma once

namespace darksim {

// Acceptance probability as a function of true energy.
//  - Flat:   plateau everywhere.
//  - TurnOn: 0 below threshold, linear 0 -> plateau on [threshold, mid],
//            saturated at plateau above mid.
class EfficiencyCurve {
public:
  EfficiencyCurve() = default;

  static EfficiencyCurve Flat(double plateau);
  static EfficiencyCurve TurnOn(double threshold_keV, double mid_keV, double plateau);

  double Evaluate(double E_keV) const;

  bool   energy_dependent() const noexcept { return turn_on_; }
  double plateau()          const noexcept { return plateau_; }
  double threshold_keV()    const noexcept { return threshold_keV_; }
  double mid_keV()          const noexcept { return mid_keV_; }

private:
  bool   turn_on_       = false;
  double plateau_       = 1.0;
  double threshold_keV_ = 0.0;
  double mid_keV_       = 0.0;
};

} // namespace darksim
