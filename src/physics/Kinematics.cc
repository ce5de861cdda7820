#include "darksim/physics/Kinematics.hh"

#include <algorithm>
#include <cmath>

namespace darksim::kinematics {

namespace {
constexpr double kHelmSkin_fm = 0.9;
constexpr double kSmallQR     = 1e-3;
} // namespace

double NucleusMass_GeV(double mass_number) {
  return mass_number * phys::kAtomicMassUnit_GeV;
}

double RecoilEnergy_keV(double wimp_mass_GeV, double wimp_speed_m_s,
                        double nucleus_mass_GeV, double scattering_angle_rad) {
  if (wimp_mass_GeV <= 0.0 || nucleus_mass_GeV <= 0.0) return 0.0;
  const double mu   = (wimp_mass_GeV * nucleus_mass_GeV) / (wimp_mass_GeV + nucleus_mass_GeV);
  const double beta = wimp_speed_m_s / phys::kSpeedOfLight_m_s;
  const double Er_GeV = 2.0 * mu * mu * beta * beta
                      * (1.0 - std::cos(scattering_angle_rad)) / nucleus_mass_GeV;
  return std::max(0.0, Er_GeV * phys::kGeV_to_keV);
}

double NuclearFormFactor(double q_fm_inv, double mass_number) {
  const double q  = std::abs(q_fm_inv);
  const double A  = std::max(mass_number, 0.0);
  const double R1 = 1.2 * std::cbrt(A);
  const double s  = kHelmSkin_fm;
  const double R2 = R1 * R1 - 5.0 * s * s;
  const double R  = (R2 > 0.0) ? std::sqrt(R2) : 0.0;

  const double qR = q * R;
  const double qs = q * s;

  double envelope;
  if (qR < kSmallQR) {
    envelope = 1.0 - qR * qR / 10.0;
  } else {
    const double j1 = std::sin(qR) / (qR * qR) - std::cos(qR) / qR;
    envelope = 3.0 * j1 / qR;
  }
  const double F = std::abs(envelope) * std::exp(-0.5 * qs * qs);
  return std::clamp(F, 0.0, 1.0);
}

double MomentumTransfer_fm(double recoil_energy_keV, double mass_number) {
  const double mN_GeV = NucleusMass_GeV(mass_number);
  const double Er_GeV = std::max(0.0, recoil_energy_keV) / phys::kGeV_to_keV;
  const double q_GeV  = std::sqrt(2.0 * mN_GeV * Er_GeV);
  return q_GeV / phys::kHbarC_GeV_fm;
}

double DifferentialCrossSection(double recoil_energy_keV, double mass_number,
                                double sigma0_cm2) {
  const double q = MomentumTransfer_fm(recoil_energy_keV, mass_number);
  const double F = NuclearFormFactor(q, mass_number);
  return sigma0_cm2 * mass_number * mass_number * F * F;
}

double InteractionRate_per_day(double cross_section_cm2, double speed_m_s,
                               double detector_mass_kg, double target_mass_GeV,
                               double wimp_mass_GeV, double local_density_GeV_cm3) {
  if (target_mass_GeV <= 0.0 || wimp_mass_GeV <= 0.0) return 0.0;

  const double mass_g      = detector_mass_kg * 1000.0;
  const double target_u    = target_mass_GeV / phys::kAtomicMassUnit_GeV;
  const double n_targets   = mass_g / (target_u * phys::kAtomicMassUnit_g);
  const double n_chi_cm3   = local_density_GeV_cm3 / wimp_mass_GeV;
  const double v_cm_s      = speed_m_s * 100.0;

  const double rate_per_s = n_chi_cm3 * n_targets * cross_section_cm2 * v_cm_s;
  return rate_per_s * phys::kSecondsPerDay;
}

} // namespace darksim::kinematics
