#pragma once
#include "darksim/physics/PhysicalConstants.hh"

namespace darksim::kinematics {

// m_N = A * u  [GeV/c^2]
double NucleusMass_GeV(double mass_number);

// Elastic WIMP-nucleus recoil energy [keV].
//   mu  = m_chi m_N / (m_chi + m_N)
//   E_r = 2 mu^2 (v/c)^2 (1 - cos theta) / m_N
// Masses in GeV/c^2, speed in m/s, theta in rad.
double RecoilEnergy_keV(double wimp_mass_GeV, double wimp_speed_m_s,
                        double nucleus_mass_GeV, double scattering_angle_rad);

// Helm form factor |F(q)| with q in fm^-1:
//   R^2 = (1.2 A^{1/3})^2 - 5 s^2   (clamped at 0),  s = 0.9 fm
//   F   = 3 j1(qR)/(qR) * exp(-(qs)^2 / 2)
// qR < 1e-3 uses the series 1 - (qR)^2/10. Result in [0,1].
double NuclearFormFactor(double q_fm_inv, double mass_number);

// Momentum transfer for a recoil: q = sqrt(2 m_N E_r), returned in fm^-1.
double MomentumTransfer_fm(double recoil_energy_keV, double mass_number);

// Coherent cross section sigma0 * A^2 * F^2(q(E_r)).
double DifferentialCrossSection(double recoil_energy_keV, double mass_number,
                                double sigma0_cm2);

// Expected interactions per day for a detector of mass M:
//   N_T = M[g] / (m_N[u] * u[g]),  n_chi = rho / m_chi,
//   R   = n_chi * N_T * sigma * v[cm/s] * 86400
double InteractionRate_per_day(double cross_section_cm2, double speed_m_s,
                               double detector_mass_kg, double target_mass_GeV,
                               double wimp_mass_GeV,
                               double local_density_GeV_cm3 = phys::kLocalDensity_GeV_cm3);

} // namespace darksim::kinematics
