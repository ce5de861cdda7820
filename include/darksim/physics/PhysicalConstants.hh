#pragma once

namespace darksim::phys {

constexpr double kPi                 = 3.14159265358979323846;
constexpr double kSpeedOfLight_m_s   = 299792458.0;
constexpr double kAtomicMassUnit_GeV = 0.9315;        // nucleon mass used for m_N = A * u
constexpr double kAtomicMassUnit_g   = 1.66054e-24;
constexpr double kHbarC_GeV_fm       = 0.1973269804;  // q[fm^-1] = q[GeV] / hbar c
constexpr double kGeV_to_keV         = 1.0e6;
constexpr double kSecondsPerDay      = 86400.0;

constexpr double kElectronMass_GeV   = 0.51099895e-3;
constexpr double kMuonMass_GeV       = 0.1056583755;

// Standard halo model defaults
constexpr double kV0_m_s             = 220.0e3;
constexpr double kVEscape_m_s        = 544.0e3;
constexpr double kLocalDensity_GeV_cm3 = 0.3;

constexpr double kWimpMass_GeV       = 50.0;
constexpr double kWimpCrossSection_cm2 = 1.0e-45;

} // namespace darksim::phys
