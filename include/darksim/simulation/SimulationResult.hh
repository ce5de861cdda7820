#pragma once
#include <cstdint>
#include <utility>

#include "darksim/detector/DetectorConfiguration.hh"
#include "darksim/physics/PhysicalConstants.hh"
#include "darksim/stats/Aggregator.hh"
#include "darksim/stats/Histogram.hh"

namespace darksim {

// Standard halo model and WIMP hypothesis.
struct HaloModel {
  double wimp_mass_GeV         = phys::kWimpMass_GeV;
  double cross_section_cm2     = phys::kWimpCrossSection_cm2;  // WIMP-nucleon sigma_0
  double v0_m_s                = phys::kV0_m_s;
  double v_escape_m_s          = phys::kVEscape_m_s;
  double local_density_GeV_cm3 = phys::kLocalDensity_GeV_cm3;
};

// Summary of one completed run; a value type, safe to copy and keep.
struct SimulationResult {
  explicit SimulationResult(DetectorConfiguration cfg) : detector(std::move(cfg)) {}

  DetectorConfiguration detector;
  HaloModel             halo;
  long long             n_signal_requested     = 0;
  long long             n_background_requested = 0;
  std::uint64_t         rng_seed               = 0;

  stats::RunStatistics  statistics;
  stats::Histogram1D    energy_spectrum;
  stats::Histogram1D    temporal_distribution;

  // Mean speed of the sampled WIMPs and the resulting expected interaction
  // rate (zero-momentum coherent cross section).
  double mean_wimp_speed_m_s          = 0.0;
  double expected_signal_rate_per_day = 0.0;
};

} // namespace darksim
