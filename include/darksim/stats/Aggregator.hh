#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "darksim/event/EventCollection.hh"
#include "darksim/stats/Histogram.hh"
#include "darksim/stats/StatisticsConfig.hh"

namespace darksim::stats {

struct RunStatistics {
  std::size_t total            = 0;
  std::size_t signal_count     = 0;
  std::size_t background_count = 0;
  // Observed energies [keV]; NaN when the collection is empty.
  double mean_energy_keV = 0.0;
  double max_energy_keV  = 0.0;
  double min_energy_keV  = 0.0;
  double exposure_kg_day = 0.0;
  // signal_count / n_signal_requested, 0 when nothing was requested.
  double efficiency      = 0.0;
  long long n_signal_requested = 0;
};

struct DerivedMetrics {
  long long   total       = 0;
  long long   signal      = 0;
  long long   background  = 0;
  double      signal_to_background = 0.0;  // +inf when background == 0 and signal > 0
  double      significance_sigma   = 0.0;
  double      threshold_sigma      = 3.0;
  bool        discovery_threshold_met = false;
  std::string method;
};

RunStatistics ComputeStatistics(const EventCollection& events,
                                long long n_signal_requested,
                                double exposure_kg_day);

// Equal-width bins over [0, max(value)], the maximum itself counted in the
// last bin. Empty input gives an empty histogram; nbins < 1 throws
// ConfigurationError.
Histogram1D EqualWidthHistogram(const std::vector<double>& values, int nbins,
                                const std::string& name, const std::string& title);

// Observed energies.
Histogram1D EnergySpectrum(const EventCollection& events, int nbins);

// Absolute timestamps, seconds since exposure start.
Histogram1D TemporalDistribution(const EventCollection& events, int nbins);

DerivedMetrics ComputeDerivedMetrics(const RunStatistics& st, const StatisticsConfig& cfg);

} // namespace darksim::stats
