#include "darksim/stats/Aggregator.hh"
#include "darksim/core/Errors.hh"
#include "darksim/stats/SignificanceFactory.hh"

#include <TAxis.h>
#include <TH1D.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace darksim::stats {

long long Histogram1D::total() const {
  return std::accumulate(counts.begin(), counts.end(), 0LL);
}

RunStatistics ComputeStatistics(const EventCollection& events,
                                long long n_signal_requested,
                                double exposure_kg_day) {
  RunStatistics st;
  st.total              = events.size();
  st.signal_count       = events.signal_count();
  st.background_count   = events.background_count();
  st.exposure_kg_day    = exposure_kg_day;
  st.n_signal_requested = n_signal_requested;
  st.efficiency = (n_signal_requested > 0)
                ? static_cast<double>(st.signal_count) / static_cast<double>(n_signal_requested)
                : 0.0;

  if (events.empty()) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    st.mean_energy_keV = st.max_energy_keV = st.min_energy_keV = nan;
    return st;
  }

  double sum = 0.0;
  double lo  = std::numeric_limits<double>::infinity();
  double hi  = -std::numeric_limits<double>::infinity();
  for (const auto& e : events) {
    const double E = e.observed_energy_keV();
    sum += E;
    lo = std::min(lo, E);
    hi = std::max(hi, E);
  }
  st.mean_energy_keV = sum / static_cast<double>(events.size());
  st.min_energy_keV  = lo;
  st.max_energy_keV  = hi;
  return st;
}

Histogram1D EqualWidthHistogram(const std::vector<double>& values, int nbins,
                                const std::string& name, const std::string& title) {
  if (nbins < 1) throw ConfigurationError("histogram needs nbins >= 1");
  Histogram1D out;
  if (values.empty()) return out;

  double xmax = *std::max_element(values.begin(), values.end());
  if (!(xmax > 0.0)) xmax = 1.0;  // all values at 0

  TH1D h(name.c_str(), title.c_str(), nbins, 0.0, xmax);
  h.SetDirectory(nullptr);
  const double last_center = h.GetBinCenter(nbins);
  const TAxis* axis = h.GetXaxis();
  for (double v : values) {
    const double x = std::max(0.0, v);
    // values within rounding of xmax would otherwise land in the overflow bin
    const bool past_end = !(x < xmax) || axis->FindFixBin(x) > nbins;
    h.Fill(past_end ? last_center : x);
  }

  out.edges.reserve(static_cast<size_t>(nbins) + 1);
  out.counts.reserve(static_cast<size_t>(nbins));
  for (int i = 1; i <= nbins + 1; ++i) out.edges.push_back(h.GetBinLowEdge(i));
  for (int i = 1; i <= nbins; ++i)
    out.counts.push_back(static_cast<long long>(std::llround(h.GetBinContent(i))));
  return out;
}

Histogram1D EnergySpectrum(const EventCollection& events, int nbins) {
  return EqualWidthHistogram(events.ObservedEnergies(), nbins,
                             "energy_spectrum", "Observed energy;E [keV];events");
}

Histogram1D TemporalDistribution(const EventCollection& events, int nbins) {
  return EqualWidthHistogram(events.Timestamps(), nbins,
                             "temporal_distribution", "Event time;t [s];events");
}

DerivedMetrics ComputeDerivedMetrics(const RunStatistics& st, const StatisticsConfig& cfg) {
  DerivedMetrics m;
  m.total      = static_cast<long long>(st.total);
  m.signal     = static_cast<long long>(st.signal_count);
  m.background = static_cast<long long>(st.background_count);

  if (m.background > 0)
    m.signal_to_background = static_cast<double>(m.signal) / static_cast<double>(m.background);
  else
    m.signal_to_background = (m.signal > 0) ? std::numeric_limits<double>::infinity() : 0.0;

  const auto estimator = MakeSignificance(cfg);
  m.method             = estimator->Name();
  m.significance_sigma = estimator->Evaluate(static_cast<double>(m.signal),
                                             static_cast<double>(m.background));
  m.threshold_sigma    = cfg.discovery_threshold_sigma;
  m.discovery_threshold_met = m.significance_sigma >= cfg.discovery_threshold_sigma;
  return m;
}

} // namespace darksim::stats
