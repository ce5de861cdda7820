#include "darksim/io/ResultJson.hh"

#include <cmath>

namespace darksim {

namespace {

nlohmann::json finite_or_null(double x) {
  if (std::isfinite(x)) return x;
  return nullptr;
}

} // namespace

nlohmann::json ToJson(const DetectorConfiguration& cfg) {
  const auto& eff = cfg.efficiency();
  nlohmann::json j = {
    {"type",            cfg.kind_name()},
    {"Z",               cfg.Z()},
    {"A",               cfg.A()},
    {"mass_kg",         cfg.mass_kg()},
    {"temperature_mK",  cfg.temperature_mK()},
    {"threshold_keV",   cfg.threshold_keV()},
    {"resolution",      cfg.resolution()},
    {"background_rate", cfg.background_rate_per_kg_day()},
    {"efficiency",      eff.plateau()},
    {"exposure_days",   cfg.exposure_days()},
    {"quenching_factor",cfg.quenching_factor()},
  };
  if (eff.energy_dependent()) j["efficiency_mid_keV"] = eff.mid_keV();
  return j;
}

nlohmann::json ToJson(const DetectionEvent& ev) {
  const auto& p = ev.position();
  return {
    {"event_id",          ev.id()},
    {"timestamp_s",       ev.timestamp_s()},
    {"energy_deposited",  ev.true_energy_keV()},
    {"detector_response", ev.observed_energy_keV()},
    {"is_signal",         ev.is_signal()},
    {"position",          {p[0], p[1], p[2]}},
    {"metadata",          ev.metadata()},
  };
}

nlohmann::json ToJson(const stats::RunStatistics& st) {
  return {
    {"total_events",           st.total},
    {"dark_matter_candidates", st.signal_count},
    {"background_events",      st.background_count},
    {"mean_energy",            finite_or_null(st.mean_energy_keV)},
    {"max_energy",             finite_or_null(st.max_energy_keV)},
    {"min_energy",             finite_or_null(st.min_energy_keV)},
    {"exposure_kg_day",        st.exposure_kg_day},
    {"detector_efficiency",    st.efficiency},
  };
}

nlohmann::json ToJson(const stats::Histogram1D& h, const char* edges_key) {
  return {{edges_key, h.edges}, {"counts", h.counts}};
}

nlohmann::json ToJson(const stats::DerivedMetrics& m) {
  return {
    {"total_events",               m.total},
    {"signal_events",              m.signal},
    {"background_events",          m.background},
    {"signal_to_background_ratio", finite_or_null(m.signal_to_background)},
    {"significance_sigma",         finite_or_null(m.significance_sigma)},
    {"significance_method",        m.method},
    {"threshold_sigma",            m.threshold_sigma},
    {"discovery_threshold_met",    m.discovery_threshold_met},
  };
}

nlohmann::json ToJson(const SimulationResult& r) {
  return {
    {"detector_config", ToJson(r.detector)},
    {"wimp", {
      {"mass_GeV",          r.halo.wimp_mass_GeV},
      {"cross_section_cm2", r.halo.cross_section_cm2},
      {"v0_m_s",            r.halo.v0_m_s},
      {"v_escape_m_s",      r.halo.v_escape_m_s},
      {"rho_GeV_cm3",       r.halo.local_density_GeV_cm3},
    }},
    {"requested", {
      {"dark_matter_events", r.n_signal_requested},
      {"background_events",  r.n_background_requested},
    }},
    {"rng_seed",                     r.rng_seed},
    {"statistics",                   ToJson(r.statistics)},
    {"energy_spectrum",              ToJson(r.energy_spectrum, "bins")},
    {"temporal_distribution",        ToJson(r.temporal_distribution, "times")},
    {"mean_wimp_speed_m_s",          r.mean_wimp_speed_m_s},
    {"expected_signal_rate_per_day", r.expected_signal_rate_per_day},
  };
}

nlohmann::json ToJson(const HistoryEntry& e) {
  auto j = ToJson(e.result);
  j["simulation_id"] = e.simulation_id;
  j["label"]         = e.label;
  return j;
}

} // namespace darksim
