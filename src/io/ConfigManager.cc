#include "darksim/io/ConfigManager.hh"
#include "darksim/core/Errors.hh"

#include <fstream>
#include <memory>
#include <optional>
#include <utility>

namespace darksim {

namespace {

std::optional<double> optional_number(const nlohmann::json& j, const char* key) {
  if (j.contains(key) && !j.at(key).is_null()) return j.at(key).get<double>();
  return std::nullopt;
}

BackgroundMode parse_background_mode(const std::string& s) {
  if (s == "fixed")   return BackgroundMode::Fixed;
  if (s == "poisson") return BackgroundMode::Poisson;
  throw ConfigurationError("background.mode must be fixed/poisson, got \"" + s + "\"");
}

} // namespace

ConfigManager::ConfigManager(std::string path) : path_(std::move(path)) {}

void ConfigManager::parse() {
  std::ifstream in(path_);
  if (!in) throw ConfigurationError("Cannot open config: " + path_);
  nlohmann::json j;
  try {
    in >> j;
  } catch (const nlohmann::json::exception& e) {
    throw ConfigurationError("Malformed config " + path_ + ": " + e.what());
  }
  parse(j);
}

void ConfigManager::parse(const nlohmann::json& j) {
  try {
    if (j.contains("run"))        parse_run_(j.at("run"));
    if (j.contains("halo"))       parse_halo_(j.at("halo"));
    if (j.contains("background")) parse_background_(j.at("background"));
    if (j.contains("statistics")) parse_statistics_(j.at("statistics"));
    parse_detector_(j.at("detector"));
  } catch (const nlohmann::json::exception& e) {
    throw ConfigurationError(std::string("Invalid config: ") + e.what());
  }
}

const DetectorConfiguration& ConfigManager::detector() const {
  if (!detector_) throw ConfigurationError("ConfigManager: detector not parsed");
  return *detector_;
}

void ConfigManager::parse_run_(const nlohmann::json& j) {
  run_.label            = j.value("label", std::string{});
  run_.outdir           = j.value("outdir", std::string("."));
  run_.n_signal         = j.value("n_signal", 50LL);
  run_.n_background     = j.value("n_background", 1000LL);
  run_.history_capacity = j.value("history_capacity", std::size_t(100));
  run_.verbosity        = j.value("verbosity", 1);

  options_.rng_seed    = j.value("rng_seed", std::uint64_t(12345));
  options_.shuffle     = j.value("shuffle", false);
  options_.energy_bins = j.value("energy_bins", 100);
  options_.time_bins   = j.value("time_bins", 50);
  options_.verbosity   = run_.verbosity;
  stats_.verbosity     = run_.verbosity;
}

void ConfigManager::parse_detector_(const nlohmann::json& j) {
  const DetectorKind kind = ParseDetectorKind(j.at("type").get<std::string>());

  DetectorSettings s;
  s.mass_kg        = j.value("mass_kg", 1.0);
  s.temperature_mK = j.value("temperature_mK", ParamsFor(kind).nominal_temperature_mK);
  s.exposure_days  = j.value("exposure_days", 365.0);

  s.threshold_keV              = optional_number(j, "threshold_keV");
  s.resolution                 = optional_number(j, "resolution");
  s.background_rate_per_kg_day = optional_number(j, "background_rate");
  s.efficiency_plateau         = optional_number(j, "efficiency");
  s.efficiency_mid_keV         = optional_number(j, "efficiency_mid_keV");
  s.quenching_factor           = j.value("quenching_factor", 1.0);

  detector_ = std::make_unique<DetectorConfiguration>(kind, s);
}

void ConfigManager::parse_halo_(const nlohmann::json& j) {
  auto& h = options_.halo;
  h.wimp_mass_GeV         = j.value("wimp_mass_GeV", h.wimp_mass_GeV);
  h.cross_section_cm2     = j.value("cross_section_cm2", h.cross_section_cm2);
  h.v0_m_s                = j.value("v0_km_s", h.v0_m_s * 1e-3) * 1e3;
  h.v_escape_m_s          = j.value("v_escape_km_s", h.v_escape_m_s * 1e-3) * 1e3;
  h.local_density_GeV_cm3 = j.value("rho_GeV_cm3", h.local_density_GeV_cm3);
}

void ConfigManager::parse_background_(const nlohmann::json& j) {
  options_.background_range.min_keV = j.value("Emin_keV", options_.background_range.min_keV);
  options_.background_range.max_keV = j.value("Emax_keV", options_.background_range.max_keV);
  run_.background_mode = parse_background_mode(j.value("mode", std::string("fixed")));
}

void ConfigManager::parse_statistics_(const nlohmann::json& j) {
  stats_.method                    = j.value("method", std::string("simple"));
  stats_.discovery_threshold_sigma = j.value("discovery_threshold_sigma", 3.0);
}

} // namespace darksim
