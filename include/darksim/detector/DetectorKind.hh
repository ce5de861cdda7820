#pragma once
#include <array>
#include <cstddef>
#include <string>

namespace darksim {

enum class DetectorKind { SuperfluidHelium, LiquidXenon, Germanium, Scintillator };

constexpr std::size_t kNumDetectorKinds = 4;

// Fixed physical parameters of a detector technology. New technologies are
// added here and in DetectorKind; the simulation never branches on the kind.
struct DetectorKindParams {
  DetectorKind kind;
  const char*  name;                       // lowercase identifier, e.g. "germanium"
  double       threshold_keV;
  double       resolution;                 // sigma_E / E
  double       background_rate_per_kg_day;
  double       efficiency_plateau;         // 0..1
  double       nominal_temperature_mK;
  int          Z;                          // target nucleus
  int          A;
};

// Ordered by enum value; checked at compile time in DetectorKind.cc.
const std::array<DetectorKindParams, kNumDetectorKinds>& DetectorKindTable();

const DetectorKindParams& ParamsFor(DetectorKind kind);

std::string ToString(DetectorKind kind);

// Accepts the lowercase identifiers from the table ("liquid_xenon", ...).
// Throws ConfigurationError on anything else.
DetectorKind ParseDetectorKind(const std::string& name);

} // namespace darksim
