#include "darksim/detector/DetectorKind.hh"
#include "darksim/core/Errors.hh"

#include <algorithm>
#include <cctype>
#include <string>

namespace darksim {

namespace {

constexpr std::array<DetectorKindParams, kNumDetectorKinds> kTable{{
  //  kind                            name                 thr   res   bkg    eff   T[mK]      Z   A
  {DetectorKind::SuperfluidHelium, "superfluid_helium",   3.0, 0.03, 0.010, 0.85,     15.0,  2,   3},
  {DetectorKind::LiquidXenon,      "liquid_xenon",        5.0, 0.05, 0.005, 0.90, 165000.0, 54, 131},
  {DetectorKind::Germanium,        "germanium",           1.0, 0.02, 0.020, 0.80,     50.0, 32,  73},
  {DetectorKind::Scintillator,     "scintillator",       10.0, 0.10, 0.050, 0.70, 293000.0, 53, 127},
}};

constexpr bool table_is_complete() {
  for (std::size_t i = 0; i < kTable.size(); ++i)
    if (static_cast<std::size_t>(kTable[i].kind) != i) return false;
  return true;
}

static_assert(kTable.size() == kNumDetectorKinds, "detector table size mismatch");
static_assert(table_is_complete(), "detector table must list every DetectorKind in enum order");

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

} // namespace

const std::array<DetectorKindParams, kNumDetectorKinds>& DetectorKindTable() {
  return kTable;
}

const DetectorKindParams& ParamsFor(DetectorKind kind) {
  const auto idx = static_cast<std::size_t>(kind);
  if (idx >= kTable.size())
    throw ConfigurationError("Unknown detector kind index " + std::to_string(idx));
  return kTable[idx];
}

std::string ToString(DetectorKind kind) {
  return ParamsFor(kind).name;
}

DetectorKind ParseDetectorKind(const std::string& name) {
  const std::string key = to_lower(name);
  for (const auto& p : kTable)
    if (key == p.name) return p.kind;
  throw ConfigurationError("Unknown detector type: " + name);
}

} // namespace darksim
