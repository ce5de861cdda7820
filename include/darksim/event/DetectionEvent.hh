#pragma once
#include <cstdint>
#include <nlohmann/json.hpp>

#include "darksim/physics/Sampler.hh"

namespace darksim {

// One accepted detector hit. Immutable once built.
class DetectionEvent {
public:
  DetectionEvent(std::uint64_t id, double timestamp_s,
                 double true_energy_keV, double observed_energy_keV,
                 bool is_signal, const Vec3& position_m,
                 nlohmann::json metadata = nlohmann::json::object());

  std::uint64_t         id()                  const noexcept { return id_; }
  double                timestamp_s()         const noexcept { return timestamp_s_; }
  double                true_energy_keV()     const noexcept { return true_energy_keV_; }
  double                observed_energy_keV() const noexcept { return observed_energy_keV_; }
  bool                  is_signal()           const noexcept { return is_signal_; }
  const Vec3&           position()            const noexcept { return position_; }
  const nlohmann::json& metadata()            const noexcept { return metadata_; }

private:
  std::uint64_t  id_;
  double         timestamp_s_;
  double         true_energy_keV_;
  double         observed_energy_keV_;
  bool           is_signal_;
  Vec3           position_;
  nlohmann::json metadata_;
};

} // namespace darksim
