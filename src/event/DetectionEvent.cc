#include "darksim/event/DetectionEvent.hh"

#include <utility>

namespace darksim {

DetectionEvent::DetectionEvent(std::uint64_t id, double timestamp_s,
                               double true_energy_keV, double observed_energy_keV,
                               bool is_signal, const Vec3& position_m,
                               nlohmann::json metadata)
  : id_(id), timestamp_s_(timestamp_s),
    true_energy_keV_(true_energy_keV), observed_energy_keV_(observed_energy_keV),
    is_signal_(is_signal), position_(position_m), metadata_(std::move(metadata))
{
  if (!metadata_.is_object()) metadata_ = nlohmann::json::object();
}

} // namespace darksim
