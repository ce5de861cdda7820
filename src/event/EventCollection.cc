#include "darksim/event/EventCollection.hh"

#include <utility>

namespace darksim {

void EventCollection::Add(DetectionEvent ev) {
  if (ev.is_signal()) ++n_signal_; else ++n_background_;
  events_.push_back(std::move(ev));
}

std::vector<double> EventCollection::ObservedEnergies() const {
  std::vector<double> out;
  out.reserve(events_.size());
  for (const auto& e : events_) out.push_back(e.observed_energy_keV());
  return out;
}

std::vector<double> EventCollection::Timestamps() const {
  std::vector<double> out;
  out.reserve(events_.size());
  for (const auto& e : events_) out.push_back(e.timestamp_s());
  return out;
}

} // namespace darksim
