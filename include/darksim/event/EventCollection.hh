#pragma once
#include <cstddef>
#include <vector>

#include "darksim/event/DetectionEvent.hh"

namespace darksim {

// Events of one run in processing order. Append-only while the run is
// being built; size() == signal_count() + background_count() always holds.
class EventCollection {
public:
  using const_iterator = std::vector<DetectionEvent>::const_iterator;

  void Add(DetectionEvent ev);
  void Reserve(std::size_t n) { events_.reserve(n); }

  std::size_t size()             const noexcept { return events_.size(); }
  bool        empty()            const noexcept { return events_.empty(); }
  std::size_t signal_count()     const noexcept { return n_signal_; }
  std::size_t background_count() const noexcept { return n_background_; }

  const DetectionEvent& operator[](std::size_t i) const { return events_[i]; }
  const std::vector<DetectionEvent>& events() const noexcept { return events_; }
  const_iterator begin() const noexcept { return events_.begin(); }
  const_iterator end()   const noexcept { return events_.end(); }

  std::vector<double> ObservedEnergies() const;
  std::vector<double> Timestamps() const;

private:
  std::vector<DetectionEvent> events_;
  std::size_t n_signal_     = 0;
  std::size_t n_background_ = 0;
};

} // namespace darksim
