#include "darksim/simulation/SimulationHistory.hh"
#include "darksim/core/Errors.hh"

#include <algorithm>
#include <utility>

namespace darksim {

SimulationHistory::SimulationHistory(std::size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) throw ConfigurationError("history capacity must be > 0");
}

std::uint64_t SimulationHistory::Append(SimulationResult result, std::string label) {
  const std::uint64_t id = next_id_++;
  entries_.push_back(HistoryEntry{id, std::move(label), std::move(result)});
  while (entries_.size() > capacity_) entries_.pop_front();
  return id;
}

const HistoryEntry* SimulationHistory::Latest() const {
  return entries_.empty() ? nullptr : &entries_.back();
}

const HistoryEntry* SimulationHistory::Find(std::uint64_t simulation_id) const {
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [&](const HistoryEntry& e) { return e.simulation_id == simulation_id; });
  return it == entries_.end() ? nullptr : &*it;
}

} // namespace darksim
