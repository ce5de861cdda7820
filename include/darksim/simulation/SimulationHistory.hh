#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>

#include "darksim/simulation/SimulationResult.hh"

namespace darksim {

struct HistoryEntry {
  std::uint64_t    simulation_id;
  std::string      label;
  SimulationResult result;
};

// Completed runs kept by the serving layer. Ids start at 1 and keep
// increasing; the oldest entry is dropped once capacity is exceeded.
class SimulationHistory {
public:
  explicit SimulationHistory(std::size_t capacity = 100);

  std::uint64_t Append(SimulationResult result, std::string label = {});

  // nullptr when empty / not found (including evicted ids).
  const HistoryEntry* Latest() const;
  const HistoryEntry* Find(std::uint64_t simulation_id) const;

  const std::deque<HistoryEntry>& entries() const noexcept { return entries_; }
  std::size_t size()     const noexcept { return entries_.size(); }
  bool        empty()    const noexcept { return entries_.empty(); }
  std::size_t capacity() const noexcept { return capacity_; }

  void Clear() { entries_.clear(); }

private:
  std::size_t              capacity_;
  std::uint64_t            next_id_ = 1;
  std::deque<HistoryEntry> entries_;
};

} // namespace darksim
