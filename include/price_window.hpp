#pragma once

#include "price_types.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pricewatch {

/// Consistent copy of one instrument's window taken under its lock
struct WindowSnapshot {
  std::string instrument;
  std::vector<Observation> samples;     // oldest-first
  std::optional<double> previous_close; // reference line from latest append
  uint64_t version;                     // number of appends so far

  WindowSnapshot() : version(0) {}
};

/// Bounded FIFO window of recent observations for a single instrument
class PriceWindow {
public:
  /// @param instrument Instrument identifier (e.g., "RELIANCE")
  /// @param capacity Maximum number of retained observations
  /// @throws InvalidConfigError if capacity is zero
  PriceWindow(const std::string &instrument, std::size_t capacity);

  /// Append an observation at the tail, evicting from the head once the
  /// window is full. A timestamp older than the newest sample is clamped
  /// to it so the window stays non-decreasing.
  /// @return The observation as stored
  Observation append(const Observation &observation, double previous_close);

  WindowSnapshot snapshot() const;

  /// Samples oldest-first (copy)
  std::vector<Observation> samples() const;

  std::optional<double> previous_close() const;
  std::size_t size() const;
  bool empty() const;
  uint64_t version() const;

  std::size_t capacity() const { return capacity_; }
  const std::string &instrument() const { return instrument_; }

private:
  const std::string instrument_;
  const std::size_t capacity_;

  mutable std::mutex mutex_;
  std::deque<Observation> samples_;
  std::optional<double> previous_close_;
  uint64_t version_;
};

} // namespace pricewatch
