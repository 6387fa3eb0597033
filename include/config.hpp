#pragma once

#include "price_types.hpp"
#include "signal_engine.hpp"
#include "zoom_state.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pricewatch {

/// ~15 minutes of samples at the default 3 second period
constexpr std::size_t DEFAULT_WINDOW_CAPACITY = 300;
constexpr uint32_t DEFAULT_WORKER_THREADS = 4;

struct SchedulerConfig {
  RefreshMode mode{RefreshMode::MANUAL};
  std::chrono::milliseconds period{3000};
  uint32_t worker_threads{DEFAULT_WORKER_THREADS}; // raised to the instrument count
  SignalPolicy policy;
  bool verbose{true}; // log ticks and lifecycle to stdout

  /// @throws InvalidConfigError on a non-positive period, zero workers in
  ///         automatic mode, or an invalid signal policy
  void validate() const;
};

/// Top-level settings for a watch session
struct WatchConfig {
  std::vector<std::string> instruments;
  std::size_t capacity{DEFAULT_WINDOW_CAPACITY};
  double min_zoom{DEFAULT_MIN_ZOOM};
  double max_zoom{DEFAULT_MAX_ZOOM};
  SchedulerConfig scheduler;

  WatchConfig();

  /// @throws InvalidConfigError describing the first invalid setting
  void validate() const;
};

/// The fifteen large-cap NSE symbols tracked out of the box
std::vector<std::string> default_instruments();

/// Split "RELIANCE, TCS,INFY" into identifiers, trimming whitespace and
/// dropping empty entries.
/// @throws InvalidConfigError if no identifier remains
std::vector<std::string> parse_instrument_list(const std::string &text);

/// Accepts "auto", "automatic" or "manual" (case-insensitive)
/// @throws InvalidConfigError for anything else
RefreshMode parse_refresh_mode(const std::string &text);

} // namespace pricewatch
