#pragma once

#include "price_types.hpp"

#include <vector>

namespace pricewatch {

/// Default crash threshold: latest below 97% of the window peak
constexpr double DEFAULT_CRASH_RATIO = 0.97;

/// Tunables for signal derivation
struct SignalPolicy {
  double crash_ratio{DEFAULT_CRASH_RATIO};

  /// @throws InvalidConfigError unless 0 < crash_ratio <= 1
  void validate() const;
};

/**
 * Derive trend, crash alert and display color from a window.
 *
 * Walks the whole window on every call; no incremental state is kept, so
 * the result always agrees with the window it was given.
 *
 * @param samples Window observations, oldest-first
 * @param policy Crash threshold
 * @return Derived signals
 * @throws EmptyWindowError if samples is empty
 */
Signals derive_signals(const std::vector<Observation> &samples,
                       const SignalPolicy &policy = SignalPolicy());

} // namespace pricewatch
