#pragma once

#include "price_types.hpp"

#include <mutex>
#include <vector>

namespace pricewatch {

constexpr double ZOOM_IN_STEP = 0.8;
constexpr double ZOOM_OUT_STEP = 1.25;
constexpr double DEFAULT_ZOOM_FACTOR = 1.0;
constexpr double DEFAULT_MIN_ZOOM = 0.1;
constexpr double DEFAULT_MAX_ZOOM = 10.0;

/// Share of the window's price range added above and below, at factor 1.0
constexpr double RANGE_PAD_RATIO = 0.3;
/// Share of the latest price used as padding when the window is flat
constexpr double FLAT_PAD_RATIO = 0.01;

/// Vertical display range for a window
struct DisplayBounds {
  double lower{0.0};
  double upper{0.0};
  double pad{0.0};
};

/// User-adjustable display scale factor, shared by all instruments
class ZoomState {
public:
  /// @throws InvalidConfigError unless 0 < min_factor <= 1 <= max_factor
  explicit ZoomState(double min_factor = DEFAULT_MIN_ZOOM,
                     double max_factor = DEFAULT_MAX_ZOOM);

  /// Multiply factor by ZOOM_IN_STEP, clamped
  /// @return New factor
  double zoom_in();

  /// Multiply factor by ZOOM_OUT_STEP, clamped
  /// @return New factor
  double zoom_out();

  double reset();
  double current_factor() const;

  double min_factor() const { return min_factor_; }
  double max_factor() const { return max_factor_; }

private:
  double apply(double step);

  const double min_factor_;
  const double max_factor_;

  mutable std::mutex mutex_;
  double factor_;
};

/**
 * Compute display bounds for a window at a zoom factor.
 *
 * pad = (max - min) * RANGE_PAD_RATIO * factor, or latest * FLAT_PAD_RATIO
 * when every sample has the same price.
 *
 * @throws EmptyWindowError if samples is empty
 */
DisplayBounds compute_display_bounds(const std::vector<Observation> &samples,
                                     double factor);

} // namespace pricewatch
