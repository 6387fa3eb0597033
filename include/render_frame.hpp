#pragma once

#include "price_window.hpp"
#include "quote_source.hpp"
#include "signal_engine.hpp"
#include "zoom_state.hpp"

#include <optional>
#include <string>
#include <vector>

namespace pricewatch {

/// Line and area colors for a window's price series
struct SeriesStyle {
  std::string line_color;
  std::string area_color;
  int line_width{2};

  bool operator==(const SeriesStyle &other) const {
    return line_color == other.line_color && area_color == other.area_color &&
           line_width == other.line_width;
  }
};

/// Lime/green when trending up, red when down; crash overrides both
SeriesStyle style_for(const Signals &signals);

/// Everything a presentation adapter needs to draw one instrument
struct RenderFrame {
  std::string instrument;
  std::vector<Observation> samples;    // oldest-first
  std::optional<Signals> signals;      // absent for an empty window
  double zoom_factor{1.0};
  std::optional<double> previous_close;
  std::optional<DisplayBounds> bounds; // absent for an empty window
  std::optional<SeriesStyle> style;    // absent for an empty window
  TickStatus status{TickStatus::NO_DATA};
  std::optional<FetchError> error;     // set when status is FAILED
  TimestampMs observed_at_ms{0};       // when the tick completed
  uint64_t version{0};                 // window version the frame was built from

  bool has_data() const { return !samples.empty(); }
};

/**
 * Assemble a frame from a window snapshot.
 *
 * Signals, bounds and style are derived only when the snapshot holds at
 * least one sample.
 */
RenderFrame build_frame(const WindowSnapshot &snapshot, double zoom_factor,
                        const SignalPolicy &policy, TickStatus status,
                        TimestampMs observed_at_ms,
                        const std::optional<FetchError> &error = std::nullopt);

/// "₹2945.50"
std::string format_price_label(double price);

/// "Prev ₹2930.10"
std::string format_reference_label(double previous_close);

/// "RELIANCE Live ₹2945.50 – 18 Oct 2026" (date in UTC)
std::string format_title(const std::string &instrument, double latest_price,
                         TimestampMs timestamp_ms);

} // namespace pricewatch
