#include "render_frame.hpp"

#include <cstdio>
#include <ctime>

namespace pricewatch {

namespace {

const char *const RUPEE = "\xE2\x82\xB9";
const char *const EN_DASH = "\xE2\x80\x93";

std::string two_decimals(double value) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.2f", value);
  return std::string(buf);
}

} // namespace

SeriesStyle style_for(const Signals &signals) {
  SeriesStyle style;
  if (signals.crash) {
    style.line_color = "red";
    style.area_color = "rgba(255,0,0,0.35)";
  } else if (signals.trend_up) {
    style.line_color = "lime";
    style.area_color = "rgba(0,255,0,0.20)";
  } else {
    style.line_color = "red";
    style.area_color = "rgba(255,0,0,0.20)";
  }
  return style;
}

RenderFrame build_frame(const WindowSnapshot &snapshot, double zoom_factor,
                        const SignalPolicy &policy, TickStatus status,
                        TimestampMs observed_at_ms,
                        const std::optional<FetchError> &error) {
  RenderFrame frame;
  frame.instrument = snapshot.instrument;
  frame.samples = snapshot.samples;
  frame.zoom_factor = zoom_factor;
  frame.previous_close = snapshot.previous_close;
  frame.status = status;
  frame.error = error;
  frame.observed_at_ms = observed_at_ms;
  frame.version = snapshot.version;

  if (!frame.samples.empty()) {
    Signals signals = derive_signals(frame.samples, policy);
    frame.signals = signals;
    frame.bounds = compute_display_bounds(frame.samples, zoom_factor);
    frame.style = style_for(signals);
  }
  return frame;
}

std::string format_price_label(double price) {
  return std::string(RUPEE) + two_decimals(price);
}

std::string format_reference_label(double previous_close) {
  return "Prev " + format_price_label(previous_close);
}

std::string format_title(const std::string &instrument, double latest_price,
                         TimestampMs timestamp_ms) {
  std::time_t seconds = static_cast<std::time_t>(timestamp_ms / 1000);
  std::tm tm_utc{};
  gmtime_r(&seconds, &tm_utc);

  char date[32];
  std::strftime(date, sizeof(date), "%d %b %Y", &tm_utc);

  return instrument + " Live " + format_price_label(latest_price) + " " +
         EN_DASH + " " + date;
}

} // namespace pricewatch
