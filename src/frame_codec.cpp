#include "frame_codec.hpp"
#include "pricewatch/v1/frame.pb.h"

#include <stdexcept>

namespace pricewatch {

namespace {

v1::SignalColor color_to_proto(SignalColor color) {
  switch (color) {
  case SignalColor::UP:
    return v1::SIGNAL_COLOR_UP;
  case SignalColor::DOWN:
    return v1::SIGNAL_COLOR_DOWN;
  case SignalColor::ALERT:
    return v1::SIGNAL_COLOR_ALERT;
  default:
    return v1::SIGNAL_COLOR_UNSPECIFIED;
  }
}

SignalColor color_from_proto(v1::SignalColor color) {
  switch (color) {
  case v1::SIGNAL_COLOR_DOWN:
    return SignalColor::DOWN;
  case v1::SIGNAL_COLOR_ALERT:
    return SignalColor::ALERT;
  default:
    return SignalColor::UP;
  }
}

v1::TickStatus status_to_proto(TickStatus status) {
  switch (status) {
  case TickStatus::APPENDED:
    return v1::TICK_STATUS_APPENDED;
  case TickStatus::FAILED:
    return v1::TICK_STATUS_FAILED;
  case TickStatus::SKIPPED:
    return v1::TICK_STATUS_SKIPPED;
  case TickStatus::NO_DATA:
    return v1::TICK_STATUS_NO_DATA;
  default:
    return v1::TICK_STATUS_UNSPECIFIED;
  }
}

TickStatus status_from_proto(v1::TickStatus status) {
  switch (status) {
  case v1::TICK_STATUS_APPENDED:
    return TickStatus::APPENDED;
  case v1::TICK_STATUS_FAILED:
    return TickStatus::FAILED;
  case v1::TICK_STATUS_SKIPPED:
    return TickStatus::SKIPPED;
  default:
    return TickStatus::NO_DATA;
  }
}

} // namespace

void to_proto(const RenderFrame &frame, v1::RefreshFrame *out) {
  out->Clear();
  out->set_instrument(frame.instrument);
  for (const auto &sample : frame.samples) {
    auto *s = out->add_samples();
    s->set_timestamp_ms(sample.timestamp_ms);
    s->set_price(sample.price);
  }
  if (frame.signals) {
    auto *signals = out->mutable_signals();
    signals->set_trend_up(frame.signals->trend_up);
    signals->set_crash(frame.signals->crash);
    signals->set_color(color_to_proto(frame.signals->color));
  }
  out->set_zoom_factor(frame.zoom_factor);
  if (frame.previous_close) {
    out->set_previous_close(*frame.previous_close);
  }
  if (frame.bounds) {
    auto *bounds = out->mutable_bounds();
    bounds->set_lower(frame.bounds->lower);
    bounds->set_upper(frame.bounds->upper);
    bounds->set_pad(frame.bounds->pad);
  }
  if (frame.style) {
    auto *style = out->mutable_style();
    style->set_line_color(frame.style->line_color);
    style->set_area_color(frame.style->area_color);
    style->set_line_width(frame.style->line_width);
  }
  out->set_status(status_to_proto(frame.status));
  if (frame.error) {
    out->set_error(frame.error->message);
  }
  out->set_observed_at_ms(frame.observed_at_ms);
  out->set_version(frame.version);
}

RenderFrame from_proto(const v1::RefreshFrame &message) {
  RenderFrame frame;
  frame.instrument = message.instrument();
  frame.samples.reserve(message.samples_size());
  for (const auto &s : message.samples()) {
    frame.samples.emplace_back(s.timestamp_ms(), s.price());
  }
  if (message.has_signals()) {
    Signals signals;
    signals.trend_up = message.signals().trend_up();
    signals.crash = message.signals().crash();
    signals.color = color_from_proto(message.signals().color());
    frame.signals = signals;
  }
  frame.zoom_factor = message.zoom_factor();
  if (message.has_previous_close()) {
    frame.previous_close = message.previous_close();
  }
  if (message.has_bounds()) {
    DisplayBounds bounds;
    bounds.lower = message.bounds().lower();
    bounds.upper = message.bounds().upper();
    bounds.pad = message.bounds().pad();
    frame.bounds = bounds;
  }
  if (message.has_style()) {
    SeriesStyle style;
    style.line_color = message.style().line_color();
    style.area_color = message.style().area_color();
    style.line_width = message.style().line_width();
    frame.style = style;
  }
  frame.status = status_from_proto(message.status());
  if (!message.error().empty()) {
    frame.error = FetchError{ErrorKind::QUOTE_FETCH_FAILED, message.error()};
  }
  frame.observed_at_ms = message.observed_at_ms();
  frame.version = message.version();
  return frame;
}

std::string encode_frame(const RenderFrame &frame) {
  v1::RefreshFrame message;
  to_proto(frame, &message);

  std::string payload;
  if (!message.SerializeToString(&payload)) {
    throw std::runtime_error("failed to serialize frame protobuf");
  }
  return payload;
}

RenderFrame decode_frame(const std::string &payload) {
  v1::RefreshFrame message;
  if (!message.ParseFromString(payload)) {
    throw std::runtime_error("failed to parse frame protobuf");
  }
  return from_proto(message);
}

} // namespace pricewatch
