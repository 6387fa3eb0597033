#include "price_types.hpp"
#include "errors.hpp"

namespace pricewatch {

std::string to_string(SignalColor color) {
  switch (color) {
  case SignalColor::UP:
    return "up";
  case SignalColor::DOWN:
    return "down";
  case SignalColor::ALERT:
    return "alert";
  default:
    return "unknown";
  }
}

std::string to_string(RefreshMode mode) {
  switch (mode) {
  case RefreshMode::AUTOMATIC:
    return "automatic";
  case RefreshMode::MANUAL:
    return "manual";
  default:
    return "unknown";
  }
}

std::string to_string(TickState state) {
  switch (state) {
  case TickState::IDLE:
    return "idle";
  case TickState::AWAITING_TRIGGER:
    return "awaiting_trigger";
  case TickState::FETCHING:
    return "fetching";
  default:
    return "unknown";
  }
}

std::string to_string(TickStatus status) {
  switch (status) {
  case TickStatus::APPENDED:
    return "appended";
  case TickStatus::FAILED:
    return "failed";
  case TickStatus::SKIPPED:
    return "skipped";
  case TickStatus::NO_DATA:
    return "no_data";
  default:
    return "unknown";
  }
}

std::string to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::INVALID_CONFIG:
    return "InvalidConfig";
  case ErrorKind::UNKNOWN_INSTRUMENT:
    return "UnknownInstrument";
  case ErrorKind::QUOTE_FETCH_FAILED:
    return "QuoteFetchFailed";
  case ErrorKind::EMPTY_WINDOW_SIGNAL:
    return "EmptyWindowSignal";
  default:
    return "Unknown";
  }
}

} // namespace pricewatch
