#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace pricewatch {

/// Unix timestamp in milliseconds
using TimestampMs = uint64_t;

/// Single price sample recorded for an instrument
struct Observation {
  TimestampMs timestamp_ms; // Sampling time (Unix ms)
  double price;             // Last traded price at sampling time

  Observation() : timestamp_ms(0), price(0.0) {}
  Observation(TimestampMs ts, double px) : timestamp_ms(ts), price(px) {}

  bool operator==(const Observation &other) const {
    return timestamp_ms == other.timestamp_ms && price == other.price;
  }
  bool operator!=(const Observation &other) const { return !(*this == other); }
};

/// Point-in-time quote record returned by a QuoteSource
struct Quote {
  double last_price{0.0};         // Latest traded price
  double previous_close{0.0};     // Prior session close (reference line)
  std::optional<double> open;      // Session open, when reported
  std::optional<double> week_low;  // 52-week low, when reported
  std::optional<double> week_high; // 52-week high, when reported
};

/// Display color derived from a window's signals
enum class SignalColor : uint8_t { UP, DOWN, ALERT };

/// Signal snapshot derived from a window (never stored)
struct Signals {
  bool trend_up{true};               // latest >= oldest in window
  bool crash{false};                 // latest below crash ratio of peak
  SignalColor color{SignalColor::UP}; // ALERT overrides trend color

  bool operator==(const Signals &other) const {
    return trend_up == other.trend_up && crash == other.crash &&
           color == other.color;
  }
  bool operator!=(const Signals &other) const { return !(*this == other); }
};

/// How the scheduler decides when to fetch
enum class RefreshMode : uint8_t {
  AUTOMATIC, // fixed-period timer
  MANUAL     // explicit trigger or bootstrap fetch
};

/// Per-instrument scheduler state
/// FETCHING covers the fetch, the window commit and publishing the frame
enum class TickState : uint8_t { IDLE, AWAITING_TRIGGER, FETCHING };

/// Result of one tick for one instrument
enum class TickStatus : uint8_t {
  APPENDED, // observation committed to the window
  FAILED,   // quote fetch failed, window untouched
  SKIPPED,  // a fetch for the instrument was already in flight
  NO_DATA   // nothing fetched yet
};

std::string to_string(SignalColor color);
std::string to_string(RefreshMode mode);
std::string to_string(TickState state);
std::string to_string(TickStatus status);

} // namespace pricewatch
