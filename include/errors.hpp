#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace pricewatch {

/// Error taxonomy shared by every component
enum class ErrorKind : uint8_t {
  INVALID_CONFIG,
  UNKNOWN_INSTRUMENT,
  QUOTE_FETCH_FAILED,
  EMPTY_WINDOW_SIGNAL
};

std::string to_string(ErrorKind kind);

/// Rejected configuration (zero capacity, bad ratios, empty instrument set).
/// Fatal at construction.
class InvalidConfigError : public std::invalid_argument {
public:
  explicit InvalidConfigError(const std::string &what)
      : std::invalid_argument(what) {}

  ErrorKind kind() const { return ErrorKind::INVALID_CONFIG; }
};

/// Operation referenced an instrument outside the configured set
class UnknownInstrumentError : public std::out_of_range {
public:
  explicit UnknownInstrumentError(const std::string &instrument)
      : std::out_of_range("unknown instrument: " + instrument),
        instrument_(instrument) {}

  ErrorKind kind() const { return ErrorKind::UNKNOWN_INSTRUMENT; }
  const std::string &instrument() const { return instrument_; }

private:
  std::string instrument_;
};

/// Signals or display bounds requested for a window with no observations
class EmptyWindowError : public std::logic_error {
public:
  explicit EmptyWindowError(const std::string &what) : std::logic_error(what) {}

  ErrorKind kind() const { return ErrorKind::EMPTY_WINDOW_SIGNAL; }
};

} // namespace pricewatch
