#include "config.hpp"
#include "errors.hpp"
#include "instrument_set.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace pricewatch {

namespace {

std::string trim(const std::string &s) {
  auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
               return std::isspace(c) != 0;
             }).base();
  return begin < end ? std::string(begin, end) : std::string();
}

} // namespace

void SchedulerConfig::validate() const {
  if (period.count() <= 0) {
    throw InvalidConfigError("refresh period must be > 0 ms");
  }
  if (mode == RefreshMode::AUTOMATIC && worker_threads == 0) {
    throw InvalidConfigError("automatic mode needs at least one worker thread");
  }
  policy.validate();
}

WatchConfig::WatchConfig() : instruments(default_instruments()) {}

void WatchConfig::validate() const {
  if (capacity == 0) {
    throw InvalidConfigError("window capacity must be > 0");
  }
  // Both constructors throw InvalidConfigError on bad input
  InstrumentSet check_instruments(instruments);
  ZoomState check_zoom(min_zoom, max_zoom);
  (void)check_instruments;
  (void)check_zoom;
  scheduler.validate();
}

std::vector<std::string> default_instruments() {
  return {"RELIANCE",  "TCS",        "INFY",     "HDFCBANK",   "ICICIBANK",
          "SBIN",      "HINDUNILVR", "BHARTIARTL", "AXISBANK", "KOTAKBANK",
          "WIPRO",     "LT",         "ASIANPAINT", "ITC",      "MARUTI"};
}

std::vector<std::string> parse_instrument_list(const std::string &text) {
  std::vector<std::string> instruments;
  std::stringstream ss(text);
  std::string token;
  while (std::getline(ss, token, ',')) {
    token = trim(token);
    if (!token.empty()) {
      instruments.push_back(token);
    }
  }
  if (instruments.empty()) {
    throw InvalidConfigError("instrument list is empty: '" + text + "'");
  }
  return instruments;
}

RefreshMode parse_refresh_mode(const std::string &text) {
  std::string lowered = trim(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lowered == "auto" || lowered == "automatic") {
    return RefreshMode::AUTOMATIC;
  }
  if (lowered == "manual") {
    return RefreshMode::MANUAL;
  }
  throw InvalidConfigError("unknown refresh mode: '" + text + "'");
}

} // namespace pricewatch
