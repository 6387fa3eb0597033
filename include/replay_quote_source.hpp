#pragma once

#include "quote_source.hpp"

#include <cstddef>
#include <deque>
#include <istream>
#include <map>
#include <mutex>
#include <string>

namespace pricewatch {

/// Quote source that serves recorded quotes, one per fetch, in file order.
///
/// Input lines are `instrument,last_price,previous_close`. Blank lines and
/// lines starting with '#' are ignored; malformed lines are counted and
/// skipped. Fetching an instrument with no quotes left is a fetch failure.
class ReplayQuoteSource : public QuoteSource {
public:
  explicit ReplayQuoteSource(std::istream &input);

  FetchResult fetch(const std::string &instrument) override;

  /// Quotes not yet served for an instrument
  std::size_t remaining(const std::string &instrument) const;

  std::size_t loaded_count() const { return loaded_; }
  std::size_t skipped_lines() const { return skipped_; }

private:
  bool parse_line(const std::string &line);

  mutable std::mutex mutex_;
  std::map<std::string, std::deque<Quote>> pending_;
  std::size_t loaded_{0};
  std::size_t skipped_{0};
};

} // namespace pricewatch
