#include "quote_source.hpp"

#include <cmath>
#include <stdexcept>

namespace pricewatch {

FetchResult FetchResult::success(const Quote &quote) {
  FetchResult result;
  result.quote_ = quote;
  return result;
}

FetchResult FetchResult::failure(const std::string &message) {
  FetchResult result;
  result.error_ = FetchError{ErrorKind::QUOTE_FETCH_FAILED, message};
  return result;
}

const Quote &FetchResult::quote() const {
  if (!quote_) {
    throw std::logic_error("FetchResult holds an error, not a quote");
  }
  return *quote_;
}

const FetchError &FetchResult::error() const {
  if (!error_) {
    throw std::logic_error("FetchResult holds a quote, not an error");
  }
  return *error_;
}

bool is_valid_quote(const Quote &quote) {
  return std::isfinite(quote.last_price) && quote.last_price > 0.0 &&
         std::isfinite(quote.previous_close) && quote.previous_close > 0.0;
}

} // namespace pricewatch
