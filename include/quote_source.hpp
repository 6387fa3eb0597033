#pragma once

#include "errors.hpp"
#include "price_types.hpp"

#include <optional>
#include <string>

namespace pricewatch {

/// Recoverable fetch failure (network, HTTP status, malformed payload)
struct FetchError {
  ErrorKind kind{ErrorKind::QUOTE_FETCH_FAILED};
  std::string message;
};

/// Either a usable quote or the reason there is none
class FetchResult {
public:
  static FetchResult success(const Quote &quote);
  static FetchResult failure(const std::string &message);

  bool ok() const { return quote_.has_value(); }

  /// @throws std::logic_error if the fetch failed
  const Quote &quote() const;

  /// @throws std::logic_error if the fetch succeeded
  const FetchError &error() const;

private:
  FetchResult() = default;

  std::optional<Quote> quote_;
  std::optional<FetchError> error_;
};

/// True when the quote can become an observation (finite, positive prices)
bool is_valid_quote(const Quote &quote);

/// External collaborator that returns the latest quote for an instrument.
/// Implementations must be safe to call from several worker threads.
class QuoteSource {
public:
  virtual ~QuoteSource() = default;

  virtual FetchResult fetch(const std::string &instrument) = 0;
};

} // namespace pricewatch
