#pragma once

#include "quote_source.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace pricewatch {

struct HttpQuoteConfig {
  std::string host{"www.nseindia.com"};
  std::string port{"443"};
  std::string target_prefix{"/api/quote-equity?symbol="};
  std::string user_agent{"Mozilla/5.0 (X11; Linux x86_64) pricewatch/1.0"};
  bool insecure_tls{false};
  std::chrono::milliseconds timeout{5000};
};

/**
 * Parse a quote-equity payload.
 *
 * Reads priceInfo.lastPrice and priceInfo.previousClose (required) plus
 * priceInfo.open and priceInfo.weekHighLow.{min,max} when present. Values
 * may be JSON numbers or strings with thousands separators ("2,945.50").
 *
 * @return Quote on success; failure for malformed JSON or missing,
 *         non-numeric or non-positive required fields
 */
FetchResult parse_quote_payload(const std::string &body);

/// HTTPS quote source backed by Boost.Beast + OpenSSL.
/// Each fetch opens its own connection, so concurrent fetches are safe.
class HttpQuoteSource : public QuoteSource {
public:
  explicit HttpQuoteSource(const HttpQuoteConfig &config = HttpQuoteConfig());
  ~HttpQuoteSource() override;

  FetchResult fetch(const std::string &instrument) override;

  const HttpQuoteConfig &config() const { return config_; }

private:
  struct Impl;

  HttpQuoteConfig config_;
  std::unique_ptr<Impl> impl_;
};

} // namespace pricewatch
