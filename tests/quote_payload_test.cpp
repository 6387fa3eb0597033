#include "http_quote_source.hpp"
#include <gtest/gtest.h>

namespace pricewatch {

TEST(QuotePayloadTest, ParsesNumericFields) {
  auto result = parse_quote_payload(R"({
    "info": {"symbol": "RELIANCE"},
    "priceInfo": {
      "lastPrice": 2945.5,
      "previousClose": 2930.1,
      "open": 2935,
      "weekHighLow": {"min": 2220.3, "max": 3217.9}
    }
  })");

  ASSERT_TRUE(result.ok());
  const Quote &q = result.quote();
  EXPECT_DOUBLE_EQ(q.last_price, 2945.5);
  EXPECT_DOUBLE_EQ(q.previous_close, 2930.1);
  EXPECT_DOUBLE_EQ(*q.open, 2935.0);
  EXPECT_DOUBLE_EQ(*q.week_low, 2220.3);
  EXPECT_DOUBLE_EQ(*q.week_high, 3217.9);
}

TEST(QuotePayloadTest, AcceptsCommaGroupedStrings) {
  auto result = parse_quote_payload(
      R"({"priceInfo": {"lastPrice": "12,945.50", "previousClose": "12,930"}})");

  ASSERT_TRUE(result.ok());
  EXPECT_DOUBLE_EQ(result.quote().last_price, 12945.5);
  EXPECT_DOUBLE_EQ(result.quote().previous_close, 12930.0);
  EXPECT_FALSE(result.quote().open.has_value());
  EXPECT_FALSE(result.quote().week_high.has_value());
}

TEST(QuotePayloadTest, RejectsMalformedJson) {
  auto result = parse_quote_payload("<html>Access Denied</html>");
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.error().kind, ErrorKind::QUOTE_FETCH_FAILED);
}

TEST(QuotePayloadTest, RejectsMissingFields) {
  EXPECT_FALSE(parse_quote_payload(R"({"info": {}})").ok());
  EXPECT_FALSE(parse_quote_payload(R"({"priceInfo": {"lastPrice": 10}})").ok());
  EXPECT_FALSE(
      parse_quote_payload(R"({"priceInfo": {"previousClose": 10}})").ok());
}

TEST(QuotePayloadTest, RejectsNonPositiveOrNonNumeric) {
  EXPECT_FALSE(parse_quote_payload(
                   R"({"priceInfo": {"lastPrice": 0, "previousClose": 10}})")
                   .ok());
  EXPECT_FALSE(parse_quote_payload(
                   R"({"priceInfo": {"lastPrice": 5, "previousClose": -1}})")
                   .ok());
  EXPECT_FALSE(parse_quote_payload(
                   R"({"priceInfo": {"lastPrice": "n/a", "previousClose": 10}})")
                   .ok());
}

TEST(QuotePayloadTest, DefaultConfigTargetsQuoteEquity) {
  HttpQuoteConfig config;
  EXPECT_EQ(config.host, "www.nseindia.com");
  EXPECT_EQ(config.target_prefix, "/api/quote-equity?symbol=");
  EXPECT_FALSE(config.insecure_tls);
}

} // namespace pricewatch
