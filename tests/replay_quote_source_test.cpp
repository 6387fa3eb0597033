#include "replay_quote_source.hpp"
#include <gtest/gtest.h>
#include <sstream>

namespace pricewatch {

TEST(ReplayQuoteSourceTest, ServesQuotesInFileOrder) {
  std::istringstream input("# instrument,last,prev\n"
                           "RELIANCE,2945.50,2930.10\n"
                           "\n"
                           "TCS,3500,3490\n"
                           "RELIANCE,2950.00,2930.10\n");
  ReplayQuoteSource source(input);
  EXPECT_EQ(source.loaded_count(), 3u);
  EXPECT_EQ(source.skipped_lines(), 0u);
  EXPECT_EQ(source.remaining("RELIANCE"), 2u);

  auto first = source.fetch("RELIANCE");
  ASSERT_TRUE(first.ok());
  EXPECT_DOUBLE_EQ(first.quote().last_price, 2945.5);
  EXPECT_DOUBLE_EQ(first.quote().previous_close, 2930.1);

  auto second = source.fetch("RELIANCE");
  ASSERT_TRUE(second.ok());
  EXPECT_DOUBLE_EQ(second.quote().last_price, 2950.0);

  auto exhausted = source.fetch("RELIANCE");
  EXPECT_FALSE(exhausted.ok());
  EXPECT_EQ(exhausted.error().kind, ErrorKind::QUOTE_FETCH_FAILED);
}

TEST(ReplayQuoteSourceTest, UnknownInstrumentFails) {
  std::istringstream input("TCS,3500,3490\n");
  ReplayQuoteSource source(input);
  EXPECT_FALSE(source.fetch("INFY").ok());
}

TEST(ReplayQuoteSourceTest, SkipsMalformedLines) {
  std::istringstream input("TCS,3500\n"
                           "TCS,abc,3490\n"
                           "TCS,3501,3490\r\n");
  ReplayQuoteSource source(input);
  EXPECT_EQ(source.loaded_count(), 1u);
  EXPECT_EQ(source.skipped_lines(), 2u);
}

TEST(ReplayQuoteSourceTest, NonPositivePriceIsFetchFailure) {
  std::istringstream input("SBIN,0,600\n");
  ReplayQuoteSource source(input);
  auto result = source.fetch("SBIN");
  EXPECT_FALSE(result.ok());
  EXPECT_THROW(result.quote(), std::logic_error);
}

} // namespace pricewatch
