#include "frame_codec.hpp"
#include "pricewatch/v1/frame.pb.h"
#include <gtest/gtest.h>

namespace pricewatch {

TEST(FrameCodecTest, ProtoCarriesSignalsAndReference) {
  WindowSnapshot snap;
  snap.instrument = "HDFCBANK";
  snap.samples = {{1000, 1600.0}, {4000, 1540.0}};
  snap.previous_close = 1590.0;
  snap.version = 7;
  RenderFrame frame =
      build_frame(snap, 0.8, SignalPolicy(), TickStatus::APPENDED, 4000);

  v1::RefreshFrame message;
  to_proto(frame, &message);

  EXPECT_EQ(message.instrument(), "HDFCBANK");
  ASSERT_EQ(message.samples_size(), 2);
  EXPECT_EQ(message.samples(1).timestamp_ms(), 4000u);
  EXPECT_TRUE(message.has_signals());
  EXPECT_TRUE(message.signals().crash());
  EXPECT_EQ(message.signals().color(), v1::SIGNAL_COLOR_ALERT);
  EXPECT_TRUE(message.has_previous_close());
  EXPECT_DOUBLE_EQ(message.previous_close(), 1590.0);
  EXPECT_EQ(message.style().area_color(), "rgba(255,0,0,0.35)");
  EXPECT_EQ(message.status(), v1::TICK_STATUS_APPENDED);
  EXPECT_EQ(message.version(), 7u);
}

TEST(FrameCodecTest, DecodeRestoresOptionalFields) {
  RenderFrame failed;
  failed.instrument = "ITC";
  failed.status = TickStatus::FAILED;
  failed.error = FetchError{ErrorKind::QUOTE_FETCH_FAILED, "HTTP 401 for ITC"};

  RenderFrame decoded = decode_frame(encode_frame(failed));
  EXPECT_EQ(decoded.instrument, "ITC");
  EXPECT_EQ(decoded.status, TickStatus::FAILED);
  EXPECT_FALSE(decoded.signals.has_value());
  EXPECT_FALSE(decoded.previous_close.has_value());
  EXPECT_FALSE(decoded.bounds.has_value());
  ASSERT_TRUE(decoded.error.has_value());
  EXPECT_EQ(decoded.error->message, "HTTP 401 for ITC");
}

TEST(FrameCodecTest, GarbageIsRejected) {
  EXPECT_THROW(decode_frame(std::string("\xff\xff\xff", 3)), std::runtime_error);
}

} // namespace pricewatch
