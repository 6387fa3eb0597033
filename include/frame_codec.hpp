#pragma once

#include "render_frame.hpp"

#include <string>

namespace pricewatch {

namespace v1 {
class RefreshFrame;
}

/// Copy a frame into its wire message
void to_proto(const RenderFrame &frame, v1::RefreshFrame *out);

/// Rebuild a frame from its wire message
RenderFrame from_proto(const v1::RefreshFrame &message);

/// Serialize a frame to protobuf bytes
/// @throws std::runtime_error if serialization fails
std::string encode_frame(const RenderFrame &frame);

/// @throws std::runtime_error if the bytes are not a RefreshFrame
RenderFrame decode_frame(const std::string &payload);

} // namespace pricewatch
