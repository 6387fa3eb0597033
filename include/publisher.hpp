#pragma once

#include "render_frame.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace pricewatch {

constexpr const char *DEFAULT_NATS_URL = "nats://127.0.0.1:4222";

struct JetStreamConfig {
  std::string url; // DEFAULT_NATS_URL when empty
  std::string stream;
  std::string subject_root{"pricewatch"};
  std::chrono::milliseconds publish_timeout{500};
};

/// Abstract publisher interface for handing frames to a presentation adapter.
class FramePublisher {
public:
  virtual ~FramePublisher() = default;

  /// Publish the frame produced by one completed tick.
  virtual void publish(const RenderFrame &frame) = 0;
};

struct natsConnection;
struct jsCtx;

/// In-memory publisher used for tests and embedding.
class InMemoryPublisher : public FramePublisher {
public:
  void publish(const RenderFrame &frame) override;

  std::vector<RenderFrame> snapshot() const;
  std::optional<RenderFrame> last() const;
  std::size_t count() const;

private:
  mutable std::mutex mutex_;
  std::vector<RenderFrame> emitted_;
};

/// Writes one human-readable block per frame (title, labels, signals).
class ConsolePublisher : public FramePublisher {
public:
  explicit ConsolePublisher(std::ostream &out) : out_(out) {}

  void publish(const RenderFrame &frame) override;

private:
  std::ostream &out_;
  std::mutex mutex_;
};

/// JetStream publisher that serializes frames to protobuf and writes to NATS.
class JetStreamPublisher : public FramePublisher {
public:
  explicit JetStreamPublisher(const JetStreamConfig &config);
  ~JetStreamPublisher() override;

  void publish(const RenderFrame &frame) override;

  std::string build_subject(const std::string &instrument) const;

private:
  void close();

  JetStreamConfig config_;
  natsConnection *conn_{nullptr};
  jsCtx *js_{nullptr};
  mutable std::mutex mutex_;
};

/// Replace every character outside [A-Za-z0-9-] so an identifier is a
/// single NATS subject token.
std::string sanitize_subject_token(const std::string &token);

/// Subject a frame for `instrument` is published on:
/// `<subject_root>.frame.<sanitized instrument>`.
std::string build_frame_subject(const std::string &subject_root,
                                const std::string &instrument);

/// JetStream dedupe id `<subject>:<version>:<observed_at_ms>`. A frame
/// republished for the same window version is stored once.
std::string build_frame_msg_id(const std::string &subject, uint64_t version,
                               TimestampMs observed_at_ms);

} // namespace pricewatch
