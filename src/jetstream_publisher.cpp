#include "frame_codec.hpp"
#include "publisher.hpp"

#include <limits>
#include <memory>
#include <stdexcept>

#include <nats.h>

namespace pricewatch {

namespace {

std::string natsErrorMessage(natsStatus status) {
  const char *text = natsStatus_GetText(status);
  return text != nullptr ? std::string{text} : std::string{"unknown"};
}

void require_ok(natsStatus status, const char *call) {
  if (status != NATS_OK) {
    throw std::runtime_error(std::string(call) + " failed: " +
                             natsErrorMessage(status));
  }
}

struct OptionsDeleter {
  void operator()(natsOptions *opts) const { natsOptions_Destroy(opts); }
};

using OptionsPtr = std::unique_ptr<natsOptions, OptionsDeleter>;

} // namespace

JetStreamPublisher::JetStreamPublisher(const JetStreamConfig &config)
    : config_(config) {
  if (config_.url.empty()) {
    config_.url = DEFAULT_NATS_URL;
  }

  natsOptions *raw = nullptr;
  require_ok(natsOptions_Create(&raw), "natsOptions_Create");
  OptionsPtr opts(raw);
  require_ok(natsOptions_SetURL(opts.get(), config_.url.c_str()),
             "natsOptions_SetURL");
  require_ok(natsOptions_SetName(opts.get(), "price_watch"),
             "natsOptions_SetName");

  require_ok(natsConnection_Connect(&conn_, opts.get()),
             "natsConnection_Connect");

  natsStatus status = natsConnection_JetStream(&js_, conn_, nullptr);
  if (status != NATS_OK) {
    close();
    require_ok(status, "natsConnection_JetStream");
  }
}

JetStreamPublisher::~JetStreamPublisher() { close(); }

void JetStreamPublisher::close() {
  if (js_ != nullptr) {
    jsCtx_Destroy(js_);
    js_ = nullptr;
  }
  if (conn_ == nullptr) {
    return;
  }
  natsConnection_Close(conn_);
  natsConnection_Destroy(conn_);
  conn_ = nullptr;
}

std::string JetStreamPublisher::build_subject(const std::string &instrument) const {
  return build_frame_subject(config_.subject_root, instrument);
}

void JetStreamPublisher::publish(const RenderFrame &frame) {
  if (js_ == nullptr) {
    throw std::runtime_error("JetStream context not initialized");
  }

  std::string payload = encode_frame(frame);
  if (payload.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
    throw std::runtime_error("payload too large for js_Publish");
  }

  jsPubAck *ack = nullptr;
  jsErrCode err_code = static_cast<jsErrCode>(0);
  std::string subject = build_subject(frame.instrument);
  std::string msg_id =
      build_frame_msg_id(subject, frame.version, frame.observed_at_ms);

  jsPubOptions opts;
  jsPubOptions_Init(&opts);
  if (!config_.stream.empty()) {
    opts.ExpectStream = config_.stream.c_str();
  }
  opts.MsgId = msg_id.c_str();
  if (config_.publish_timeout.count() > 0) {
    opts.MaxWait = config_.publish_timeout.count();
  }

  natsStatus status;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    status = js_Publish(&ack, js_, subject.c_str(), payload.data(),
                        static_cast<int>(payload.size()), &opts, &err_code);
  }

  if (ack != nullptr) {
    jsPubAck_Destroy(ack);
  }

  if (status != NATS_OK) {
    throw std::runtime_error("js_Publish failed: " + natsErrorMessage(status) +
                             ", jsErrCode=" + std::to_string(err_code));
  }
}

} // namespace pricewatch
