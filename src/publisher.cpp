#include "publisher.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace pricewatch {

void InMemoryPublisher::publish(const RenderFrame &frame) {
  std::lock_guard<std::mutex> lock(mutex_);
  emitted_.push_back(frame);
}

std::vector<RenderFrame> InMemoryPublisher::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return emitted_;
}

std::optional<RenderFrame> InMemoryPublisher::last() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (emitted_.empty()) {
    return std::nullopt;
  }
  return emitted_.back();
}

std::size_t InMemoryPublisher::count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return emitted_.size();
}

void ConsolePublisher::publish(const RenderFrame &frame) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!frame.has_data()) {
    out_ << "[EMIT] " << frame.instrument << " status=" << to_string(frame.status);
    if (frame.error) {
      out_ << " error=\"" << frame.error->message << "\"";
    }
    out_ << "\n  Hit refresh to load data\n";
    out_.flush();
    return;
  }

  const Observation &latest = frame.samples.back();
  out_ << "[EMIT] " << format_title(frame.instrument, latest.price,
                                    latest.timestamp_ms)
       << "\n  status=" << to_string(frame.status)
       << " samples=" << frame.samples.size();
  if (frame.signals) {
    out_ << " trend=" << (frame.signals->trend_up ? "up" : "down")
         << " crash=" << (frame.signals->crash ? "yes" : "no")
         << " color=" << to_string(frame.signals->color);
  }
  std::ios_base::fmtflags flags = out_.flags();
  std::streamsize precision = out_.precision();
  out_ << std::fixed << std::setprecision(2) << " zoom=" << frame.zoom_factor;
  if (frame.bounds) {
    out_ << " range=[" << frame.bounds->lower << ", " << frame.bounds->upper
         << "]";
  }
  out_.flags(flags);
  out_.precision(precision);
  out_ << "\n  " << format_price_label(latest.price);
  if (frame.previous_close) {
    out_ << "  " << format_reference_label(*frame.previous_close);
  }
  if (frame.style) {
    out_ << "  line=" << frame.style->line_color
         << " area=" << frame.style->area_color;
  }
  if (frame.error) {
    out_ << "\n  error=\"" << frame.error->message << "\"";
  }
  out_ << "\n";
  out_.flush();
}

std::string sanitize_subject_token(const std::string &token) {
  std::string sanitized;
  sanitized.reserve(token.size());
  for (char c : token) {
    if (std::isalnum(static_cast<unsigned char>(c)) || c == '-') {
      sanitized.push_back(c);
    } else {
      sanitized.push_back('_');
    }
  }
  return sanitized;
}

std::string build_frame_subject(const std::string &subject_root,
                                const std::string &instrument) {
  std::ostringstream subject;
  subject << subject_root << ".frame." << sanitize_subject_token(instrument);
  return subject.str();
}

std::string build_frame_msg_id(const std::string &subject, uint64_t version,
                               TimestampMs observed_at_ms) {
  std::ostringstream id;
  id << subject << ':' << version << ':' << observed_at_ms;
  return id.str();
}

} // namespace pricewatch
