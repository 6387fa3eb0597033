#include "http_quote_source.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <nlohmann/json.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <optional>
#include <sstream>

using tcp = boost::asio::ip::tcp;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = beast::http;

namespace pricewatch {

namespace {

std::string url_encode(const std::string &s) {
  std::ostringstream oss;
  for (unsigned char c : s) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      oss << c;
    } else {
      oss << '%' << std::uppercase << std::hex << std::setw(2)
          << std::setfill('0') << static_cast<int>(c) << std::nouppercase
          << std::dec;
    }
  }
  return oss.str();
}

/// Number or numeric string; thousands separators are ignored
std::optional<double> read_number(const nlohmann::json &value) {
  if (value.is_number()) {
    return value.get<double>();
  }
  if (!value.is_string()) {
    return std::nullopt;
  }

  std::string text;
  for (char c : value.get<std::string>()) {
    if (c != ',' && !std::isspace(static_cast<unsigned char>(c))) {
      text.push_back(c);
    }
  }
  if (text.empty()) {
    return std::nullopt;
  }

  errno = 0;
  char *end = nullptr;
  double parsed = std::strtod(text.c_str(), &end);
  if (errno != 0 || end != text.c_str() + text.size()) {
    return std::nullopt;
  }
  return parsed;
}

std::optional<double> read_field(const nlohmann::json &object,
                                 const char *key) {
  if (!object.is_object() || !object.contains(key)) {
    return std::nullopt;
  }
  return read_number(object[key]);
}

std::optional<double> positive(std::optional<double> value) {
  if (value && std::isfinite(*value) && *value > 0.0) {
    return value;
  }
  return std::nullopt;
}

} // namespace

FetchResult parse_quote_payload(const std::string &body) {
  using nlohmann::json;

  json j = json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return FetchResult::failure("malformed quote payload");
  }
  if (!j.contains("priceInfo") || !j["priceInfo"].is_object()) {
    return FetchResult::failure("quote payload has no priceInfo");
  }
  const json &info = j["priceInfo"];

  auto last = positive(read_field(info, "lastPrice"));
  if (!last) {
    return FetchResult::failure("priceInfo.lastPrice missing or not positive");
  }
  auto prev = positive(read_field(info, "previousClose"));
  if (!prev) {
    return FetchResult::failure(
        "priceInfo.previousClose missing or not positive");
  }

  Quote quote;
  quote.last_price = *last;
  quote.previous_close = *prev;
  quote.open = positive(read_field(info, "open"));
  if (info.contains("weekHighLow") && info["weekHighLow"].is_object()) {
    const json &week = info["weekHighLow"];
    quote.week_low = positive(read_field(week, "min"));
    quote.week_high = positive(read_field(week, "max"));
  }
  return FetchResult::success(quote);
}

struct HttpQuoteSource::Impl {
  ssl::context ctx{ssl::context::tlsv12_client};

  explicit Impl(bool insecure_tls) {
    ctx.set_default_verify_paths();
    if (insecure_tls) {
      ctx.set_verify_mode(ssl::verify_none);
    } else {
      ctx.set_verify_mode(ssl::verify_peer);
    }
  }
};

HttpQuoteSource::HttpQuoteSource(const HttpQuoteConfig &config)
    : config_(config), impl_(new Impl(config.insecure_tls)) {}

HttpQuoteSource::~HttpQuoteSource() = default;

FetchResult HttpQuoteSource::fetch(const std::string &instrument) {
  std::string target = config_.target_prefix + url_encode(instrument);

  try {
    boost::asio::io_context ioc;
    tcp::resolver resolver(ioc);
    auto const results = resolver.resolve(config_.host, config_.port);

    beast::ssl_stream<beast::tcp_stream> stream(ioc, impl_->ctx);
    if (!SSL_set_tlsext_host_name(stream.native_handle(),
                                  config_.host.c_str())) {
      beast::error_code ec(static_cast<int>(::ERR_get_error()),
                           boost::asio::error::get_ssl_category());
      throw beast::system_error(ec, "Failed to set SNI");
    }

    beast::get_lowest_layer(stream).expires_after(config_.timeout);
    beast::get_lowest_layer(stream).connect(results);
    stream.handshake(ssl::stream_base::client);

    http::request<http::string_body> req{http::verb::get, target, 11};
    req.set(http::field::host, config_.host);
    req.set(http::field::user_agent, config_.user_agent);
    req.set(http::field::accept, "application/json");
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);

    beast::error_code ec;
    stream.shutdown(ec);

    if (res.result_int() < 200 || res.result_int() >= 300) {
      return FetchResult::failure("HTTP " + std::to_string(res.result_int()) +
                                  " for " + instrument);
    }
    return parse_quote_payload(res.body());
  } catch (const std::exception &ex) {
    return FetchResult::failure(std::string("HTTPS error: ") + ex.what());
  }
}

} // namespace pricewatch
