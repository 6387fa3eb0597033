#include "replay_quote_source.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>

namespace pricewatch {

ReplayQuoteSource::ReplayQuoteSource(std::istream &input) {
  std::string line;
  while (std::getline(input, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty() || line[0] == '#') {
      continue;
    }
    if (parse_line(line)) {
      ++loaded_;
    } else {
      ++skipped_;
    }
  }
}

bool ReplayQuoteSource::parse_line(const std::string &line) {
  std::stringstream ss(line);
  std::string instrument;
  std::string last_str;
  std::string prev_str;

  if (!std::getline(ss, instrument, ',') || instrument.empty()) {
    std::cerr << "missing instrument in line: " << line << "\n";
    return false;
  }
  if (!std::getline(ss, last_str, ',')) {
    std::cerr << "missing last price in line: " << line << "\n";
    return false;
  }
  if (!std::getline(ss, prev_str, ',')) {
    std::cerr << "missing previous close in line: " << line << "\n";
    return false;
  }

  Quote quote;
  try {
    quote.last_price = std::stod(last_str);
    quote.previous_close = std::stod(prev_str);
  } catch (const std::invalid_argument &ex) {
    std::cerr << "failed to parse line: " << line << " error: " << ex.what()
              << "\n";
    return false;
  } catch (const std::out_of_range &ex) {
    std::cerr << "failed to parse line: " << line << " error: " << ex.what()
              << "\n";
    return false;
  }

  pending_[instrument].push_back(quote);
  return true;
}

FetchResult ReplayQuoteSource::fetch(const std::string &instrument) {
  Quote quote;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(instrument);
    if (it == pending_.end() || it->second.empty()) {
      return FetchResult::failure("no recorded quotes left for " + instrument);
    }
    quote = it->second.front();
    it->second.pop_front();
  }

  if (!is_valid_quote(quote)) {
    return FetchResult::failure("recorded quote for " + instrument +
                                " has non-positive prices");
  }
  return FetchResult::success(quote);
}

std::size_t ReplayQuoteSource::remaining(const std::string &instrument) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = pending_.find(instrument);
  return it == pending_.end() ? 0 : it->second.size();
}

} // namespace pricewatch
