#pragma once

#include <string>
#include <unordered_set>
#include <vector>

namespace pricewatch {

/// Fixed set of tracked instruments, configured at startup
class InstrumentSet {
public:
  /// @param instruments Identifiers in display order; duplicates are dropped
  /// @throws InvalidConfigError on an empty set or an empty identifier
  explicit InstrumentSet(const std::vector<std::string> &instruments);

  bool contains(const std::string &instrument) const;

  /// @throws UnknownInstrumentError if the instrument is not configured
  void require(const std::string &instrument) const;

  const std::vector<std::string> &list() const { return ordered_; }
  std::size_t size() const { return ordered_.size(); }

private:
  std::vector<std::string> ordered_;
  std::unordered_set<std::string> lookup_;
};

} // namespace pricewatch
