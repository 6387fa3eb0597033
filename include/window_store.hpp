#pragma once

#include "price_window.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace pricewatch {

/// Instrument-keyed collection of price windows.
///
/// Windows are created lazily on first append and live as long as the
/// store. Instruments are partitioned over shards so lookups for different
/// instruments rarely contend; each window carries its own lock, so there
/// is no cross-instrument locking on the append path.
///
/// The store accepts any identifier. Callers validate against the
/// configured InstrumentSet before touching it.
class WindowStore {
public:
  /// @param capacity Per-instrument window capacity
  /// @param num_shards Number of shards to partition instruments across
  /// @throws InvalidConfigError if capacity or num_shards is zero
  explicit WindowStore(std::size_t capacity, uint32_t num_shards = 16);

  /// Append to the instrument's window, creating it on first use
  Observation append(const std::string &instrument,
                     const Observation &observation, double previous_close);

  /// Current window oldest-first; empty for an instrument never observed
  std::vector<Observation> get(const std::string &instrument) const;

  /// Window plus reference line; empty snapshot for an unobserved instrument
  WindowSnapshot snapshot(const std::string &instrument) const;

  /// True once the instrument has at least one window
  bool contains(const std::string &instrument) const;

  /// Instruments that have a window, sorted
  std::vector<std::string> instruments() const;

  std::size_t capacity() const { return capacity_; }

  /// Get shard for a given instrument (consistent hashing)
  uint32_t get_shard_for_instrument(const std::string &instrument) const;

private:
  struct Shard {
    uint32_t shard_id;
    std::map<std::string, std::shared_ptr<PriceWindow>> windows;
    mutable std::mutex mutex;

    explicit Shard(uint32_t id) : shard_id(id) {}
  };

  std::shared_ptr<PriceWindow> find_window(const std::string &instrument) const;
  std::shared_ptr<PriceWindow>
  get_or_create_window(const std::string &instrument);

  /// Hash function for instrument -> shard mapping
  uint32_t hash_instrument(const std::string &instrument) const;

  std::size_t capacity_;
  uint32_t num_shards_;
  std::vector<std::unique_ptr<Shard>> shards_;
};

} // namespace pricewatch
