#pragma once

#include "config.hpp"
#include "instrument_set.hpp"
#include "publisher.hpp"
#include "quote_source.hpp"
#include "render_frame.hpp"
#include "window_store.hpp"
#include "zoom_state.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace pricewatch {

/// Source of observation timestamps (Unix ms)
using Clock = std::function<TimestampMs()>;

/// Wall-clock milliseconds since the Unix epoch
TimestampMs system_clock_ms();

/// Result of one tick for one instrument
struct TickOutcome {
  std::string instrument;
  TickStatus status{TickStatus::NO_DATA};
  std::optional<Observation> observation; // set when APPENDED
  std::optional<FetchError> error;        // set when FAILED
  TimestampMs completed_at_ms{0};
};

/**
 * Decides when to fetch quotes and commits them to the window store.
 *
 * Automatic mode runs a timer thread that fires every period (the first
 * firing is immediate) and hands one fetch per watched instrument to a
 * worker pool with at least one thread per configured instrument. Manual mode fetches only on trigger() or when a never
 * observed instrument is selected.
 *
 * At most one fetch per instrument is in flight; a tick arriving while one
 * is running is skipped. Each completed tick (appended or failed) publishes
 * a RenderFrame to every registered publisher before the instrument is
 * released, so one instrument's frames are published in version order.
 */
class RefreshScheduler {
public:
  /// @throws InvalidConfigError if the config does not validate
  RefreshScheduler(const SchedulerConfig &config,
                   const InstrumentSet &instruments, WindowStore &store,
                   QuoteSource &source, ZoomState &zoom,
                   Clock now_ms = system_clock_ms);

  ~RefreshScheduler();

  RefreshScheduler(const RefreshScheduler &) = delete;
  RefreshScheduler &operator=(const RefreshScheduler &) = delete;

  /// Start the timer thread and worker pool (automatic mode only). The pool
  /// has max(worker_threads, instrument count) threads so a hung fetch for
  /// one instrument never delays another instrument's tick.
  void start();

  /// Stop and join all threads; queued fetches are dropped. Idempotent.
  void stop();

  bool is_running() const { return running_; }

  /// Fetch now for one instrument, on the calling thread
  /// @throws UnknownInstrumentError
  TickOutcome trigger(const std::string &instrument);

  /// Make the instrument the only watched one. An instrument that has never
  /// been observed gets a bootstrap fetch: synchronous in manual mode (the
  /// outcome is returned), queued to the pool in automatic mode while running.
  /// @throws UnknownInstrumentError
  std::optional<TickOutcome> select(const std::string &instrument);

  /// Add a display target; automatic ticks include it from the next firing
  /// @throws UnknownInstrumentError
  void watch(const std::string &instrument);

  /// Remove a display target. A fetch already in flight still commits.
  /// @throws UnknownInstrumentError
  void unwatch(const std::string &instrument);

  std::vector<std::string> watched() const;
  std::optional<std::string> selected() const;

  /// Frame for the last-known window of an instrument
  /// @throws UnknownInstrumentError
  RenderFrame frame(const std::string &instrument) const;

  /// @throws UnknownInstrumentError
  TickState state(const std::string &instrument) const;

  /// @throws UnknownInstrumentError
  std::optional<TickOutcome> last_outcome(const std::string &instrument) const;

  void add_publisher(std::shared_ptr<FramePublisher> publisher);

  /// Enqueue one fetch per watched instrument, as a timer firing does.
  /// Only enqueues in automatic mode while running.
  /// @return Number of fetches enqueued
  std::size_t fire_tick();

  /// Ticks skipped because a fetch for the instrument was in flight
  uint64_t skipped_ticks() const { return skipped_ticks_; }

  /// Worker threads currently running (zero unless started in automatic mode)
  std::size_t worker_count() const { return worker_threads_.size(); }

  const SchedulerConfig &config() const { return config_; }

private:
  struct Slot {
    std::atomic<bool> fetching{false};
    mutable std::mutex mutex;
    std::optional<TickOutcome> last;
  };

  std::size_t pool_size() const;
  Slot &slot_for(const std::string &instrument) const;
  bool is_watched(const std::string &instrument) const;

  /// Claim the in-flight flag; false (and logged) when already claimed
  bool try_claim(const std::string &instrument, Slot &slot);
  TickOutcome skipped_outcome(const std::string &instrument) const;
  bool enqueue(const std::string &instrument);

  /// Fetch, commit and publish. The slot must already be claimed.
  TickOutcome execute(const std::string &instrument, Slot &slot);
  FetchResult fetch_quote(const std::string &instrument);
  void publish(const RenderFrame &frame);

  void timer_loop();
  void worker_loop();

  SchedulerConfig config_;
  InstrumentSet instruments_;
  WindowStore &store_;
  QuoteSource &source_;
  ZoomState &zoom_;
  Clock now_ms_;

  std::map<std::string, std::unique_ptr<Slot>> slots_;

  mutable std::mutex watch_mutex_;
  std::vector<std::string> watched_;
  std::optional<std::string> selected_;

  mutable std::mutex publishers_mutex_;
  std::vector<std::shared_ptr<FramePublisher>> publishers_;

  std::atomic<bool> running_;
  std::atomic<uint64_t> skipped_ticks_;

  std::thread timer_thread_;
  std::mutex timer_mutex_;
  std::condition_variable timer_cv_;

  std::vector<std::thread> worker_threads_;
  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::deque<std::string> queue_;
};

} // namespace pricewatch
