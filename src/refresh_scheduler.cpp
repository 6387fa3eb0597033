#include "refresh_scheduler.hpp"
#include "errors.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>

namespace pricewatch {

TimestampMs system_clock_ms() {
    auto now = std::chrono::system_clock::now();
    return static_cast<TimestampMs>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count());
}

// ============================================================================
// Lifecycle
// ============================================================================

RefreshScheduler::RefreshScheduler(const SchedulerConfig& config,
                                   const InstrumentSet& instruments,
                                   WindowStore& store, QuoteSource& source,
                                   ZoomState& zoom, Clock now_ms)
    : config_(config), instruments_(instruments), store_(store),
      source_(source), zoom_(zoom), now_ms_(std::move(now_ms)),
      running_(false), skipped_ticks_(0) {
    config_.validate();
    if (!now_ms_) {
        throw InvalidConfigError("clock must be callable");
    }

    for (const auto& instrument : instruments_.list()) {
        slots_.emplace(instrument, std::make_unique<Slot>());
    }

    // Start out displaying the first configured instrument
    selected_ = instruments_.list().front();
    watched_.push_back(*selected_);
}

RefreshScheduler::~RefreshScheduler() {
    stop();
}

void RefreshScheduler::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return; // Already running
    }

    if (config_.mode == RefreshMode::AUTOMATIC) {
        std::size_t workers = pool_size();
        worker_threads_.reserve(workers);
        for (std::size_t i = 0; i < workers; ++i) {
            worker_threads_.emplace_back([this]() { worker_loop(); });
        }
        timer_thread_ = std::thread([this]() { timer_loop(); });
    }

    if (config_.verbose) {
        std::cout << "RefreshScheduler started mode=" << to_string(config_.mode)
                  << " period_ms=" << config_.period.count()
                  << " workers=" << worker_threads_.size() << "\n";
    }
}

void RefreshScheduler::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        return; // Already stopped
    }

    // Take each lock once so a waiter cannot miss the running_ change
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
    }
    timer_cv_.notify_all();
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
    }
    queue_cv_.notify_all();

    if (timer_thread_.joinable()) {
        timer_thread_.join();
    }
    for (auto& thread : worker_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    worker_threads_.clear();

    // Drop fetches that never started and release their claims
    std::deque<std::string> dropped;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        dropped.swap(queue_);
    }
    for (const auto& instrument : dropped) {
        slot_for(instrument).fetching = false;
    }

    if (config_.verbose) {
        std::cout << "RefreshScheduler stopped\n";
    }
}

// ============================================================================
// Commands
// ============================================================================

TickOutcome RefreshScheduler::trigger(const std::string& instrument) {
    instruments_.require(instrument);
    Slot& slot = slot_for(instrument);

    if (!try_claim(instrument, slot)) {
        return skipped_outcome(instrument);
    }
    return execute(instrument, slot);
}

std::optional<TickOutcome>
RefreshScheduler::select(const std::string& instrument) {
    instruments_.require(instrument);

    {
        std::lock_guard<std::mutex> lock(watch_mutex_);
        watched_.assign(1, instrument);
        selected_ = instrument;
    }

    if (store_.contains(instrument)) {
        return std::nullopt;
    }

    if (config_.mode == RefreshMode::AUTOMATIC && running_) {
        enqueue(instrument);
        return std::nullopt;
    }
    return trigger(instrument);
}

void RefreshScheduler::watch(const std::string& instrument) {
    instruments_.require(instrument);

    std::lock_guard<std::mutex> lock(watch_mutex_);
    if (std::find(watched_.begin(), watched_.end(), instrument) ==
        watched_.end()) {
        watched_.push_back(instrument);
    }
}

void RefreshScheduler::unwatch(const std::string& instrument) {
    instruments_.require(instrument);

    std::lock_guard<std::mutex> lock(watch_mutex_);
    watched_.erase(std::remove(watched_.begin(), watched_.end(), instrument),
                   watched_.end());
    if (selected_ && *selected_ == instrument) {
        selected_.reset();
    }
}

std::vector<std::string> RefreshScheduler::watched() const {
    std::lock_guard<std::mutex> lock(watch_mutex_);
    return watched_;
}

std::optional<std::string> RefreshScheduler::selected() const {
    std::lock_guard<std::mutex> lock(watch_mutex_);
    return selected_;
}

// ============================================================================
// Queries
// ============================================================================

RenderFrame RefreshScheduler::frame(const std::string& instrument) const {
    instruments_.require(instrument);
    const Slot& slot = slot_for(instrument);

    TickStatus status = TickStatus::NO_DATA;
    std::optional<FetchError> error;
    TimestampMs completed_at = 0;
    {
        std::lock_guard<std::mutex> lock(slot.mutex);
        if (slot.last) {
            status = slot.last->status;
            error = slot.last->error;
            completed_at = slot.last->completed_at_ms;
        }
    }

    return build_frame(store_.snapshot(instrument), zoom_.current_factor(),
                       config_.policy, status, completed_at, error);
}

TickState RefreshScheduler::state(const std::string& instrument) const {
    instruments_.require(instrument);
    if (slot_for(instrument).fetching) {
        return TickState::FETCHING;
    }
    return config_.mode == RefreshMode::MANUAL ? TickState::AWAITING_TRIGGER
                                               : TickState::IDLE;
}

std::optional<TickOutcome>
RefreshScheduler::last_outcome(const std::string& instrument) const {
    instruments_.require(instrument);
    const Slot& slot = slot_for(instrument);
    std::lock_guard<std::mutex> lock(slot.mutex);
    return slot.last;
}

void RefreshScheduler::add_publisher(std::shared_ptr<FramePublisher> publisher) {
    if (!publisher) {
        throw std::invalid_argument("publisher must not be null");
    }
    std::lock_guard<std::mutex> lock(publishers_mutex_);
    publishers_.push_back(std::move(publisher));
}

std::size_t RefreshScheduler::fire_tick() {
    std::size_t enqueued = 0;
    for (const auto& instrument : watched()) {
        if (enqueue(instrument)) {
            ++enqueued;
        }
    }
    return enqueued;
}

// ============================================================================
// Tick execution
// ============================================================================

std::size_t RefreshScheduler::pool_size() const {
    // Every claimed instrument is either queued or on a worker. With at least
    // one worker per instrument a queued fetch always finds an idle worker,
    // however many other fetches are hung.
    return std::max<std::size_t>(config_.worker_threads, instruments_.size());
}

RefreshScheduler::Slot&
RefreshScheduler::slot_for(const std::string& instrument) const {
    return *slots_.at(instrument);
}

bool RefreshScheduler::is_watched(const std::string& instrument) const {
    std::lock_guard<std::mutex> lock(watch_mutex_);
    return std::find(watched_.begin(), watched_.end(), instrument) !=
           watched_.end();
}

bool RefreshScheduler::try_claim(const std::string& instrument, Slot& slot) {
    bool expected = false;
    if (slot.fetching.compare_exchange_strong(expected, true)) {
        return true;
    }

    ++skipped_ticks_;
    if (config_.verbose) {
        std::cout << "[SKIP] instrument=" << instrument
                  << " reason=fetch in flight\n";
    }
    return false;
}

TickOutcome RefreshScheduler::skipped_outcome(const std::string& instrument) const {
    TickOutcome outcome;
    outcome.instrument = instrument;
    outcome.status = TickStatus::SKIPPED;
    outcome.completed_at_ms = now_ms_();
    return outcome;
}

bool RefreshScheduler::enqueue(const std::string& instrument) {
    if (config_.mode != RefreshMode::AUTOMATIC || !running_) {
        return false; // No workers to run it
    }

    Slot& slot = slot_for(instrument);
    if (!try_claim(instrument, slot)) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_) {
            slot.fetching = false;
            return false;
        }
        queue_.push_back(instrument);
    }
    queue_cv_.notify_one();
    return true;
}

FetchResult RefreshScheduler::fetch_quote(const std::string& instrument) {
    try {
        return source_.fetch(instrument);
    } catch (const std::exception& ex) {
        return FetchResult::failure(std::string("quote source error: ") +
                                    ex.what());
    }
}

TickOutcome RefreshScheduler::execute(const std::string& instrument, Slot& slot) {
    FetchResult result = fetch_quote(instrument);

    TickOutcome outcome;
    outcome.instrument = instrument;

    if (result.ok() && is_valid_quote(result.quote())) {
        const Quote& quote = result.quote();
        Observation stored = store_.append(
            instrument, Observation(now_ms_(), quote.last_price),
            quote.previous_close);
        outcome.status = TickStatus::APPENDED;
        outcome.observation = stored;

        if (config_.verbose) {
            std::cout << "[TICK] instrument=" << instrument
                      << " ts=" << stored.timestamp_ms
                      << " price=" << stored.price
                      << " prev_close=" << quote.previous_close << "\n";
        }
    } else {
        outcome.status = TickStatus::FAILED;
        outcome.error = result.ok()
            ? FetchError{ErrorKind::QUOTE_FETCH_FAILED,
                         "quote has non-positive prices"}
            : result.error();

        if (config_.verbose) {
            std::cout << "[FAIL] instrument=" << instrument
                      << " error=\"" << outcome.error->message << "\"\n";
        }
    }
    outcome.completed_at_ms = now_ms_();

    {
        std::lock_guard<std::mutex> lock(slot.mutex);
        slot.last = outcome;
    }

    RenderFrame frame = build_frame(store_.snapshot(instrument),
                                    zoom_.current_factor(), config_.policy,
                                    outcome.status, outcome.completed_at_ms,
                                    outcome.error);

    // The claim covers publishing too, so frames for one instrument reach
    // publishers in version order.
    publish(frame);
    slot.fetching = false;
    return outcome;
}

void RefreshScheduler::publish(const RenderFrame& frame) {
    std::vector<std::shared_ptr<FramePublisher>> publishers;
    {
        std::lock_guard<std::mutex> lock(publishers_mutex_);
        publishers = publishers_;
    }

    for (auto& publisher : publishers) {
        try {
            publisher->publish(frame);
        } catch (const std::exception& ex) {
            std::cerr << "frame publish failed for " << frame.instrument
                      << ": " << ex.what() << "\n";
        }
    }
}

// ============================================================================
// Threads
// ============================================================================

void RefreshScheduler::timer_loop() {
    std::unique_lock<std::mutex> lock(timer_mutex_);
    while (running_) {
        lock.unlock();
        fire_tick();
        lock.lock();

        timer_cv_.wait_for(lock, config_.period, [this]() { return !running_; });
    }
}

void RefreshScheduler::worker_loop() {
    while (true) {
        std::string instrument;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]() { return !running_ || !queue_.empty(); });
            if (!running_) {
                return;
            }
            instrument = queue_.front();
            queue_.pop_front();
        }

        Slot& slot = slot_for(instrument);
        if (!is_watched(instrument)) {
            // Unwatched after it was queued
            slot.fetching = false;
            continue;
        }
        execute(instrument, slot);
    }
}

} // namespace pricewatch
