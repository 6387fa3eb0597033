#include "price_window.hpp"
#include "errors.hpp"

namespace pricewatch {

PriceWindow::PriceWindow(const std::string& instrument, std::size_t capacity)
    : instrument_(instrument), capacity_(capacity), version_(0) {
    if (capacity_ == 0) {
        throw InvalidConfigError("window capacity must be > 0");
    }
}

Observation PriceWindow::append(const Observation& observation,
                                double previous_close) {
    std::lock_guard<std::mutex> lock(mutex_);

    Observation stored = observation;

    // Never let the clock reorder the series
    if (!samples_.empty() &&
        stored.timestamp_ms < samples_.back().timestamp_ms) {
        stored.timestamp_ms = samples_.back().timestamp_ms;
    }

    samples_.push_back(stored);
    while (samples_.size() > capacity_) {
        samples_.pop_front();
    }

    // Reference line is overwritten, never accumulated
    previous_close_ = previous_close;
    ++version_;

    return stored;
}

WindowSnapshot PriceWindow::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);

    WindowSnapshot snap;
    snap.instrument = instrument_;
    snap.samples.assign(samples_.begin(), samples_.end());
    snap.previous_close = previous_close_;
    snap.version = version_;
    return snap;
}

std::vector<Observation> PriceWindow::samples() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<Observation>(samples_.begin(), samples_.end());
}

std::optional<double> PriceWindow::previous_close() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return previous_close_;
}

std::size_t PriceWindow::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_.size();
}

bool PriceWindow::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_.empty();
}

uint64_t PriceWindow::version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return version_;
}

} // namespace pricewatch
