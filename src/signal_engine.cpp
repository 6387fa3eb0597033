#include "signal_engine.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>

namespace pricewatch {

void SignalPolicy::validate() const {
    if (!std::isfinite(crash_ratio) || crash_ratio <= 0.0 || crash_ratio > 1.0) {
        throw InvalidConfigError("crash_ratio must be in (0, 1]");
    }
}

Signals derive_signals(const std::vector<Observation>& samples,
                       const SignalPolicy& policy) {
    if (samples.empty()) {
        throw EmptyWindowError("cannot derive signals from an empty window");
    }

    const double first = samples.front().price;
    const double latest = samples.back().price;

    double peak = first;
    for (const auto& sample : samples) {
        peak = std::max(peak, sample.price);
    }

    Signals signals;
    signals.trend_up = latest >= first;
    signals.crash = latest < peak * policy.crash_ratio;

    if (signals.crash) {
        signals.color = SignalColor::ALERT;
    } else {
        signals.color = signals.trend_up ? SignalColor::UP : SignalColor::DOWN;
    }

    return signals;
}

} // namespace pricewatch
