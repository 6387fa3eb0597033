#include "zoom_state.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>

namespace pricewatch {

ZoomState::ZoomState(double min_factor, double max_factor)
    : min_factor_(min_factor), max_factor_(max_factor),
      factor_(DEFAULT_ZOOM_FACTOR) {
    if (!(min_factor_ > 0.0) || min_factor_ > DEFAULT_ZOOM_FACTOR ||
        max_factor_ < DEFAULT_ZOOM_FACTOR || !std::isfinite(max_factor_)) {
        throw InvalidConfigError("zoom bounds must satisfy 0 < min <= 1 <= max");
    }
}

double ZoomState::zoom_in() {
    return apply(ZOOM_IN_STEP);
}

double ZoomState::zoom_out() {
    return apply(ZOOM_OUT_STEP);
}

double ZoomState::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    factor_ = DEFAULT_ZOOM_FACTOR;
    return factor_;
}

double ZoomState::current_factor() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return factor_;
}

double ZoomState::apply(double step) {
    std::lock_guard<std::mutex> lock(mutex_);
    factor_ = std::clamp(factor_ * step, min_factor_, max_factor_);
    return factor_;
}

DisplayBounds compute_display_bounds(const std::vector<Observation>& samples,
                                     double factor) {
    if (samples.empty()) {
        throw EmptyWindowError("cannot compute display bounds of an empty window");
    }

    auto [lo_it, hi_it] = std::minmax_element(
        samples.begin(), samples.end(),
        [](const Observation& a, const Observation& b) { return a.price < b.price; });

    const double lo = lo_it->price;
    const double hi = hi_it->price;

    DisplayBounds bounds;
    if (hi > lo) {
        bounds.pad = (hi - lo) * RANGE_PAD_RATIO * factor;
    } else {
        bounds.pad = samples.back().price * FLAT_PAD_RATIO;
    }
    bounds.lower = lo - bounds.pad;
    bounds.upper = hi + bounds.pad;
    return bounds;
}

} // namespace pricewatch
