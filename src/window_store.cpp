#include "window_store.hpp"
#include "errors.hpp"

#include <algorithm>

namespace pricewatch {

WindowStore::WindowStore(std::size_t capacity, uint32_t num_shards)
    : capacity_(capacity), num_shards_(num_shards) {
    if (capacity_ == 0) {
        throw InvalidConfigError("window capacity must be > 0");
    }
    if (num_shards_ == 0) {
        throw InvalidConfigError("num_shards must be > 0");
    }

    shards_.reserve(num_shards_);
    for (uint32_t i = 0; i < num_shards_; ++i) {
        shards_.push_back(std::make_unique<Shard>(i));
    }
}

Observation WindowStore::append(const std::string& instrument,
                                const Observation& observation,
                                double previous_close) {
    auto window = get_or_create_window(instrument);
    return window->append(observation, previous_close);
}

std::vector<Observation> WindowStore::get(const std::string& instrument) const {
    auto window = find_window(instrument);
    if (!window) {
        return {};
    }
    return window->samples();
}

WindowSnapshot WindowStore::snapshot(const std::string& instrument) const {
    auto window = find_window(instrument);
    if (!window) {
        WindowSnapshot empty;
        empty.instrument = instrument;
        return empty;
    }
    return window->snapshot();
}

bool WindowStore::contains(const std::string& instrument) const {
    return find_window(instrument) != nullptr;
}

std::vector<std::string> WindowStore::instruments() const {
    std::vector<std::string> result;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        for (const auto& [instrument, window] : shard->windows) {
            result.push_back(instrument);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::shared_ptr<PriceWindow>
WindowStore::find_window(const std::string& instrument) const {
    const auto& shard = shards_[get_shard_for_instrument(instrument)];
    std::lock_guard<std::mutex> lock(shard->mutex);

    auto it = shard->windows.find(instrument);
    if (it == shard->windows.end()) {
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<PriceWindow>
WindowStore::get_or_create_window(const std::string& instrument) {
    auto& shard = shards_[get_shard_for_instrument(instrument)];
    std::lock_guard<std::mutex> lock(shard->mutex);

    auto it = shard->windows.find(instrument);
    if (it != shard->windows.end()) {
        return it->second;
    }

    auto window = std::make_shared<PriceWindow>(instrument, capacity_);
    shard->windows[instrument] = window;
    return window;
}

uint32_t WindowStore::get_shard_for_instrument(const std::string& instrument) const {
    return hash_instrument(instrument) % num_shards_;
}

uint32_t WindowStore::hash_instrument(const std::string& instrument) const {
    // FNV-1a keeps shard assignment stable across runs
    uint32_t hash = 2166136261u;
    for (char c : instrument) {
        hash ^= static_cast<uint32_t>(static_cast<unsigned char>(c));
        hash *= 16777619u;
    }
    return hash;
}

} // namespace pricewatch
