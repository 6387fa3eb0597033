#include "instrument_set.hpp"
#include "errors.hpp"

namespace pricewatch {

InstrumentSet::InstrumentSet(const std::vector<std::string>& instruments) {
    for (const auto& instrument : instruments) {
        if (instrument.empty()) {
            throw InvalidConfigError("instrument identifier must not be empty");
        }
        if (lookup_.insert(instrument).second) {
            ordered_.push_back(instrument);
        }
    }

    if (ordered_.empty()) {
        throw InvalidConfigError("instrument set must not be empty");
    }
}

bool InstrumentSet::contains(const std::string& instrument) const {
    return lookup_.count(instrument) > 0;
}

void InstrumentSet::require(const std::string& instrument) const {
    if (!contains(instrument)) {
        throw UnknownInstrumentError(instrument);
    }
}

} // namespace pricewatch
