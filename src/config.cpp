#include <qpricer/config.hpp>

#include <stdexcept>

namespace qpricer {

void PipelineConfig::validate() const {
    if (watchdog_ticks == 0) {
        throw std::invalid_argument("watchdog_ticks must be positive");
    }
    if (request_timeout_ticks <= watchdog_ticks) {
        throw std::invalid_argument("request_timeout_ticks must exceed watchdog_ticks");
    }
    if (settle_ticks == 0) {
        throw std::invalid_argument("settle_ticks must be positive");
    }
}

std::string_view to_string(ComputeStrategy strategy) {
    switch (strategy) {
    case ComputeStrategy::Hardware:
        return "hardware";
    case ComputeStrategy::CannedDefaults:
        return "canned-defaults";
    }
    return "unknown";
}

std::string_view to_string(CompletionPolicy policy) {
    switch (policy) {
    case CompletionPolicy::ExplicitValid:
        return "explicit-valid";
    case CompletionPolicy::SettledNonZero:
        return "settled-non-zero";
    }
    return "unknown";
}

} // namespace qpricer
