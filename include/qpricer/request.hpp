#pragma once

#include <cstdint>
#include <string_view>

#include <qpricer/fixed_point.hpp>

namespace qpricer {

enum class OptionType : std::uint8_t { Put = 0, Call = 1 };

// Latched on start, overwritten by the next start.
struct PipelineRequest {
    Fixed spot;
    Fixed strike;
    Fixed time;
    Fixed volatility;
    Fixed rate;
    OptionType type = OptionType::Call;
};

// How a completed request obtained its numbers.
enum class Outcome : std::uint8_t {
    Succeeded = 0,
    TimedOutWithDefaults = 1, // a watchdog substituted placeholder values
    CannedDefaults = 2        // the canned computation strategy was selected
};

std::string_view to_string(Outcome outcome);

// Keeps the most degraded of two outcomes.
Outcome worst_of(Outcome a, Outcome b);

} // namespace qpricer
