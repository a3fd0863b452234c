#pragma once

#include <cstdint>
#include <string_view>

namespace qpricer {

enum class ComputeStrategy : std::uint8_t {
    Hardware = 0,      // drive the divider, log and square-root units
    CannedDefaults = 1 // skip them; ratio = root = 1.0, log = 0.0
};

enum class CompletionPolicy : std::uint8_t {
    ExplicitValid = 0, // wait for the combiner's valid pulse
    SettledNonZero = 1 // wait for a non-zero price on settle_ticks consecutive ticks
};

struct PipelineConfig {
    std::uint32_t watchdog_ticks = 200;
    std::uint32_t request_timeout_ticks = 1000;
    std::uint32_t settle_ticks = 2;
    ComputeStrategy strategy = ComputeStrategy::Hardware;
    CompletionPolicy completion = CompletionPolicy::ExplicitValid;

    // Throws std::invalid_argument on an unusable combination.
    void validate() const;
};

std::string_view to_string(ComputeStrategy strategy);
std::string_view to_string(CompletionPolicy policy);

} // namespace qpricer
