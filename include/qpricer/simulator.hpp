#pragma once

#include <cstdint>

#include <qpricer/fixed_point.hpp>
#include <qpricer/request.hpp>
#include <qpricer/top_orchestrator.hpp>

namespace qpricer {

struct PricingResult {
    Fixed price;
    Fixed d1;
    Fixed d2;
    Outcome outcome = Outcome::Succeeded;
    std::uint64_t ticks = 0; // including the start tick
};

// Throws std::invalid_argument for non-finite inputs.
PipelineRequest make_request(double spot,
                             double strike,
                             double time_to_maturity,
                             double volatility,
                             double rate,
                             OptionType type);

// Pulses start once and ticks until done. Throws std::runtime_error if done
// does not arrive within max_ticks.
PricingResult run_request(TopOrchestrator& top,
                          const PipelineRequest& request,
                          std::uint64_t max_ticks);

} // namespace qpricer
