#include <qpricer/simulator.hpp>

#include <stdexcept>
#include <string>

namespace qpricer {

PipelineRequest make_request(double spot,
                             double strike,
                             double time_to_maturity,
                             double volatility,
                             double rate,
                             OptionType type) {
    PipelineRequest request;
    request.spot = Fixed::from_real(spot);
    request.strike = Fixed::from_real(strike);
    request.time = Fixed::from_real(time_to_maturity);
    request.volatility = Fixed::from_real(volatility);
    request.rate = Fixed::from_real(rate);
    request.type = type;
    return request;
}

PricingResult run_request(TopOrchestrator& top,
                          const PipelineRequest& request,
                          std::uint64_t max_ticks) {
    if (max_ticks == 0) {
        throw std::invalid_argument("run_request requires a positive tick limit");
    }

    TopOrchestrator::Inputs in;
    in.start = true;
    in.request = request;

    for (std::uint64_t tick = 1; tick <= max_ticks; ++tick) {
        const TopOrchestrator::Outputs out = top.tick(in);
        in.start = false;
        if (out.status.done) {
            PricingResult result;
            result.price = out.price;
            result.d1 = out.d1;
            result.d2 = out.d2;
            result.outcome = out.outcome;
            result.ticks = tick;
            return result;
        }
    }

    throw std::runtime_error("pipeline did not assert done within " + std::to_string(max_ticks) + " ticks");
}

} // namespace qpricer
