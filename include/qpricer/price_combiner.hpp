#pragma once

#include <cstdint>

#include <qpricer/exp_unit.hpp>
#include <qpricer/ports.hpp>

namespace qpricer {

// call = S N(d1) - K e^(-rT) N(d2)
// put  = K e^(-rT) (1 - N(d2)) - S (1 - N(d1))
// The discount factor comes from an owned ExpUnit.
class PriceCombinerUnit final : public PriceCombinerPort {
public:
    Outputs tick(const Inputs& in) override;
    void reset() override;

private:
    enum class State : std::uint8_t { Idle, Discount, WaitExp, Products, Combine };

    State state_ = State::Idle;
    Inputs request_;
    ExpUnit exp_;
    ExpUnit::Outputs exp_out_;

    Fixed rate_time_;
    Fixed discount_;
    Fixed spot_term_;
    Fixed strike_term_;
    Fixed price_;
};

} // namespace qpricer
