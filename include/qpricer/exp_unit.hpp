#pragma once

#include <array>
#include <cstdint>

#include <qpricer/fixed_point.hpp>
#include <qpricer/handshake.hpp>

namespace qpricer {

// Latency-1 multiplier lane. Operands issued on one tick appear, tagged, on
// the next.
class PipelinedMultiplier {
public:
    struct Result {
        Fixed product;
        int tag = 0;
        bool valid = false;
    };

    const Result& result() const { return result_; }

    void step(bool issue, Fixed a, Fixed b, int tag);
    void reset() { result_ = Result{}; }

private:
    Result result_;
};

// e^(-x) as sum_{k=0..7} (-x)^k / k!.
//
// Lane A builds x^2..x^7, one power per tick. Lane B scales each power by its
// signed coefficient on the tick after it leaves lane A. The eight terms are
// reduced by a three-level adder tree. Triggered by the rising edge of start.
// Truncation error stays below 1e-3 for |x| <= 1; larger |x| is an accepted
// accuracy limitation, not a fault.
class ExpUnit {
public:
    struct Inputs {
        bool start = false;
        Fixed x;
    };

    struct Outputs {
        UnitStatus status;
        Fixed result;
    };

    enum class State : std::uint8_t { Idle, Series, Sum1, Sum2, Sum3 };

    static constexpr int kTerms = 8;

    // (-1)^k / k! in Q16.16, k = 0..7.
    static constexpr std::array<Fixed, kTerms> kCoefficients = {
        Fixed::from_raw(65536),
        Fixed::from_raw(-65536),
        Fixed::from_raw(32768),
        Fixed::from_raw(-10923),
        Fixed::from_raw(2731),
        Fixed::from_raw(-546),
        Fixed::from_raw(91),
        Fixed::from_raw(-13),
    };

    Outputs tick(const Inputs& in);
    void reset();

    State state() const { return state_; }

private:
    State state_ = State::Idle;
    EdgeDetector start_edge_;
    PipelinedMultiplier lane_a_;
    PipelinedMultiplier lane_b_;

    Fixed x_;
    std::array<Fixed, kTerms> terms_{};
    std::array<Fixed, kTerms / 2> level1_{};
    std::array<Fixed, kTerms / 4> level2_{};
    Fixed result_;
};

} // namespace qpricer
