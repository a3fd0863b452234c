#pragma once

#include <cstdint>

#include <qpricer/fixed_point.hpp>
#include <qpricer/handshake.hpp>

namespace qpricer {

// ln(x) = e*ln2 + ln(m), m in [1,2), with ln(1+t) ~ t - t^2/2 + t^3/3.
//
// The cubic is accurate near t = 0 and degrades toward t = 1 (about 0.14 at
// m -> 2). Results for mantissas within 1/8 of a power of two are within 1e-3.
// valid is held for two ticks.
class LogUnit {
public:
    struct Inputs {
        bool start = false;
        Fixed x;
    };

    struct Outputs {
        UnitStatus status;
        Fixed result;
        bool domain_error = false; // x <= 0; result is Fixed::min()
    };

    enum class State : std::uint8_t { Idle, Normalize, Compute1, Compute2, Compute3, Hold };

    static constexpr int kHoldTicks = 2;
    static constexpr Fixed kLn2 = Fixed::from_raw(45426);      // 0.693147
    static constexpr Fixed kOneThird = Fixed::from_raw(21845); // 0.333328

    Outputs tick(const Inputs& in);
    void reset();

    State state() const { return state_; }

private:
    State state_ = State::Idle;
    Fixed x_;
    int exponent_ = 0;
    Fixed mantissa_;
    Fixed t_;
    Fixed t2_;
    Fixed t3_;
    Fixed half_t2_;
    Fixed poly_;
    Fixed result_;
    bool domain_error_ = false;
    int hold_ = 0;
};

} // namespace qpricer
