#include <qpricer/log_unit.hpp>

#include <bit>

namespace qpricer {

void LogUnit::reset() {
    *this = LogUnit{};
}

LogUnit::Outputs LogUnit::tick(const Inputs& in) {
    Outputs out;

    switch (state_) {
    case State::Idle:
        if (in.start) {
            x_ = in.x;
            state_ = State::Normalize;
        }
        break;

    case State::Normalize: {
        if (x_.raw() <= 0) {
            domain_error_ = true;
            result_ = Fixed::min();
            hold_ = 0;
            state_ = State::Hold;
            break;
        }
        domain_error_ = false;

        const auto bits = static_cast<std::uint32_t>(x_.raw());
        const int msb = std::bit_width(bits) - 1;
        exponent_ = msb - kFracBits;

        std::uint32_t mantissa = 0;
        if (exponent_ > 0) {
            const std::uint32_t round = std::uint32_t{1} << (exponent_ - 1);
            mantissa = (bits + round) >> exponent_;
        } else {
            mantissa = bits << (-exponent_);
        }
        // Rounding up can carry the mantissa to exactly 2.0.
        if (mantissa == (std::uint32_t{2} << kFracBits)) {
            mantissa >>= 1;
            ++exponent_;
        }
        mantissa_ = Fixed::from_raw(static_cast<std::int32_t>(mantissa));
        state_ = State::Compute1;
        break;
    }

    case State::Compute1:
        t_ = mantissa_ - Fixed::one();
        t2_ = t_ * t_;
        state_ = State::Compute2;
        break;

    case State::Compute2:
        t3_ = t2_ * t_;
        half_t2_ = t2_.half();
        state_ = State::Compute3;
        break;

    case State::Compute3:
        poly_ = t_ - half_t2_ + t3_ * kOneThird;
        hold_ = 0;
        state_ = State::Hold;
        break;

    case State::Hold:
        if (hold_ == 0 && !domain_error_) {
            result_ = poly_ + Fixed::from_raw(exponent_ * kLn2.raw());
        }
        out.status.done = true;
        out.status.valid = !domain_error_;
        out.result = result_;
        out.domain_error = domain_error_;
        if (++hold_ == kHoldTicks) {
            state_ = State::Idle;
        }
        break;
    }

    out.status.busy = state_ != State::Idle;
    return out;
}

} // namespace qpricer
