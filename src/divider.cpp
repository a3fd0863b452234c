#include <qpricer/divider.hpp>

#include <spdlog/spdlog.h>

namespace qpricer {

namespace {

constexpr std::uint64_t kMaxMagnitude = static_cast<std::uint64_t>(INT32_MAX);

std::uint64_t magnitude(Fixed value) {
    const std::int64_t raw = value.raw();
    return static_cast<std::uint64_t>(raw < 0 ? -raw : raw);
}

} // namespace

void DividerUnit::reset() {
    *this = DividerUnit{};
}

DividerUnit::Outputs DividerUnit::finish_error(bool dbz, bool ovf) {
    state_ = State::Idle;
    Outputs out;
    out.status.done = true;
    out.status.valid = false;
    out.quotient = Fixed::max();
    out.dbz = dbz;
    out.ovf = ovf;
    spdlog::debug("divider: {} / {} rejected (dbz={}, ovf={})",
                  dividend_.to_real(),
                  divisor_.to_real(),
                  dbz,
                  ovf);
    return out;
}

DividerUnit::Outputs DividerUnit::tick(const Inputs& in) {
    Outputs out;

    switch (state_) {
    case State::Idle:
        if (in.start) {
            dividend_ = in.dividend;
            divisor_ = in.divisor;
            state_ = State::Init;
        }
        break;

    case State::Init: {
        const bool dbz = divisor_.raw() == 0;
        const bool ovf = dividend_.is_min() || divisor_.is_min();
        if (dbz || ovf) {
            return finish_error(dbz, ovf);
        }

        negative_ = dividend_.is_negative() != divisor_.is_negative();
        divisor_mag_ = magnitude(divisor_);

        // The numerator is |a| << kFracBits. Its top kIntBits bits seed the
        // remainder; the rest are brought down one per iteration.
        const std::uint64_t dividend_mag = magnitude(dividend_);
        remainder_ = dividend_mag >> kIntBits;
        low_bits_ = static_cast<std::uint32_t>((dividend_mag & 0xFFFFU) << kFracBits);
        if (remainder_ >= divisor_mag_) {
            return finish_error(false, true);
        }

        quotient_ = 0;
        iteration_ = 0;
        calc_ticks_ = 0;
        state_ = State::Calc;
        break;
    }

    case State::Calc:
        if (++calc_ticks_ > kCalcWatchdog) {
            spdlog::warn("divider: calc watchdog expired after {} ticks", calc_ticks_);
            return finish_error(false, true);
        }

        remainder_ = (remainder_ << 1) | (low_bits_ >> 31);
        low_bits_ <<= 1;
        quotient_ <<= 1;
        if (remainder_ >= divisor_mag_) {
            remainder_ -= divisor_mag_;
            quotient_ |= 1U;
        }
        ++iteration_;

        // Lower bound on the final quotient; abort as soon as it cannot fit.
        if ((quotient_ << (kIterations - iteration_)) > kMaxMagnitude) {
            return finish_error(false, true);
        }
        if (iteration_ == kIterations) {
            state_ = State::Round;
        }
        break;

    case State::Round:
        // Next discarded bit is set when twice the remainder reaches the divisor.
        if ((remainder_ << 1) >= divisor_mag_) {
            ++quotient_;
        }
        if (quotient_ > kMaxMagnitude) {
            return finish_error(false, true);
        }
        state_ = State::Sign;
        break;

    case State::Sign: {
        const std::int64_t signed_quotient = negative_ ? -static_cast<std::int64_t>(quotient_)
                                                       : static_cast<std::int64_t>(quotient_);
        state_ = State::Idle;
        out.status.done = true;
        out.status.valid = true;
        out.quotient = Fixed::from_raw(static_cast<std::int32_t>(signed_quotient));
        return out;
    }
    }

    out.status.busy = state_ != State::Idle;
    return out;
}

} // namespace qpricer
