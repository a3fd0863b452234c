#include <qpricer/sqrt_unit.hpp>

namespace qpricer {

void SquareRootUnit::reset() {
    state_ = State::Idle;
    radicand_ = Fixed{};
    operand_ = 0;
    root_ = 0;
    bit_ = 0;
}

SquareRootPort::Outputs SquareRootUnit::tick(const Inputs& in) {
    Outputs out;

    switch (state_) {
    case State::Idle:
        if (!in.start) {
            break;
        }
        radicand_ = in.radicand;
        if (radicand_.is_negative()) {
            out.status.done = true;
            out.domain_error = true;
            return out;
        }
        operand_ = static_cast<std::uint64_t>(radicand_.raw()) << kFracBits;
        root_ = 0;
        bit_ = std::uint64_t{1} << (2 * kRootBits - 2);
        state_ = State::Calc;
        break;

    case State::Calc:
        if (operand_ >= root_ + bit_) {
            operand_ -= root_ + bit_;
            root_ = (root_ >> 1) + bit_;
        } else {
            root_ >>= 1;
        }
        bit_ >>= 2;
        if (bit_ == 0) {
            state_ = State::Finish;
        }
        break;

    case State::Finish:
        // operand_ now holds N - root^2; round up past root + 1/2.
        if (operand_ > root_) {
            ++root_;
        }
        state_ = State::Idle;
        out.status.done = true;
        out.status.valid = true;
        out.root = Fixed::from_raw(static_cast<std::int32_t>(root_));
        return out;
    }

    out.status.busy = state_ != State::Idle;
    return out;
}

} // namespace qpricer
