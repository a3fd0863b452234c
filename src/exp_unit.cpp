#include <qpricer/exp_unit.hpp>

namespace qpricer {

void PipelinedMultiplier::step(bool issue, Fixed a, Fixed b, int tag) {
    result_.valid = issue;
    result_.tag = issue ? tag : 0;
    result_.product = issue ? a * b : Fixed::zero();
}

void ExpUnit::reset() {
    *this = ExpUnit{};
}

ExpUnit::Outputs ExpUnit::tick(const Inputs& in) {
    Outputs out;
    const bool triggered = start_edge_.sample(in.start);

    switch (state_) {
    case State::Idle:
        if (triggered) {
            x_ = in.x;
            terms_.fill(Fixed::zero());
            terms_[0] = kCoefficients[0];
            terms_[1] = -x_;
            lane_a_.step(true, x_, x_, 2);
            lane_b_.step(false, Fixed::zero(), Fixed::zero(), 0);
            state_ = State::Series;
        }
        break;

    case State::Series: {
        const PipelinedMultiplier::Result a = lane_a_.result();
        const PipelinedMultiplier::Result b = lane_b_.result();

        bool issue_a = false;
        bool issue_b = false;
        Fixed power;
        int power_tag = 0;
        if (a.valid) {
            power = a.product;
            power_tag = a.tag;
            issue_b = true;
            issue_a = a.tag < kTerms - 1;
        }
        if (b.valid) {
            terms_[static_cast<std::size_t>(b.tag)] = b.product;
        }

        lane_a_.step(issue_a, power, x_, power_tag + 1);
        lane_b_.step(issue_b, power, kCoefficients[static_cast<std::size_t>(power_tag)], power_tag);

        if (b.valid && b.tag == kTerms - 1) {
            state_ = State::Sum1;
        }
        break;
    }

    case State::Sum1:
        for (std::size_t i = 0; i < level1_.size(); ++i) {
            level1_[i] = terms_[2 * i] + terms_[2 * i + 1];
        }
        state_ = State::Sum2;
        break;

    case State::Sum2:
        for (std::size_t i = 0; i < level2_.size(); ++i) {
            level2_[i] = level1_[2 * i] + level1_[2 * i + 1];
        }
        state_ = State::Sum3;
        break;

    case State::Sum3:
        result_ = level2_[0] + level2_[1];
        state_ = State::Idle;
        out.status.done = true;
        out.status.valid = true;
        out.result = result_;
        return out;
    }

    out.status.busy = state_ != State::Idle;
    return out;
}

} // namespace qpricer
