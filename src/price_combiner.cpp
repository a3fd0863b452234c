#include <qpricer/price_combiner.hpp>

namespace qpricer {

void PriceCombinerUnit::reset() {
    state_ = State::Idle;
    request_ = Inputs{};
    exp_.reset();
    exp_out_ = ExpUnit::Outputs{};
    rate_time_ = Fixed{};
    discount_ = Fixed{};
    spot_term_ = Fixed{};
    strike_term_ = Fixed{};
    price_ = Fixed{};
}

PriceCombinerPort::Outputs PriceCombinerUnit::tick(const Inputs& in) {
    Outputs out;
    bool exp_start = false;

    switch (state_) {
    case State::Idle:
        if (in.norm_done) {
            request_ = in;
            price_ = Fixed::zero();
            state_ = State::Discount;
        }
        break;

    case State::Discount:
        rate_time_ = request_.rate * request_.time;
        exp_start = true;
        state_ = State::WaitExp;
        break;

    case State::WaitExp:
        if (exp_out_.status.done) {
            discount_ = exp_out_.result;
            out.exp_done = true;
            state_ = State::Products;
        }
        break;

    case State::Products:
        if (request_.type == OptionType::Call) {
            spot_term_ = request_.spot * request_.nd1;
        } else {
            spot_term_ = request_.spot * (Fixed::one() - request_.nd1);
        }
        strike_term_ = request_.strike * discount_;
        state_ = State::Combine;
        break;

    case State::Combine:
        if (request_.type == OptionType::Call) {
            price_ = spot_term_ - strike_term_ * request_.nd2;
        } else {
            price_ = strike_term_ * (Fixed::one() - request_.nd2) - spot_term_;
        }
        state_ = State::Idle;
        out.status.done = true;
        out.status.valid = true;
        break;
    }

    exp_out_ = exp_.tick(ExpUnit::Inputs{exp_start, rate_time_});

    out.status.busy = state_ != State::Idle;
    out.exp_start = exp_start;
    out.price = price_;
    return out;
}

} // namespace qpricer
