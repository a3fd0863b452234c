#include <qpricer/top_orchestrator.hpp>

#include <utility>

#include <qpricer/norm_cdf_unit.hpp>
#include <qpricer/price_combiner.hpp>

#include <spdlog/spdlog.h>

namespace qpricer {

TopOrchestrator::TopOrchestrator(PipelineConfig config, Collaborators collaborators)
    : config_(config),
      d1d2_(config, std::move(collaborators.sqrt)),
      norm_(std::move(collaborators.norm)),
      combiner_(std::move(collaborators.combiner)) {
    if (!norm_) {
        norm_ = std::make_unique<NormalCdfUnit>();
    }
    if (!combiner_) {
        combiner_ = std::make_unique<PriceCombinerUnit>();
    }
}

void TopOrchestrator::reset() {
    d1d2_.reset();
    norm_->reset();
    combiner_->reset();
    d1d2_out_ = D1D2Orchestrator::Outputs{};
    norm_out_ = NormalCdfPort::Outputs{};
    combiner_out_ = PriceCombinerPort::Outputs{};

    state_ = State::WaitStart;
    request_ = PipelineRequest{};
    outcome_ = Outcome::Succeeded;
    d1_ = d2_ = nd1_ = nd2_ = Fixed{};
    price_ = Fixed{};
    combiner_engaged_ = false;
    elapsed_ = 0;
    settled_ = 0;
}

TopOrchestrator::Outputs TopOrchestrator::finish(Fixed price, Outcome outcome) {
    state_ = State::WaitStart;
    combiner_engaged_ = false;
    Outputs out;
    out.status.done = true;
    out.status.valid = outcome == Outcome::Succeeded;
    out.price = price;
    out.d1 = d1_;
    out.d2 = d2_;
    out.outcome = outcome;
    spdlog::debug("top: done after {} ticks, price={} ({})", elapsed_, price.to_real(), to_string(outcome));
    return out;
}

TopOrchestrator::Outputs TopOrchestrator::tick(const Inputs& in) {
    if (in.reset) {
        reset();
        return Outputs{};
    }

    Outputs out;
    bool completed = false;
    bool d1d2_start = false;
    bool norm_start = false;
    bool norm_done = false;

    if (combiner_engaged_) {
        price_ = combiner_out_.price;
    }

    if (in.start && state_ != State::WaitStart) {
        spdlog::warn("top: start ignored while a request is in flight");
    }

    switch (state_) {
    case State::WaitStart:
        if (in.start) {
            request_ = in.request;
            outcome_ = Outcome::Succeeded;
            price_ = Fixed::zero();
            combiner_engaged_ = false;
            elapsed_ = 0;
            settled_ = 0;
            d1d2_start = true;
            state_ = State::WaitNormDone;
        }
        break;

    case State::WaitNormDone:
        if (d1d2_out_.norm_start) {
            d1_ = d1d2_out_.d1;
            d2_ = d1d2_out_.d2;
            outcome_ = worst_of(outcome_, d1d2_out_.outcome);
            norm_start = true;
        }
        if (norm_out_.status.done) {
            nd1_ = norm_out_.nd1;
            nd2_ = norm_out_.nd2;
            norm_done = true;
            state_ = State::WaitExpStart;
        }
        break;

    case State::WaitExpStart:
        if (combiner_out_.exp_start) {
            state_ = State::WaitExpDone;
        }
        break;

    case State::WaitExpDone:
        if (combiner_out_.exp_done) {
            state_ = State::WaitResultValid;
        }
        break;

    case State::WaitResultValid:
        if (config_.completion == CompletionPolicy::ExplicitValid) {
            if (combiner_out_.status.valid) {
                out = finish(price_, outcome_);
                completed = true;
            }
        } else {
            // A legitimately zero price never settles; the request timeout
            // below is what completes it.
            settled_ = price_ != Fixed::zero() ? settled_ + 1 : 0;
            if (settled_ >= config_.settle_ticks) {
                out = finish(price_, outcome_);
                completed = true;
            }
        }
        break;
    }

    if (!completed && state_ != State::WaitStart && ++elapsed_ >= config_.request_timeout_ticks) {
        spdlog::warn("top: request timed out after {} ticks in state {}", elapsed_, static_cast<int>(state_));
        const Fixed price = price_;
        d1d2_.reset();
        norm_->reset();
        combiner_->reset();
        norm_start = false;
        norm_done = false;
        out = finish(price, Outcome::TimedOutWithDefaults);
        completed = true;
    }
    if (norm_done) {
        combiner_engaged_ = true;
    }

    d1d2_out_ = d1d2_.tick(D1D2Orchestrator::Inputs{d1d2_start, request_});
    norm_out_ = norm_->tick(NormalCdfPort::Inputs{norm_start, d1_, d2_});
    combiner_out_ = combiner_->tick(PriceCombinerPort::Inputs{norm_done,
                                                              request_.rate,
                                                              request_.time,
                                                              request_.spot,
                                                              request_.strike,
                                                              nd1_,
                                                              nd2_,
                                                              request_.type});

    out.status.busy = state_ != State::WaitStart;
    if (!completed) {
        out.price = price_;
        out.d1 = d1_;
        out.d2 = d2_;
        out.outcome = outcome_;
    }
    return out;
}

} // namespace qpricer
