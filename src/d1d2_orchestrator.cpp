#include <qpricer/d1d2_orchestrator.hpp>

#include <utility>

#include <qpricer/sqrt_unit.hpp>

#include <spdlog/spdlog.h>

namespace qpricer {

D1D2Orchestrator::D1D2Orchestrator(PipelineConfig config, std::unique_ptr<SquareRootPort> sqrt_unit)
    : config_(config), sqrt_(std::move(sqrt_unit)) {
    config_.validate();
    if (!sqrt_) {
        sqrt_ = std::make_unique<SquareRootUnit>();
    }
}

void D1D2Orchestrator::reset() {
    divider_.reset();
    log_.reset();
    sqrt_->reset();
    div_out_ = DividerUnit::Outputs{};
    sqrt_out_ = SquareRootPort::Outputs{};
    log_out_ = LogUnit::Outputs{};

    state_ = State::Idle;
    request_ = PipelineRequest{};
    sub_ = SubResults{};
    watchdog_ = 0;
    outcome_ = Outcome::Succeeded;
    vol_sqrt_time_ = vol_sq_ = half_vol_sq_ = Fixed{};
    drift_ = drift_time_ = numerator_ = Fixed{};
    d1_ = d2_ = Fixed{};
}

void D1D2Orchestrator::latch_sub_results(bool& log_start) {
    if (div_out_.status.done && !sub_.ratio.valid) {
        if (div_out_.status.valid) {
            sub_.ratio = SubResult{div_out_.quotient, true};
            log_start = true;
            spdlog::debug("d1d2: ratio latched {}", sub_.ratio.value.to_real());
        } else {
            spdlog::warn("d1d2: divider fault on {} / {} (dbz={}, ovf={})",
                         request_.spot.to_real(),
                         request_.strike.to_real(),
                         div_out_.dbz,
                         div_out_.ovf);
        }
    }

    if (sqrt_out_.status.done && !sub_.root.valid) {
        if (sqrt_out_.status.valid) {
            sub_.root = SubResult{sqrt_out_.root, true};
            spdlog::debug("d1d2: root latched {}", sub_.root.value.to_real());
        } else {
            spdlog::warn("d1d2: square root rejected radicand {}", request_.time.to_real());
        }
    }

    if (log_out_.status.valid && !sub_.log.valid) {
        sub_.log = SubResult{log_out_.result, true};
        spdlog::debug("d1d2: log latched {}", sub_.log.value.to_real());
    }
}

void D1D2Orchestrator::substitute_defaults() {
    if (!sub_.ratio.valid) {
        sub_.ratio = SubResult{Fixed::one(), true};
    }
    if (!sub_.root.valid) {
        sub_.root = SubResult{Fixed::one(), true};
    }
    if (!sub_.log.valid) {
        sub_.log = SubResult{Fixed::zero(), true};
    }
}

D1D2Orchestrator::Outputs D1D2Orchestrator::tick(const Inputs& in) {
    Outputs out;
    bool div_start = false;
    bool sqrt_start = false;
    bool log_start = false;

    if (in.start && state_ != State::Idle) {
        spdlog::warn("d1d2: start ignored while a request is in flight");
    }

    switch (state_) {
    case State::Idle:
        if (!in.start) {
            break;
        }
        request_ = in.request;
        sub_ = SubResults{};
        watchdog_ = 0;
        if (config_.strategy == ComputeStrategy::CannedDefaults) {
            substitute_defaults();
            outcome_ = Outcome::CannedDefaults;
            state_ = State::PrepCalc;
        } else {
            outcome_ = Outcome::Succeeded;
            div_start = true;
            sqrt_start = true;
            state_ = State::WaitForInputs;
        }
        spdlog::debug("d1d2: request latched (S={}, K={}, T={}, vol={}, r={})",
                      request_.spot.to_real(),
                      request_.strike.to_real(),
                      request_.time.to_real(),
                      request_.volatility.to_real(),
                      request_.rate.to_real());
        break;

    case State::WaitForInputs:
        latch_sub_results(log_start);
        if (sub_.all_valid()) {
            state_ = State::PrepCalc;
            break;
        }
        if (++watchdog_ >= config_.watchdog_ticks) {
            spdlog::warn("d1d2: watchdog expired after {} ticks (ratio={}, root={}, log={}), substituting defaults",
                         watchdog_,
                         sub_.ratio.valid,
                         sub_.root.valid,
                         sub_.log.valid);
            substitute_defaults();
            outcome_ = Outcome::TimedOutWithDefaults;
            log_start = false;
            divider_.reset();
            log_.reset();
            sqrt_->reset();
            state_ = State::PrepCalc;
        }
        break;

    case State::PrepCalc:
        vol_sqrt_time_ = request_.volatility * sub_.root.value;
        vol_sq_ = request_.volatility * request_.volatility;
        state_ = State::HalfSigmaSq;
        break;

    case State::HalfSigmaSq:
        half_vol_sq_ = vol_sq_.half();
        state_ = State::Drift;
        break;

    case State::Drift:
        drift_ = request_.rate + half_vol_sq_;
        state_ = State::DriftTime;
        break;

    case State::DriftTime:
        drift_time_ = drift_ * request_.time;
        state_ = State::Numerator;
        break;

    case State::Numerator:
        numerator_ = sub_.log.value + drift_time_;
        state_ = State::Quotient;
        break;

    case State::Quotient:
        d1_ = divide_direct(numerator_, vol_sqrt_time_);
        state_ = State::D2;
        break;

    case State::D2:
        d2_ = d1_ - vol_sqrt_time_;
        state_ = State::Done;
        break;

    case State::Done:
        out.status.done = true;
        out.status.valid = true;
        out.pipeline_done = true;
        out.norm_start = true;
        state_ = State::Idle;
        spdlog::debug("d1d2: d1={} d2={} ({})", d1_.to_real(), d2_.to_real(), to_string(outcome_));
        break;
    }

    div_out_ = divider_.tick(DividerUnit::Inputs{div_start, request_.spot, request_.strike});
    sqrt_out_ = sqrt_->tick(SquareRootPort::Inputs{sqrt_start, request_.time});
    log_out_ = log_.tick(LogUnit::Inputs{log_start, sub_.ratio.value});

    out.status.busy = state_ != State::Idle;
    out.d1 = d1_;
    out.d2 = d2_;
    out.outcome = outcome_;
    return out;
}

} // namespace qpricer
