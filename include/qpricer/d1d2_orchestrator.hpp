#pragma once

#include <cstdint>
#include <memory>

#include <qpricer/config.hpp>
#include <qpricer/divider.hpp>
#include <qpricer/fixed_point.hpp>
#include <qpricer/handshake.hpp>
#include <qpricer/log_unit.hpp>
#include <qpricer/ports.hpp>
#include <qpricer/request.hpp>

namespace qpricer {

// d1 = (ln(S/K) + (r + sigma^2/2) T) / (sigma sqrt(T)),  d2 = d1 - sigma sqrt(T).
//
// On start the divider (S, K) and the square-root port (T) are driven on the
// same tick; the log unit starts once the quotient is valid. Each sub-result
// is latched at most once per request. If they are not all valid within
// watchdog_ticks, the missing ones are replaced by 1.0 (ratio, root) and 0.0
// (log) and the request completes as TimedOutWithDefaults.
class D1D2Orchestrator {
public:
    struct Inputs {
        bool start = false;
        PipelineRequest request;
    };

    struct Outputs {
        UnitStatus status;
        Fixed d1;
        Fixed d2;
        bool pipeline_done = false;
        bool norm_start = false;
        Outcome outcome = Outcome::Succeeded;
    };

    enum class State : std::uint8_t {
        Idle,
        WaitForInputs,
        PrepCalc,
        HalfSigmaSq,
        Drift,
        DriftTime,
        Numerator,
        Quotient,
        D2,
        Done
    };

    struct SubResult {
        Fixed value;
        bool valid = false;
    };

    struct SubResults {
        SubResult ratio;
        SubResult root;
        SubResult log;

        bool all_valid() const { return ratio.valid && root.valid && log.valid; }
    };

    explicit D1D2Orchestrator(PipelineConfig config = {},
                              std::unique_ptr<SquareRootPort> sqrt_unit = nullptr);

    Outputs tick(const Inputs& in);
    void reset();

    State state() const { return state_; }
    const SubResults& sub_results() const { return sub_; }
    const PipelineConfig& config() const { return config_; }

private:
    void latch_sub_results(bool& log_start);
    void substitute_defaults();

    PipelineConfig config_;
    std::unique_ptr<SquareRootPort> sqrt_;
    DividerUnit divider_;
    LogUnit log_;

    // Sub-unit outputs registered on the previous tick.
    DividerUnit::Outputs div_out_;
    SquareRootPort::Outputs sqrt_out_;
    LogUnit::Outputs log_out_;

    State state_ = State::Idle;
    PipelineRequest request_;
    SubResults sub_;
    std::uint32_t watchdog_ = 0;
    Outcome outcome_ = Outcome::Succeeded;

    Fixed vol_sqrt_time_;
    Fixed vol_sq_;
    Fixed half_vol_sq_;
    Fixed drift_;
    Fixed drift_time_;
    Fixed numerator_;
    Fixed d1_;
    Fixed d2_;
};

} // namespace qpricer
