#pragma once

#include <cstdint>
#include <memory>

#include <qpricer/config.hpp>
#include <qpricer/d1d2_orchestrator.hpp>
#include <qpricer/fixed_point.hpp>
#include <qpricer/handshake.hpp>
#include <qpricer/ports.hpp>
#include <qpricer/request.hpp>

namespace qpricer {

// External units driven by the pipeline. Null members are replaced by the
// reference implementations.
struct Collaborators {
    std::unique_ptr<SquareRootPort> sqrt;
    std::unique_ptr<NormalCdfPort> norm;
    std::unique_ptr<PriceCombinerPort> combiner;
};

// One request at a time: d1/d2, then N(d1)/N(d2), then the discounted price.
class TopOrchestrator {
public:
    struct Inputs {
        bool reset = false;
        bool start = false;
        PipelineRequest request;
    };

    struct Outputs {
        UnitStatus status;
        Fixed price;
        Fixed d1;
        Fixed d2;
        Outcome outcome = Outcome::Succeeded;
    };

    enum class State : std::uint8_t { WaitStart, WaitNormDone, WaitExpStart, WaitExpDone, WaitResultValid };

    explicit TopOrchestrator(PipelineConfig config = {}, Collaborators collaborators = {});

    Outputs tick(const Inputs& in);
    void reset();

    State state() const { return state_; }
    const PipelineConfig& config() const { return config_; }

private:
    Outputs finish(Fixed price, Outcome outcome);

    PipelineConfig config_;
    D1D2Orchestrator d1d2_;
    std::unique_ptr<NormalCdfPort> norm_;
    std::unique_ptr<PriceCombinerPort> combiner_;

    // Child outputs registered on the previous tick.
    D1D2Orchestrator::Outputs d1d2_out_;
    NormalCdfPort::Outputs norm_out_;
    PriceCombinerPort::Outputs combiner_out_;

    State state_ = State::WaitStart;
    PipelineRequest request_;
    Outcome outcome_ = Outcome::Succeeded;
    Fixed d1_;
    Fixed d2_;
    Fixed nd1_;
    Fixed nd2_;
    // Price of the request in flight; follows the combiner only after this
    // request's norm_done has been issued.
    Fixed price_;
    bool combiner_engaged_ = false;
    std::uint32_t elapsed_ = 0;
    std::uint32_t settled_ = 0;
};

} // namespace qpricer
