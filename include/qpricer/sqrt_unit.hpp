#pragma once

#include <cstdint>

#include <qpricer/ports.hpp>

namespace qpricer {

// Digit-by-digit square root of raw << 16, one root bit per tick, rounded to
// nearest.
class SquareRootUnit final : public SquareRootPort {
public:
    static constexpr int kRootBits = 24;

    Outputs tick(const Inputs& in) override;
    void reset() override;

private:
    enum class State : std::uint8_t { Idle, Calc, Finish };

    State state_ = State::Idle;
    Fixed radicand_;
    std::uint64_t operand_ = 0;
    std::uint64_t root_ = 0;
    std::uint64_t bit_ = 0;
};

} // namespace qpricer
