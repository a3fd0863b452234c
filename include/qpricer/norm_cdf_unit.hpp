#pragma once

#include <array>
#include <cstdint>

#include <qpricer/ports.hpp>

namespace qpricer {

// Standard normal CDF by linear interpolation in a table sampled every 1/16
// on [-8, 8]. Evaluates N(d1) and N(d2) on consecutive ticks.
class NormalCdfUnit final : public NormalCdfPort {
public:
    static constexpr int kStepShift = 12; // 1/16 in Q16.16
    static constexpr std::int32_t kLimit = 8;
    static constexpr std::size_t kEntries = (2 * kLimit << (kFracBits - kStepShift)) + 1;

    NormalCdfUnit();

    Outputs tick(const Inputs& in) override;
    void reset() override;

    // Combinational lookup, exposed for tests.
    Fixed evaluate(Fixed x) const;

private:
    enum class State : std::uint8_t { Idle, EvalD1, EvalD2 };

    std::array<Fixed, kEntries> table_{};
    State state_ = State::Idle;
    Fixed d1_;
    Fixed d2_;
    Fixed nd1_;
};

} // namespace qpricer
