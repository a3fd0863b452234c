#pragma once

#include <cstdint>

#include <qpricer/fixed_point.hpp>
#include <qpricer/handshake.hpp>

namespace qpricer {

// Restoring long division on sign-magnitude operands, one quotient bit per
// tick. done arrives kWordBits + 3 ticks after the start tick.
class DividerUnit {
public:
    struct Inputs {
        bool start = false;
        Fixed dividend;
        Fixed divisor;
    };

    struct Outputs {
        UnitStatus status;
        Fixed quotient;
        bool dbz = false; // divisor was zero
        bool ovf = false; // MIN operand or quotient out of range
    };

    enum class State : std::uint8_t { Idle, Init, Calc, Round, Sign };

    static constexpr int kIterations = kWordBits;
    // Upper bound on ticks spent in Calc.
    static constexpr int kCalcWatchdog = kIterations + 8;

    Outputs tick(const Inputs& in);
    void reset();

    State state() const { return state_; }

private:
    Outputs finish_error(bool dbz, bool ovf);

    State state_ = State::Idle;
    Fixed dividend_;
    Fixed divisor_;

    bool negative_ = false;
    std::uint64_t divisor_mag_ = 0;
    std::uint64_t remainder_ = 0;
    std::uint32_t low_bits_ = 0; // dividend bits still to bring down
    std::uint64_t quotient_ = 0;
    int iteration_ = 0;
    int calc_ticks_ = 0;
};

} // namespace qpricer
