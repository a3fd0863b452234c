#pragma once

#include <qpricer/fixed_point.hpp>
#include <qpricer/handshake.hpp>
#include <qpricer/request.hpp>

namespace qpricer {

// Handshake contracts the orchestrators require of units outside the core.
// Implementations advance exactly one state transition per tick().

class SquareRootPort {
public:
    struct Inputs {
        bool start = false;
        Fixed radicand;
    };

    struct Outputs {
        UnitStatus status;
        Fixed root;
        bool domain_error = false;
    };

    virtual ~SquareRootPort() = default;
    virtual Outputs tick(const Inputs& in) = 0;
    virtual void reset() = 0;
};

class NormalCdfPort {
public:
    struct Inputs {
        bool start = false;
        Fixed d1;
        Fixed d2;
    };

    struct Outputs {
        UnitStatus status;
        Fixed nd1;
        Fixed nd2;
    };

    virtual ~NormalCdfPort() = default;
    virtual Outputs tick(const Inputs& in) = 0;
    virtual void reset() = 0;
};

class PriceCombinerPort {
public:
    struct Inputs {
        bool norm_done = false; // acts as start
        Fixed rate;
        Fixed time;
        Fixed spot;
        Fixed strike;
        Fixed nd1;
        Fixed nd2;
        OptionType type = OptionType::Call;
    };

    struct Outputs {
        UnitStatus status; // valid pulses with the first tick of a new price
        Fixed price;       // level; zero until the first price of a request
        bool exp_start = false;
        bool exp_done = false;
    };

    virtual ~PriceCombinerPort() = default;
    virtual Outputs tick(const Inputs& in) = 0;
    virtual void reset() = 0;
};

} // namespace qpricer
