#pragma once

namespace qpricer {

// Double-precision Black-Scholes, the oracle the fixed-point pipeline is
// checked against.
namespace reference {

struct D1D2 {
    double d1 = 0.0;
    double d2 = 0.0;
};

// Standard normal CDF.
double normal_cdf(double x);

// Time and volatility are floored at 1e-8 so the result stays finite.
D1D2 d1_d2(double spot, double strike, double rate, double volatility, double time);

// Falls back to the undiscounted payoff once time or volatility reach the
// 1e-8 floor. Non-positive spot or strike prices at zero.
double price(bool is_call, double spot, double strike, double rate, double volatility, double time);

} // namespace reference

} // namespace qpricer
