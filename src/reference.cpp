#include <qpricer/reference.hpp>

#include <algorithm>
#include <cmath>

namespace qpricer::reference {

namespace {
constexpr double kFloor = 1e-8;
constexpr double kInvSqrt2 = 0.70710678118654752440;
}

double normal_cdf(double x) {
    return 0.5 * std::erfc(-x * kInvSqrt2);
}

D1D2 d1_d2(double spot, double strike, double rate, double volatility, double time) {
    time = std::max(time, kFloor);
    volatility = std::max(volatility, kFloor);
    const double spread = volatility * std::sqrt(time);
    const double d1 = (std::log(spot / strike) + (rate + 0.5 * volatility * volatility) * time) / spread;
    return D1D2{d1, d1 - spread};
}

double price(bool is_call, double spot, double strike, double rate, double volatility, double time) {
    if (spot <= 0.0 || strike <= 0.0) {
        return 0.0;
    }
    const double sign = is_call ? 1.0 : -1.0;
    if (time <= kFloor || volatility <= kFloor) {
        return std::max(0.0, sign * (spot - strike));
    }

    // Put-call symmetry: put = -call evaluated at (-d1, -d2).
    const D1D2 d = d1_d2(spot, strike, rate, volatility, time);
    const double discounted_strike = strike * std::exp(-rate * time);
    return sign * (spot * normal_cdf(sign * d.d1) - discounted_strike * normal_cdf(sign * d.d2));
}

} // namespace qpricer::reference
