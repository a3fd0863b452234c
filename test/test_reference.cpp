#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>

#include <qpricer/reference.hpp>

using Catch::Approx;

namespace {
constexpr double kTolerance = 1e-6;
}

TEST_CASE("Reference call price matches known values") {
    const double spot = 100.0;
    const double strike = 100.0;
    const double rate = 0.05;
    const double vol = 0.20;
    const double maturity = 1.0;

    REQUIRE(qpricer::reference::price(true, spot, strike, rate, vol, maturity) ==
            Approx(10.4505835721856).margin(kTolerance));

    const auto d = qpricer::reference::d1_d2(spot, strike, rate, vol, maturity);
    REQUIRE(d.d1 == Approx(0.35).margin(kTolerance));
    REQUIRE(d.d2 == Approx(0.15).margin(kTolerance));
    REQUIRE(qpricer::reference::normal_cdf(d.d1) == Approx(0.636830651175619).margin(kTolerance));
}

TEST_CASE("Reference put price matches known values") {
    REQUIRE(qpricer::reference::price(false, 100.0, 100.0, 0.05, 0.20, 1.0) ==
            Approx(5.57352602225697).margin(kTolerance));
}

TEST_CASE("Reference d1 and d2 for unit inputs") {
    const auto d = qpricer::reference::d1_d2(1.0, 1.0, 1.0, 1.0, 1.0);
    REQUIRE(d.d1 == Approx(1.5).margin(kTolerance));
    REQUIRE(d.d2 == Approx(0.5).margin(kTolerance));
}

TEST_CASE("Reference handles near-zero time or volatility with intrinsic value") {
    const double spot = 110.0;
    const double strike = 100.0;

    const double call_price = qpricer::reference::price(true, spot, strike, 0.01, 1e-8, 1e-8);
    const double put_price = qpricer::reference::price(false, spot, strike, 0.01, 1e-8, 1e-8);

    REQUIRE(call_price == Approx(10.0).margin(kTolerance));
    REQUIRE(put_price == Approx(0.0).margin(kTolerance));

    const auto d = qpricer::reference::d1_d2(spot, strike, 0.01, 0.0, 0.0);
    REQUIRE(std::isfinite(d.d1));
    REQUIRE(std::isfinite(d.d2));
}
