#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>
#include <limits>
#include <stdexcept>

#include <qpricer/fixed_point.hpp>

using Catch::Approx;
using qpricer::Fixed;

namespace {
constexpr double kLsb = 1.0 / 65536.0;
}

TEST_CASE("Q16.16 constants have the expected raw encoding") {
    REQUIRE(Fixed::one().raw() == 0x00010000);
    REQUIRE(Fixed::from_real(1.5).raw() == 0x00018000);
    REQUIRE(Fixed::from_real(0.5).raw() == 0x00008000);
    REQUIRE(Fixed::from_real(-1.0).raw() == -0x00010000);
    REQUIRE(Fixed::from_int(3) == Fixed::from_real(3.0));
}

TEST_CASE("from_real and to_real round-trip within half an LSB") {
    for (double v = -20000.0; v <= 20000.0; v += 137.0371) {
        const Fixed f = Fixed::from_real(v);
        REQUIRE(std::abs(f.to_real() - v) <= 0.5 * kLsb + 1e-12);
    }
    for (double v = -2.0; v <= 2.0; v += 0.0123) {
        const Fixed f = Fixed::from_real(v);
        REQUIRE(std::abs(f.to_real() - v) <= 0.5 * kLsb + 1e-12);
    }
}

TEST_CASE("Conversions saturate instead of wrapping") {
    REQUIRE(Fixed::from_real(1e9) == Fixed::max());
    REQUIRE(Fixed::from_real(-1e9) == Fixed::min());
    REQUIRE(Fixed::from_int(40000) == Fixed::max());
    REQUIRE(Fixed::from_int(-40000) == Fixed::min());
}

TEST_CASE("from_real rejects non-finite values") {
    REQUIRE_THROWS_AS(Fixed::from_real(std::numeric_limits<double>::quiet_NaN()), std::invalid_argument);
    REQUIRE_THROWS_AS(Fixed::from_real(std::numeric_limits<double>::infinity()), std::invalid_argument);
}

TEST_CASE("Addition and subtraction saturate at the format limits") {
    REQUIRE(Fixed::max() + Fixed::one() == Fixed::max());
    REQUIRE(Fixed::min() - Fixed::one() == Fixed::min());
    REQUIRE(-Fixed::min() == Fixed::max());
    REQUIRE((Fixed::from_real(2.25) + Fixed::from_real(-0.75)).to_real() == Approx(1.5));
}

TEST_CASE("Scaled product shifts out the fractional width") {
    REQUIRE(Fixed::from_real(1.5) * Fixed::from_int(2) == Fixed::from_int(3));
    REQUIRE(Fixed::from_real(-1.5) * Fixed::from_int(2) == Fixed::from_int(-3));
    REQUIRE((Fixed::from_real(0.2) * Fixed::from_real(0.2)).to_real() == Approx(0.04).margin(2 * kLsb));
    REQUIRE(Fixed::from_int(300) * Fixed::from_int(300) == Fixed::max());
    REQUIRE(Fixed::from_int(-300) * Fixed::from_int(300) == Fixed::min());
}

TEST_CASE("half is an arithmetic shift") {
    REQUIRE(Fixed::from_int(3).half() == Fixed::from_real(1.5));
    REQUIRE(Fixed::from_int(-3).half() == Fixed::from_real(-1.5));
}

TEST_CASE("divide_direct divides and saturates on a zero divisor") {
    REQUIRE(qpricer::divide_direct(Fixed::from_int(3), Fixed::from_int(2)) == Fixed::from_real(1.5));
    REQUIRE(qpricer::divide_direct(Fixed::from_real(1.5), Fixed::one()).raw() == 0x00018000);
    REQUIRE(qpricer::divide_direct(Fixed::from_int(-7), Fixed::from_int(2)) == Fixed::from_real(-3.5));
    REQUIRE(qpricer::divide_direct(Fixed::one(), Fixed::zero()) == Fixed::max());
    REQUIRE(qpricer::divide_direct(-Fixed::one(), Fixed::zero()) == Fixed::min());
    REQUIRE(qpricer::divide_direct(Fixed::from_int(20000), Fixed::from_real(0.01)) == Fixed::max());
}
