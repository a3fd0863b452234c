#pragma once

#include <compare>
#include <cstdint>
#include <string>

namespace qpricer {

inline constexpr int kIntBits = 16;
inline constexpr int kFracBits = 16;
inline constexpr int kWordBits = kIntBits + kFracBits;

// Signed Q16.16 word. real value = raw / 65536.
class Fixed {
public:
    constexpr Fixed() = default;

    static constexpr Fixed from_raw(std::int32_t raw) {
        Fixed f;
        f.raw_ = raw;
        return f;
    }

    // Rounds to nearest and saturates out-of-range values. Throws
    // std::invalid_argument for NaN or infinity.
    static Fixed from_real(double value);

    // Saturating conversion of a wide intermediate back into the word.
    static constexpr Fixed saturate(std::int64_t wide) {
        if (wide > INT32_MAX) {
            return max();
        }
        if (wide < INT32_MIN) {
            return min();
        }
        return from_raw(static_cast<std::int32_t>(wide));
    }

    static constexpr Fixed from_int(std::int32_t value) {
        return saturate(static_cast<std::int64_t>(value) * (std::int64_t{1} << kFracBits));
    }

    static constexpr Fixed zero() { return from_raw(0); }
    static constexpr Fixed one() { return from_raw(std::int32_t{1} << kFracBits); }
    static constexpr Fixed max() { return from_raw(INT32_MAX); }
    static constexpr Fixed min() { return from_raw(INT32_MIN); }

    constexpr std::int32_t raw() const { return raw_; }
    double to_real() const;
    std::string to_string() const;

    constexpr bool is_min() const { return raw_ == INT32_MIN; }
    constexpr bool is_negative() const { return raw_ < 0; }

    friend constexpr Fixed operator+(Fixed a, Fixed b) {
        return saturate(static_cast<std::int64_t>(a.raw_) + b.raw_);
    }

    friend constexpr Fixed operator-(Fixed a, Fixed b) {
        return saturate(static_cast<std::int64_t>(a.raw_) - b.raw_);
    }

    friend constexpr Fixed operator-(Fixed a) {
        return saturate(-static_cast<std::int64_t>(a.raw_));
    }

    // Scaled product: double-width multiply then arithmetic shift by the
    // fractional width.
    friend constexpr Fixed operator*(Fixed a, Fixed b) {
        const std::int64_t wide = static_cast<std::int64_t>(a.raw_) * b.raw_;
        return saturate(wide >> kFracBits);
    }

    // Halving by arithmetic shift, as the hardware stage does.
    constexpr Fixed half() const { return from_raw(raw_ >> 1); }

    friend constexpr bool operator==(const Fixed&, const Fixed&) = default;
    friend constexpr auto operator<=>(const Fixed&, const Fixed&) = default;

private:
    std::int32_t raw_ = 0;
};

// Single-step fixed-point division (a << 16) / b, truncated toward zero.
// A zero divisor saturates toward the sign of the dividend.
Fixed divide_direct(Fixed dividend, Fixed divisor);

} // namespace qpricer
