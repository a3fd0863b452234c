#include <qpricer/fixed_point.hpp>

#include <cmath>
#include <stdexcept>

#include <spdlog/fmt/fmt.h>

namespace qpricer {

namespace {
constexpr double kScale = static_cast<double>(std::int64_t{1} << kFracBits);
}

Fixed Fixed::from_real(double value) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument("Fixed::from_real requires a finite value");
    }
    const double scaled = std::round(value * kScale);
    if (scaled >= static_cast<double>(INT32_MAX)) {
        return max();
    }
    if (scaled <= static_cast<double>(INT32_MIN)) {
        return min();
    }
    return from_raw(static_cast<std::int32_t>(scaled));
}

double Fixed::to_real() const {
    return static_cast<double>(raw_) / kScale;
}

std::string Fixed::to_string() const {
    return fmt::format("{:.6f} (0x{:08x})", to_real(), static_cast<std::uint32_t>(raw_));
}

Fixed divide_direct(Fixed dividend, Fixed divisor) {
    if (divisor.raw() == 0) {
        return dividend.is_negative() ? Fixed::min() : Fixed::max();
    }
    const std::int64_t wide = static_cast<std::int64_t>(dividend.raw()) * (std::int64_t{1} << kFracBits);
    return Fixed::saturate(wide / divisor.raw());
}

} // namespace qpricer
