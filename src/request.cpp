#include <qpricer/request.hpp>

namespace qpricer {

std::string_view to_string(Outcome outcome) {
    switch (outcome) {
    case Outcome::Succeeded:
        return "Succeeded";
    case Outcome::TimedOutWithDefaults:
        return "TimedOutWithDefaults";
    case Outcome::CannedDefaults:
        return "CannedDefaults";
    }
    return "Unknown";
}

Outcome worst_of(Outcome a, Outcome b) {
    return static_cast<std::uint8_t>(a) >= static_cast<std::uint8_t>(b) ? a : b;
}

} // namespace qpricer
