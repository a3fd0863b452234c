#include <qpricer/request_loader.hpp>

#include <qpricer/fixed_point.hpp>

#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace qpricer {

namespace {

constexpr std::size_t kRequestColumns = 6;

const char* kRequestHeader[kRequestColumns] = {
    "spot",
    "strike",
    "time",
    "volatility",
    "rate",
    "is_call"
};

// Largest magnitude that converts without saturating.
constexpr double kFixedLimit = static_cast<double>(std::int32_t{1} << (kIntBits - 1));

std::string trim(std::string_view input) {
    const auto begin = input.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return std::string{};
    }
    const auto end = input.find_last_not_of(" \t\r\n");
    return std::string(input.substr(begin, end - begin + 1));
}

std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    std::istringstream stream(line);
    while (std::getline(stream, field, ',')) {
        fields.emplace_back(trim(field));
    }
    if (!line.empty() && line.back() == ',') {
        fields.emplace_back();
    }
    return fields;
}

bool parse_uint32(const std::string& token, std::uint32_t& value_out) {
    if (token.empty()) {
        return false;
    }
    try {
        size_t idx = 0;
        unsigned long raw = std::stoul(token, &idx, 10);
        if (idx != token.size() || raw > std::numeric_limits<std::uint32_t>::max()) {
            return false;
        }
        value_out = static_cast<std::uint32_t>(raw);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_fixed(const std::string& token, Fixed& value_out) {
    if (token.empty()) {
        return false;
    }
    try {
        size_t idx = 0;
        const double value = std::stod(token, &idx);
        if (idx != token.size() || !std::isfinite(value) || std::abs(value) >= kFixedLimit) {
            return false;
        }
        value_out = Fixed::from_real(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

bool load_requests_csv(const std::string& path,
                       std::vector<PipelineRequest>& requests) {
    requests.clear();

    std::ifstream input(path);
    if (!input.is_open()) {
        spdlog::error("Failed to open requests CSV: {}", path);
        return false;
    }

    std::string line;
    if (!std::getline(input, line)) {
        spdlog::error("Requests CSV missing header row");
        return false;
    }

    const auto header = split_csv_line(line);
    if (header.size() != kRequestColumns) {
        spdlog::error("Unexpected requests header column count");
        return false;
    }
    for (std::size_t i = 0; i < kRequestColumns; ++i) {
        if (header[i] != kRequestHeader[i]) {
            spdlog::error("Requests header mismatch at column {}", i);
            return false;
        }
    }

    std::size_t row_index = 1;
    while (std::getline(input, line)) {
        ++row_index;
        if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
            continue;
        }

        const auto fields = split_csv_line(line);
        if (fields.size() != kRequestColumns) {
            spdlog::error("Unexpected field count in requests row {}", row_index);
            requests.clear();
            return false;
        }

        PipelineRequest request;
        if (!parse_fixed(fields[0], request.spot) || request.spot.raw() <= 0) {
            spdlog::error("Invalid spot in requests row {}", row_index);
            requests.clear();
            return false;
        }
        if (!parse_fixed(fields[1], request.strike) || request.strike.raw() <= 0) {
            spdlog::error("Invalid strike in requests row {}", row_index);
            requests.clear();
            return false;
        }
        if (!parse_fixed(fields[2], request.time) || request.time.raw() <= 0) {
            spdlog::error("Invalid time in requests row {}", row_index);
            requests.clear();
            return false;
        }
        if (!parse_fixed(fields[3], request.volatility) || request.volatility.is_negative()) {
            spdlog::error("Invalid volatility in requests row {}", row_index);
            requests.clear();
            return false;
        }
        if (!parse_fixed(fields[4], request.rate)) {
            spdlog::error("Invalid rate in requests row {}", row_index);
            requests.clear();
            return false;
        }

        std::uint32_t is_call_raw = 0;
        if (!parse_uint32(fields[5], is_call_raw) || is_call_raw > 1U) {
            spdlog::error("Invalid is_call in requests row {}", row_index);
            requests.clear();
            return false;
        }
        request.type = is_call_raw == 1U ? OptionType::Call : OptionType::Put;

        requests.push_back(request);
    }

    return true;
}

} // namespace qpricer
