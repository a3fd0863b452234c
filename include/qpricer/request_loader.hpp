#pragma once

#include <string>
#include <vector>

#include <qpricer/request.hpp>

namespace qpricer {

// Reads spot,strike,time,volatility,rate,is_call rows. On failure logs the
// offending row, clears requests and returns false.
bool load_requests_csv(const std::string& path,
                       std::vector<PipelineRequest>& requests);

} // namespace qpricer
