#include <CLI/CLI.hpp>

#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdint>
#include <exception>
#include <string>
#include <vector>

#include <qpricer/config.hpp>
#include <qpricer/reference.hpp>
#include <qpricer/request.hpp>
#include <qpricer/request_loader.hpp>
#include <qpricer/simulator.hpp>
#include <qpricer/top_orchestrator.hpp>

namespace {

void report(std::size_t index,
            const qpricer::PipelineRequest& request,
            const qpricer::PricingResult& result) {
    const bool is_call = request.type == qpricer::OptionType::Call;
    const double spot = request.spot.to_real();
    const double strike = request.strike.to_real();
    const double time = request.time.to_real();
    const double vol = request.volatility.to_real();
    const double rate = request.rate.to_real();

    const auto ref_d = qpricer::reference::d1_d2(spot, strike, rate, vol, time);
    const double ref_price = qpricer::reference::price(is_call, spot, strike, rate, vol, time);

    spdlog::info("Request {} ({}): S={:.4f} K={:.4f} T={:.4f} vol={:.4f} r={:.4f}",
                 index,
                 is_call ? "Call" : "Put",
                 spot,
                 strike,
                 time,
                 vol,
                 rate);
    spdlog::info("  Outcome:   {} after {} ticks", qpricer::to_string(result.outcome), result.ticks);
    spdlog::info("  Price:     {:.6f} (reference {:.6f}, error {:.2e})",
                 result.price.to_real(),
                 ref_price,
                 std::abs(result.price.to_real() - ref_price));
    spdlog::info("  d1:        {:.6f} (reference {:.6f})", result.d1.to_real(), ref_d.d1);
    spdlog::info("  d2:        {:.6f} (reference {:.6f})", result.d2.to_real(), ref_d.d2);
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"qpricer"};

    std::string requests_path;
    double spot = 100.0;
    double strike = 100.0;
    double time = 1.0;
    double vol = 0.2;
    double rate = 0.05;
    bool is_put = false;
    bool canned = false;
    bool settled_completion = false;
    bool verbose = false;
    qpricer::PipelineConfig config;

    app.add_option("-r,--requests", requests_path, "Requests CSV path (spot,strike,time,volatility,rate,is_call)");
    app.add_option("--spot", spot, "Spot price")->default_val(spot);
    app.add_option("--strike", strike, "Strike price")->default_val(strike);
    app.add_option("--time", time, "Time to maturity in years")->default_val(time);
    app.add_option("--vol", vol, "Annualised volatility")->default_val(vol);
    app.add_option("--rate", rate, "Risk-free rate")->default_val(rate);
    app.add_flag("--put", is_put, "Price a put instead of a call");
    app.add_option("--watchdog-ticks", config.watchdog_ticks, "Sub-result watchdog bound in ticks")
        ->default_val(config.watchdog_ticks);
    app.add_option("--timeout-ticks", config.request_timeout_ticks, "Per-request tick budget")
        ->default_val(config.request_timeout_ticks);
    app.add_flag("--canned", canned, "Bypass the divider, log and square-root units with fixed outputs");
    app.add_flag("--settled-completion",
                 settled_completion,
                 "Complete on a settled non-zero price instead of the combiner's valid pulse");
    app.add_flag("-v,--verbose", verbose, "Log pipeline state transitions");

    try {
        CLI11_PARSE(app, argc, argv);

        if (verbose) {
            spdlog::set_level(spdlog::level::debug);
        }
        if (canned) {
            config.strategy = qpricer::ComputeStrategy::CannedDefaults;
        }
        if (settled_completion) {
            config.completion = qpricer::CompletionPolicy::SettledNonZero;
        }

        std::vector<qpricer::PipelineRequest> requests;
        if (!requests_path.empty()) {
            if (!qpricer::load_requests_csv(requests_path, requests)) {
                return 1;
            }
            if (requests.empty()) {
                spdlog::error("Requests CSV produced no requests");
                return 1;
            }
            spdlog::info("Loaded {} requests from '{}'.", requests.size(), requests_path);
        } else {
            requests.push_back(qpricer::make_request(spot,
                                                     strike,
                                                     time,
                                                     vol,
                                                     rate,
                                                     is_put ? qpricer::OptionType::Put : qpricer::OptionType::Call));
        }

        qpricer::TopOrchestrator top(config);
        spdlog::info("Pipeline: strategy={}, completion={}, watchdog={} ticks, timeout={} ticks",
                     qpricer::to_string(config.strategy),
                     qpricer::to_string(config.completion),
                     config.watchdog_ticks,
                     config.request_timeout_ticks);

        const std::uint64_t max_ticks = static_cast<std::uint64_t>(config.request_timeout_ticks) + 1;
        std::size_t degraded = 0;
        for (std::size_t i = 0; i < requests.size(); ++i) {
            const qpricer::PricingResult result = qpricer::run_request(top, requests[i], max_ticks);
            if (result.outcome != qpricer::Outcome::Succeeded) {
                ++degraded;
            }
            report(i, requests[i], result);
        }

        spdlog::info("");
        spdlog::info("{} requests priced, {} with substituted values.", requests.size(), degraded);
    } catch (const CLI::ParseError& parse_error) {
        return app.exit(parse_error);
    } catch (const std::exception& ex) {
        spdlog::error("Failed to price requests: {}", ex.what());
        return 1;
    }

    return 0;
}
