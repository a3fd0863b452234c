#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <qpricer/request_loader.hpp>

using Catch::Approx;
using qpricer::OptionType;
using qpricer::PipelineRequest;

namespace {

class TempCsv {
public:
    TempCsv(const std::string& name, const std::string& contents)
        : path_(std::filesystem::temp_directory_path() / name) {
        std::ofstream output(path_);
        output << contents;
    }

    ~TempCsv() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

} // namespace

TEST_CASE("Loader reads every request row") {
    const TempCsv csv("qpricer_requests_ok.csv",
                      "spot,strike,time,volatility,rate,is_call\n"
                      "100,90,0.5,0.25,0.03,1\n"
                      "\n"
                      " 1.5 , 2 , 1 , 0 , -0.01 , 0 \n");

    std::vector<PipelineRequest> requests;
    REQUIRE(qpricer::load_requests_csv(csv.path(), requests));
    REQUIRE(requests.size() == 2);

    REQUIRE(requests[0].spot.to_real() == Approx(100.0));
    REQUIRE(requests[0].strike.to_real() == Approx(90.0));
    REQUIRE(requests[0].time.to_real() == Approx(0.5));
    REQUIRE(requests[0].volatility.to_real() == Approx(0.25).margin(1e-4));
    REQUIRE(requests[0].rate.to_real() == Approx(0.03).margin(1e-4));
    REQUIRE(requests[0].type == OptionType::Call);

    REQUIRE(requests[1].spot.to_real() == Approx(1.5));
    REQUIRE(requests[1].rate.to_real() == Approx(-0.01).margin(1e-4));
    REQUIRE(requests[1].type == OptionType::Put);
}

TEST_CASE("Loader rejects a header that does not match") {
    const TempCsv csv("qpricer_requests_header.csv",
                      "spot,strike,maturity,volatility,rate,is_call\n"
                      "100,90,0.5,0.25,0.03,1\n");

    std::vector<PipelineRequest> requests;
    REQUIRE_FALSE(qpricer::load_requests_csv(csv.path(), requests));
    REQUIRE(requests.empty());
}

TEST_CASE("Loader rejects out-of-range rows and clears earlier rows") {
    const std::vector<std::string> bad_rows = {
        "0,90,0.5,0.25,0.03,1",
        "100,-1,0.5,0.25,0.03,1",
        "100,90,0,0.25,0.03,1",
        "100,90,0.5,-0.25,0.03,1",
        "40000,90,0.5,0.25,0.03,1",
        "100,90,0.5,0.25,abc,1",
        "100,90,0.5,0.25,0.03,2",
        "100,90,0.5,0.25,0.03",
    };

    for (const auto& row : bad_rows) {
        const TempCsv csv("qpricer_requests_bad.csv",
                          "spot,strike,time,volatility,rate,is_call\n"
                          "100,90,0.5,0.25,0.03,1\n" +
                              row + "\n");

        std::vector<PipelineRequest> requests;
        REQUIRE_FALSE(qpricer::load_requests_csv(csv.path(), requests));
        REQUIRE(requests.empty());
    }
}

TEST_CASE("Loader reports a missing file") {
    std::vector<PipelineRequest> requests(3);
    REQUIRE_FALSE(qpricer::load_requests_csv("/nonexistent/qpricer_requests.csv", requests));
    REQUIRE(requests.empty());
}
