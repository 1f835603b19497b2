#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "common/Log.hpp"
#include "domain/Date.hpp"

namespace harvest::common {

struct Config {
    std::string country;
    domain::Date firstDate = domain::Date::today().addDays(-14);
    domain::Date lastDate = domain::Date::today();
    std::string testType = "webconnectivity";
    std::size_t maxStringSize = 1000;
    double costLimitUsd = 1.00;
    std::string outputDir;
    std::size_t concurrency = defaultConcurrency();
    std::size_t limit = 0;  // 0 = every entry
    harvest::log::Level logLevel = harvest::log::Level::Info;

    std::uint32_t timeoutSec = 30;
    std::string caFile;
    bool verifyTls = true;
    std::string legacyHost = "ooni-data.s3.amazonaws.com";
    std::string partitionedHost = "ooni-data-eu-fra.s3.eu-central-1.amazonaws.com";

    static std::size_t defaultConcurrency();
    static Config fromArgs(int argc, char** argv);
};

}  // namespace harvest::common
