#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>
#include <thread>

namespace harvest::common {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

std::string trim(std::string value) {
    auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [&](unsigned char ch) {
                   return !isSpace(ch);
               }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }).base(),
                value.end());
    return value;
}

std::string parseCountry(const std::string& value) {
    auto code = toUpper(trim(value));
    if (code.size() != 2 || !std::isalpha(static_cast<unsigned char>(code[0])) ||
        !std::isalpha(static_cast<unsigned char>(code[1]))) {
        throw std::runtime_error("Invalid country code: " + value);
    }
    return code;
}

domain::Date parseDate(const std::string& value, const std::string& label) {
    if (auto date = domain::Date::fromIso(trim(value))) {
        return *date;
    }
    throw std::runtime_error("Invalid date for " + label + " (expected YYYY-MM-DD): " + value);
}

std::size_t parseSize(const std::string& value, const std::string& label, std::size_t minimum) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoull(value, &consumed);
        if (consumed != value.size() || value.front() == '-' || parsed < minimum) {
            throw std::out_of_range("size out of range");
        }
        return static_cast<std::size_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

double parseUsd(const std::string& value, const std::string& label) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stod(value, &consumed);
        if (consumed != value.size() || !(parsed >= 0.0)) {
            throw std::out_of_range("cost out of range");
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

std::uint32_t parseSeconds(const std::string& value, const std::string& label) {
    const auto parsed = parseSize(value, label, 1);
    if (parsed > std::numeric_limits<std::uint32_t>::max()) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
    return static_cast<std::uint32_t>(parsed);
}

bool parseBool(const std::string& value) {
    const auto normalized = toLower(trim(value));
    if (normalized == "true" || normalized == "1" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "false" || normalized == "0" || normalized == "no" || normalized == "off") {
        return false;
    }
    throw std::runtime_error("Invalid boolean value: " + value);
}

std::string parseHost(const std::string& value, const std::string& label) {
    auto host = trim(value);
    if (host.empty() || host.find_first_of("/ ") != std::string::npos) {
        throw std::runtime_error("Invalid host for " + label + ": " + value);
    }
    return host;
}

std::string valueFromArgs(int argc, char** argv, const std::string& key) {
    const std::string withEquals = key + '=';
    for (int i = 1; i < argc; ++i) {
        std::string arg{argv[i]};
        if (arg == key && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind(withEquals, 0) == 0) {
            return arg.substr(withEquals.size());
        }
    }
    return {};
}

bool hasFlag(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        if (key == argv[i]) {
            return true;
        }
    }
    return false;
}

}  // namespace

std::size_t Config::defaultConcurrency() {
    const auto cores = std::thread::hardware_concurrency();
    return 5U * static_cast<std::size_t>(cores == 0U ? 1U : cores);
}

Config Config::fromArgs(int argc, char** argv) {
    Config config{};

    if (const char* envCountry = std::getenv("HARVEST_COUNTRY")) {
        config.country = parseCountry(envCountry);
    }
    if (const char* envCost = std::getenv("HARVEST_COST_LIMIT_USD")) {
        config.costLimitUsd = parseUsd(envCost, "HARVEST_COST_LIMIT_USD");
    }
    if (const char* envOut = std::getenv("HARVEST_OUTPUT_DIR")) {
        auto dir = trim(envOut);
        if (!dir.empty()) {
            config.outputDir = std::move(dir);
        }
    }
    if (const char* envConcurrency = std::getenv("HARVEST_CONCURRENCY")) {
        config.concurrency = parseSize(envConcurrency, "HARVEST_CONCURRENCY", 1);
    }
    if (const char* envLogLevel = std::getenv("LOG_LEVEL")) {
        config.logLevel = harvest::log::levelFromString(toLower(envLogLevel));
    }
    if (const char* envTimeout = std::getenv("HARVEST_TIMEOUT_SEC")) {
        config.timeoutSec = parseSeconds(envTimeout, "HARVEST_TIMEOUT_SEC");
    }
    if (const char* envCa = std::getenv("HARVEST_CA_FILE")) {
        config.caFile = trim(envCa);
    }
    if (const char* envVerify = std::getenv("HARVEST_VERIFY_TLS")) {
        config.verifyTls = parseBool(envVerify);
    }

    if (auto countryArg = valueFromArgs(argc, argv, "--country"); !countryArg.empty()) {
        config.country = parseCountry(countryArg);
    }
    if (auto firstArg = valueFromArgs(argc, argv, "--first-date"); !firstArg.empty()) {
        config.firstDate = parseDate(firstArg, "--first-date");
    }
    if (auto lastArg = valueFromArgs(argc, argv, "--last-date"); !lastArg.empty()) {
        config.lastDate = parseDate(lastArg, "--last-date");
    }
    if (auto testArg = valueFromArgs(argc, argv, "--test-type"); !testArg.empty()) {
        config.testType = toLower(trim(testArg));
    }
    if (auto maxArg = valueFromArgs(argc, argv, "--max-string-size"); !maxArg.empty()) {
        config.maxStringSize = parseSize(maxArg, "--max-string-size", 0);
    }
    if (auto costArg = valueFromArgs(argc, argv, "--cost-limit-usd"); !costArg.empty()) {
        config.costLimitUsd = parseUsd(costArg, "--cost-limit-usd");
    }
    if (auto outArg = valueFromArgs(argc, argv, "--output-dir"); !outArg.empty()) {
        config.outputDir = trim(outArg);
    }
    if (auto concurrencyArg = valueFromArgs(argc, argv, "--concurrency"); !concurrencyArg.empty()) {
        config.concurrency = parseSize(concurrencyArg, "--concurrency", 1);
    }
    if (auto limitArg = valueFromArgs(argc, argv, "--limit"); !limitArg.empty()) {
        config.limit = parseSize(limitArg, "--limit", 0);
    }
    if (auto levelArg = valueFromArgs(argc, argv, "--log-level"); !levelArg.empty()) {
        config.logLevel = harvest::log::levelFromString(toLower(levelArg));
    }
    if (hasFlag(argc, argv, "--debug")) {
        config.logLevel = harvest::log::Level::Debug;
    }
    if (auto timeoutArg = valueFromArgs(argc, argv, "--timeout-sec"); !timeoutArg.empty()) {
        config.timeoutSec = parseSeconds(timeoutArg, "--timeout-sec");
    }
    if (auto caArg = valueFromArgs(argc, argv, "--ca-file"); !caArg.empty()) {
        config.caFile = trim(caArg);
    }
    if (auto verifyArg = valueFromArgs(argc, argv, "--verify-tls"); !verifyArg.empty()) {
        config.verifyTls = parseBool(verifyArg);
    }
    if (auto legacyArg = valueFromArgs(argc, argv, "--legacy-host"); !legacyArg.empty()) {
        config.legacyHost = parseHost(legacyArg, "--legacy-host");
    }
    if (auto partitionedArg = valueFromArgs(argc, argv, "--partitioned-host"); !partitionedArg.empty()) {
        config.partitionedHost = parseHost(partitionedArg, "--partitioned-host");
    }

    if (config.country.empty()) {
        throw std::runtime_error("--country is required");
    }
    if (config.outputDir.empty()) {
        throw std::runtime_error("--output-dir is required");
    }
    if (config.firstDate > config.lastDate) {
        throw std::runtime_error("--first-date " + config.firstDate.toIso() + " is after --last-date " +
                                 config.lastDate.toIso());
    }
    if (config.testType.empty()) {
        throw std::runtime_error("--test-type must not be empty");
    }

    return config;
}

}  // namespace harvest::common
