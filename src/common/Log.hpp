#pragma once

#include <functional>
#include <sstream>
#include <string>
#include <string_view>

namespace harvest::log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

void setLevel(Level level) noexcept;
Level getLevel() noexcept;
bool shouldLog(Level level) noexcept;
void log(Level level, const std::string& message);
const char* levelToString(Level level) noexcept;
Level levelFromString(std::string_view text);

// Replaces the console output. An empty sink restores it.
using Sink = std::function<void(Level, const std::string&)>;
void setSink(Sink sink);

}  // namespace harvest::log

#define HARVEST_LOG_IMPL(level, expr)                                                      \
    do {                                                                                   \
        if (::harvest::log::shouldLog(level)) {                                            \
            std::ostringstream harvest_log_stream__;                                       \
            harvest_log_stream__ << expr;                                                  \
            ::harvest::log::log(level, harvest_log_stream__.str());                        \
        }                                                                                  \
    } while (false)

#define LOG_DEBUG(expr) HARVEST_LOG_IMPL(::harvest::log::Level::Debug, expr)
#define LOG_INFO(expr) HARVEST_LOG_IMPL(::harvest::log::Level::Info, expr)
#define LOG_WARN(expr) HARVEST_LOG_IMPL(::harvest::log::Level::Warn, expr)
#define LOG_ERR(expr) HARVEST_LOG_IMPL(::harvest::log::Level::Error, expr)
