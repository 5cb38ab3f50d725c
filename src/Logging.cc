#include "Logging.hh"

#include <array>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <string_view>

namespace Blackjack {

namespace {

using namespace std::string_view_literals;

constexpr auto LEVEL_NAMES = std::array {
    ""sv, "FATAL   "sv, "ERROR   "sv, "WARNING "sv, "INFO    "sv, "DEBUG   "sv,
};

auto globalLoggingStream = std::ref(std::cerr);
auto globalLoggingLevel = LogLevel::WARNING;

}

namespace Impl {

bool startEntry(const LogLevel level)
{
    if (level == LogLevel::NONE || level > globalLoggingLevel) {
        return false;
    }
    const auto time = std::time(nullptr);
    logStream() << std::put_time(std::localtime(&time), "%c ") <<
        LEVEL_NAMES.at(static_cast<std::size_t>(level));
    return true;
}

std::ostream& logStream()
{
    return globalLoggingStream;
}

}

LogLevel getLogLevel(const int verbosity)
{
    if (verbosity >= 2) {
        return LogLevel::DEBUG;
    } else if (verbosity == 1) {
        return LogLevel::INFO;
    }
    return LogLevel::WARNING;
}

void setupLogging(const LogLevel level, std::ostream& stream)
{
    globalLoggingLevel = level;
    globalLoggingStream = stream;
}

}
