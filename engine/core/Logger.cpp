#include "Logger.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace Scox {

namespace {
LogLevel gMinimumLevel = LogLevel::Info;
std::ostream* gStream = nullptr;

bool passes(LogLevel level) { return static_cast<int>(level) >= static_cast<int>(gMinimumLevel); }

std::ostream& streamFor(LogLevel level) {
    if (gStream) return *gStream;
    return level == LogLevel::Info ? std::cout : std::cerr;
}

// Local wall clock as HH:MM:SS.mmm.
std::string wallClock() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const auto t = system_clock::to_time_t(now);
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}
}  // namespace

std::string_view Logger::label(LogLevel level) {
    switch (level) {
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARN";
        case LogLevel::Error:
        default:
            return "ERROR";
    }
}

std::string Logger::formatLine(std::string_view clock, LogLevel level, std::string_view message) {
    std::string line;
    line.reserve(clock.size() + message.size() + 12);
    line.append("[").append(clock).append("] [").append(label(level)).append("] ").append(message);
    return line;
}

void Logger::log(LogLevel level, std::string_view message) {
    if (!passes(level)) return;
    streamFor(level) << formatLine(wallClock(), level, message) << '\n';
}

void Logger::setMinimumLevel(LogLevel level) { gMinimumLevel = level; }

LogLevel Logger::minimumLevel() { return gMinimumLevel; }

void Logger::setStream(std::ostream* stream) { gStream = stream; }

}  // namespace Scox
