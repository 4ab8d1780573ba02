// Minimal console logger shared by the engine, the game rules and the CLI.
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

namespace Scox {

enum class LogLevel { Info, Warning, Error };

class Logger {
public:
    static void log(LogLevel level, std::string_view message);

    static std::string_view label(LogLevel level);
    // "[<clock>] [<LABEL>] <message>" without the trailing newline.
    static std::string formatLine(std::string_view clock, LogLevel level, std::string_view message);

    // Messages below this level are dropped (defaults to Info).
    static void setMinimumLevel(LogLevel level);
    static LogLevel minimumLevel();

    // Redirects every level; nullptr restores stdout for info and stderr otherwise.
    static void setStream(std::ostream* stream);
};

inline void logInfo(std::string_view msg) { Logger::log(LogLevel::Info, msg); }
inline void logWarn(std::string_view msg) { Logger::log(LogLevel::Warning, msg); }
inline void logError(std::string_view msg) { Logger::log(LogLevel::Error, msg); }

}  // namespace Scox
