#pragma once

#include <array>
#include <sstream>
#include <functional>
#include <string>

namespace hapble {

// Our handy stringstream macro
#define SSTR std::ostringstream().flush()

class Logger {
public:
    // Log levels, lowest to highest
    enum class Level {
        TRACE,
        DEBUG,
        INFO,
        STATUS,
        WARN,
        ERROR,
        FATAL,
        ALWAYS
    };

    using LogReceiver = std::function<void(const char*)>;

    // Registration
    static void registerReceiver(Level level, LogReceiver receiver);
    static void registerTraceReceiver(LogReceiver receiver) { registerReceiver(Level::TRACE, std::move(receiver)); }
    static void registerDebugReceiver(LogReceiver receiver) { registerReceiver(Level::DEBUG, std::move(receiver)); }
    static void registerInfoReceiver(LogReceiver receiver) { registerReceiver(Level::INFO, std::move(receiver)); }
    static void registerStatusReceiver(LogReceiver receiver) { registerReceiver(Level::STATUS, std::move(receiver)); }
    static void registerWarnReceiver(LogReceiver receiver) { registerReceiver(Level::WARN, std::move(receiver)); }
    static void registerErrorReceiver(LogReceiver receiver) { registerReceiver(Level::ERROR, std::move(receiver)); }
    static void registerFatalReceiver(LogReceiver receiver) { registerReceiver(Level::FATAL, std::move(receiver)); }
    static void registerAlwaysReceiver(LogReceiver receiver) { registerReceiver(Level::ALWAYS, std::move(receiver)); }

    // Installs stdout/stderr receivers prefixed with the level name for every level
    static void registerConsoleReceivers();

    // Removes every receiver
    static void clearReceivers();

    // Global log level
    static void setLogLevel(Level level);
    static Level getLogLevel();

    // Parses "trace", "DEBUG", "warn", ... Returns false and leaves `level` untouched on unknown names.
    static bool levelFromString(const std::string& name, Level& level);
    static const char* levelToString(Level level);

    // Universal log method with level parameter
    static void log(Level level, const std::string& message);
    static void log(Level level, const std::ostream& message);

    static void trace(const std::string& text) { log(Level::TRACE, text); }
    static void trace(const std::ostream& text) { log(Level::TRACE, text); }

    static void debug(const std::string& text) { log(Level::DEBUG, text); }
    static void debug(const std::ostream& text) { log(Level::DEBUG, text); }

    static void info(const std::string& text) { log(Level::INFO, text); }
    static void info(const std::ostream& text) { log(Level::INFO, text); }

    static void status(const std::string& text) { log(Level::STATUS, text); }
    static void status(const std::ostream& text) { log(Level::STATUS, text); }

    static void warn(const std::string& text) { log(Level::WARN, text); }
    static void warn(const std::ostream& text) { log(Level::WARN, text); }

    static void error(const std::string& text) { log(Level::ERROR, text); }
    static void error(const std::ostream& text) { log(Level::ERROR, text); }

    static void fatal(const std::string& text) { log(Level::FATAL, text); }
    static void fatal(const std::ostream& text) { log(Level::FATAL, text); }

    // ALWAYS entries bypass the level filter
    static void always(const std::string& text) { log(Level::ALWAYS, text); }
    static void always(const std::ostream& text) { log(Level::ALWAYS, text); }

private:
    static constexpr size_t kLevelCount = static_cast<size_t>(Level::ALWAYS) + 1;

    static std::array<LogReceiver, kLevelCount> receivers;
    static Level currentLogLevel;

    static bool shouldLog(Level messageLevel);
};

} // namespace hapble
