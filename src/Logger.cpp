#include "Logger.h"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace hapble {

std::array<Logger::LogReceiver, Logger::kLevelCount> Logger::receivers;
Logger::Level Logger::currentLogLevel = Logger::Level::INFO;

//
// Registration
//

void Logger::registerReceiver(Level level, LogReceiver receiver) {
    receivers[static_cast<size_t>(level)] = std::move(receiver);
}

void Logger::registerConsoleReceivers() {
    for (size_t i = 0; i < kLevelCount; ++i) {
        Level level = static_cast<Level>(i);
        const char* prefix = levelToString(level);
        bool useStderr = level == Level::ERROR || level == Level::FATAL;

        receivers[i] = [prefix, useStderr](const char* msg) {
            std::ostream& out = useStderr ? std::cerr : std::cout;
            out << prefix << ": " << msg << std::endl;
        };
    }
}

void Logger::clearReceivers() {
    for (auto& receiver : receivers) {
        receiver = nullptr;
    }
}

void Logger::setLogLevel(Level level) {
    currentLogLevel = level;
}

Logger::Level Logger::getLogLevel() {
    return currentLogLevel;
}

bool Logger::shouldLog(Level messageLevel) {
    if (messageLevel == Level::ALWAYS) {
        return true;
    }
    return static_cast<int>(messageLevel) >= static_cast<int>(currentLogLevel);
}

const char* Logger::levelToString(Level level) {
    switch (level) {
        case Level::TRACE: return "TRACE";
        case Level::DEBUG: return "DEBUG";
        case Level::INFO: return "INFO";
        case Level::STATUS: return "STATUS";
        case Level::WARN: return "WARN";
        case Level::ERROR: return "ERROR";
        case Level::FATAL: return "FATAL";
        case Level::ALWAYS: return "ALWAYS";
        default: return "UNKNOWN";
    }
}

bool Logger::levelFromString(const std::string& name, Level& level) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return std::toupper(c); });

    for (size_t i = 0; i < kLevelCount; ++i) {
        Level candidate = static_cast<Level>(i);
        if (upper == levelToString(candidate)) {
            level = candidate;
            return true;
        }
    }

    return false;
}

//
// Logging actions
//

void Logger::log(Level level, const std::string& message) {
    if (!shouldLog(level)) {
        return;
    }

    const LogReceiver& receiver = receivers[static_cast<size_t>(level)];
    if (receiver) {
        receiver(message.c_str());
    }
}

void Logger::log(Level level, const std::ostream& message) {
    if (!shouldLog(level) || !receivers[static_cast<size_t>(level)]) {
        return;
    }

    log(level, static_cast<const std::ostringstream&>(message).str());
}

} // namespace hapble
