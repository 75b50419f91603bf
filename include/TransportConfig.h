#pragma once

#include <string>

#include "Logger.h"
#include "OperationWatcher.h"
#include "ValueCodec.h"

namespace hapble {

/**
 * @brief Tunables of the HAP BLE transport helpers
 *
 * Loaded from a GLib key file:
 *
 *     [Watcher]
 *     TimeoutMs=3000
 *
 *     [Codec]
 *     Uint64Decoding=legacy      # or "full"
 *
 *     [Logging]
 *     Level=info
 *
 * Keys that are missing keep their defaults. Keys with invalid values are logged and ignored.
 */
struct TransportConfig {
    static constexpr const char* kWatcherGroup = "Watcher";
    static constexpr const char* kCodecGroup = "Codec";
    static constexpr const char* kLoggingGroup = "Logging";

    unsigned int watcherTimeoutMs = OperationWatcher::kDefaultTimeoutMs;
    Uint64Decoding uint64Decoding = Uint64Decoding::Legacy;
    Logger::Level logLevel = Logger::Level::INFO;

    // Returns false (leaving every field untouched) if the file cannot be read or parsed
    bool loadFromFile(const std::string& path);

    // Same as loadFromFile() for in-memory key file text
    bool loadFromData(const std::string& data);

    // Pushes logLevel into the Logger
    void applyLogLevel() const;

    // A codec using this configuration's uint64 decoding
    ValueCodec makeCodec() const { return ValueCodec(uint64Decoding); }
};

} // namespace hapble
