#include "TransportConfig.h"
#include "GLibTypes.h"

#include <glib.h>
#include <climits>

namespace hapble {

namespace {

// Reads an optional string key; absent keys are not an error
bool readString(GKeyFile* keyFile, const char* group, const char* key, std::string& value) {
    if (!g_key_file_has_key(keyFile, group, key, nullptr)) {
        return false;
    }

    GError* rawError = nullptr;
    GCharPtr text(g_key_file_get_string(keyFile, group, key, &rawError));
    GErrorPtr error(rawError);
    if (error) {
        Logger::warn(SSTR << "Ignoring [" << group << "] " << key << ": " << error->message);
        return false;
    }

    value = text.get();
    return true;
}

void applyKeyFile(GKeyFile* keyFile, TransportConfig& config) {
    if (g_key_file_has_key(keyFile, TransportConfig::kWatcherGroup, "TimeoutMs", nullptr)) {
        GError* rawError = nullptr;
        gint64 timeout = g_key_file_get_int64(keyFile, TransportConfig::kWatcherGroup, "TimeoutMs", &rawError);
        GErrorPtr error(rawError);
        if (error) {
            Logger::warn(SSTR << "Ignoring [Watcher] TimeoutMs: " << error->message);
        } else if (timeout < 0 || timeout > UINT_MAX) {
            Logger::warn(SSTR << "Ignoring [Watcher] TimeoutMs: out of range (" << timeout << ")");
        } else {
            config.watcherTimeoutMs = static_cast<unsigned int>(timeout);
        }
    }

    std::string decoding;
    if (readString(keyFile, TransportConfig::kCodecGroup, "Uint64Decoding", decoding)) {
        if (decoding == "legacy") {
            config.uint64Decoding = Uint64Decoding::Legacy;
        } else if (decoding == "full") {
            config.uint64Decoding = Uint64Decoding::Full;
        } else {
            Logger::warn("Ignoring [Codec] Uint64Decoding: unknown mode '" + decoding + "'");
        }
    }

    std::string levelName;
    if (readString(keyFile, TransportConfig::kLoggingGroup, "Level", levelName)) {
        Logger::Level level;
        if (Logger::levelFromString(levelName, level)) {
            config.logLevel = level;
        } else {
            Logger::warn("Ignoring [Logging] Level: unknown level '" + levelName + "'");
        }
    }
}

} // anonymous namespace

bool TransportConfig::loadFromFile(const std::string& path) {
    GKeyFilePtr keyFile(g_key_file_new());
    GError* rawError = nullptr;

    if (!g_key_file_load_from_file(keyFile.get(), path.c_str(), G_KEY_FILE_NONE, &rawError)) {
        GErrorPtr error(rawError);
        Logger::error("Failed to load transport configuration from " + path + ": " +
                      (error ? error->message : "unknown error"));
        return false;
    }

    applyKeyFile(keyFile.get(), *this);
    Logger::info("Transport configuration loaded from " + path);
    return true;
}

bool TransportConfig::loadFromData(const std::string& data) {
    GKeyFilePtr keyFile(g_key_file_new());
    GError* rawError = nullptr;

    if (!g_key_file_load_from_data(keyFile.get(), data.c_str(), data.size(), G_KEY_FILE_NONE, &rawError)) {
        GErrorPtr error(rawError);
        Logger::error(std::string("Failed to parse transport configuration: ") +
                      (error ? error->message : "unknown error"));
        return false;
    }

    applyKeyFile(keyFile.get(), *this);
    return true;
}

void TransportConfig::applyLogLevel() const {
    Logger::setLogLevel(logLevel);
}

} // namespace hapble
