#include "HapFormat.h"

#include <map>

namespace hapble {

namespace {

const std::map<std::string, HapFormat>& formatTokens() {
    static const std::map<std::string, HapFormat> tokens = {
        {"bool", HapFormat::Bool},
        {"uint8", HapFormat::UInt8},
        {"uint16", HapFormat::UInt16},
        {"uint32", HapFormat::UInt32},
        {"uint64", HapFormat::UInt64},
        {"int", HapFormat::Int},
        {"float", HapFormat::Float},
        {"string", HapFormat::String},
        {"data", HapFormat::Data}
    };
    return tokens;
}

} // anonymous namespace

bool tryParseHapFormat(const std::string& token, HapFormat& format) {
    auto it = formatTokens().find(token);
    if (it == formatTokens().end()) {
        return false;
    }

    format = it->second;
    return true;
}

HapFormat parseHapFormat(const std::string& token) {
    HapFormat format;
    if (!tryParseHapFormat(token, format)) {
        throw UnsupportedFormatError(token);
    }
    return format;
}

std::string toString(HapFormat format) {
    switch (format) {
        case HapFormat::Bool: return "bool";
        case HapFormat::UInt8: return "uint8";
        case HapFormat::UInt16: return "uint16";
        case HapFormat::UInt32: return "uint32";
        case HapFormat::UInt64: return "uint64";
        case HapFormat::Int: return "int";
        case HapFormat::Float: return "float";
        case HapFormat::String: return "string";
        case HapFormat::Data: return "data";
    }

    throw UnsupportedFormatError(std::to_string(static_cast<int>(format)));
}

size_t fixedSizeOf(HapFormat format) {
    switch (format) {
        case HapFormat::Bool:
        case HapFormat::UInt8:
            return 1;
        case HapFormat::UInt16:
            return 2;
        case HapFormat::UInt32:
        case HapFormat::Int:
        case HapFormat::Float:
            return 4;
        case HapFormat::UInt64:
            return 8;
        case HapFormat::String:
        case HapFormat::Data:
            return 0;
    }

    throw UnsupportedFormatError(std::to_string(static_cast<int>(format)));
}

} // namespace hapble
