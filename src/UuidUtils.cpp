#include "UuidUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace hapble {

std::string UuidUtils::toCompact(const std::string &uuid) {
    std::string result = uuid;
    result.erase(std::remove(result.begin(), result.end(), '-'), result.end());
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string UuidUtils::toCanonical(const std::string &uuid) {
    std::string result = uuid;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::toupper(c); });

    if (result.length() != 32) {
        return result;
    }

    result.insert(20, 1, '-');
    result.insert(16, 1, '-');
    result.insert(12, 1, '-');
    result.insert(8, 1, '-');
    return result;
}

std::string UuidUtils::fromShortUuid(uint32_t shortUuid) {
    char part[9];
    snprintf(part, sizeof(part), "%08X", shortUuid);
    return std::string(part) + kHapBaseUuidSuffix;
}

bool UuidUtils::isCanonical(const std::string &uuid) {
    if (uuid.length() != 36) {
        return false;
    }

    for (size_t i = 0; i < uuid.length(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (uuid[i] != '-') return false;
        } else if (!isxdigit(static_cast<unsigned char>(uuid[i]))) {
            return false;
        }
    }

    return true;
}

} // namespace hapble
