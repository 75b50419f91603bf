#pragma once

#include <string>
#include <stdint.h>

namespace hapble {

// "0000180D-0000-1000-8000-00805F9B34FB" (canonical) <-> "0000180d00001000800000805f9b34fb" (compact)
struct UuidUtils {
    // Base UUID for HAP-defined services and characteristics
    static constexpr const char *kHapBaseUuidSuffix = "-0000-1000-8000-0026BB765291";

    // Returns the compact form used by the BLE stack: lower case with all dashes removed.
    //
    // No validation is done; "2A37" becomes "2a37" and a canonical UUID loses its four dashes.
    static std::string toCompact(const std::string &uuid);

    // Returns the canonical form: upper case, grouped 8-4-4-4-12.
    //
    // Input that is not exactly 32 characters long is returned upper cased but otherwise unchanged, so an
    // already-dashed UUID or a short 16-bit UUID passes straight through.
    static std::string toCanonical(const std::string &uuid);

    // Expands a HAP short UUID (e.g. 0x25 for the On characteristic) onto the HAP base UUID:
    //
    //     0x25 -> "00000025-0000-1000-8000-0026BB765291"
    static std::string fromShortUuid(uint32_t shortUuid);

    // True if `uuid` is a 36-character dashed UUID with hex digits everywhere else (either case)
    static bool isCanonical(const std::string &uuid);
};

} // namespace hapble
