#pragma once

#include <stdexcept>
#include <string>

namespace hapble {

/**
 * @brief HAP characteristic value formats understood by the value codec
 *
 * External metadata names these with text tokens ("uint16", "data", ...); see parseHapFormat().
 */
enum class HapFormat {
    Bool,
    UInt8,
    UInt16,
    UInt32,
    UInt64,
    Int,    ///< signed 32-bit
    Float,  ///< IEEE-754 single precision
    String, ///< UTF-8 text
    Data    ///< opaque bytes, base64 text on the application side
};

/**
 * @brief Thrown when a format token or enum value is outside the supported set
 */
class UnsupportedFormatError : public std::invalid_argument {
public:
    explicit UnsupportedFormatError(const std::string& format)
        : std::invalid_argument("Unknown format type: " + format), m_format(format) {}

    /**
     * @brief The offending format token
     */
    const std::string& format() const { return m_format; }

private:
    std::string m_format;
};

/**
 * @brief Parse a HAP format token
 *
 * Tokens are matched exactly: bool, uint8, uint16, uint32, uint64, int, float, string, data.
 *
 * @param token Format token from characteristic metadata
 * @return The matching format
 * @throws UnsupportedFormatError if the token is not recognized
 */
HapFormat parseHapFormat(const std::string& token);

/**
 * @brief Non-throwing variant of parseHapFormat()
 *
 * @return true and sets `format` when the token is recognized
 */
bool tryParseHapFormat(const std::string& token, HapFormat& format);

/**
 * @brief Text token for a format
 *
 * @throws UnsupportedFormatError for values outside the enumeration
 */
std::string toString(HapFormat format);

/**
 * @brief Number of bytes a fixed-width format occupies on the wire, or 0 for String and Data
 */
size_t fixedSizeOf(HapFormat format);

} // namespace hapble
