#pragma once

#include <stdexcept>
#include <string>
#include <variant>
#include <vector>
#include <cstdint>

#include "HapFormat.h"

namespace hapble {

using ByteBuffer = std::vector<uint8_t>;

/**
 * @brief Application-side value of a HAP characteristic
 *
 * decode() returns the alternative native to the format; `Data` decodes to base64 text. encode() accepts
 * any numeric alternative for the numeric formats, and text or raw bytes for `Data`.
 *
 * Construct with an exactly-typed value (`HapValue{uint16_t(3000)}`, `HapValue{std::string("on")}`), since a
 * bare int literal or `const char*` does not select the intended alternative.
 */
using HapValue = std::variant<bool, uint8_t, uint16_t, uint32_t, uint64_t, int32_t, float, std::string, ByteBuffer>;

/**
 * @brief How a uint64 buffer is turned back into a number
 */
enum class Uint64Decoding {
    Legacy, ///< low word if non-zero, otherwise the high word as int32, sign-extended
    Full    ///< low | (high << 32)
};

/**
 * @brief Thrown when a buffer holds fewer bytes than a fixed-width format needs
 */
class BufferTooShortError : public std::out_of_range {
public:
    BufferTooShortError(HapFormat format, size_t required, size_t actual);

    size_t required() const { return m_required; }
    size_t actual() const { return m_actual; }

private:
    size_t m_required;
    size_t m_actual;
};

/**
 * @brief Thrown when a value's type cannot be written in the requested format
 */
class InvalidValueError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * @brief Converts HAP characteristic values to and from GATT value payloads
 *
 * All fixed-width formats are little-endian. Integers wrap to the field width on encode.
 */
class ValueCodec {
public:
    explicit ValueCodec(Uint64Decoding uint64Decoding = Uint64Decoding::Legacy);

    /**
     * @brief Unpack a value from a buffer
     *
     * @param buffer GATT value payload
     * @param format HAP data format
     * @return Decoded value
     * @throws BufferTooShortError if a fixed-width format has too few bytes
     * @throws UnsupportedFormatError for formats outside the enumeration
     */
    HapValue decode(const ByteBuffer& buffer, HapFormat format) const;

    /**
     * @brief Unpack a value using a text format token
     *
     * @throws UnsupportedFormatError if the token is unknown
     */
    HapValue decode(const ByteBuffer& buffer, const std::string& format) const;

    /**
     * @brief Pack a value into a buffer
     *
     * @param value Value to pack
     * @param format HAP data format
     * @return Packed buffer
     * @throws InvalidValueError if the value's type does not fit the format
     * @throws UnsupportedFormatError for formats outside the enumeration
     */
    ByteBuffer encode(const HapValue& value, HapFormat format) const;

    /**
     * @brief Pack a value using a text format token
     *
     * @throws UnsupportedFormatError if the token is unknown
     */
    ByteBuffer encode(const HapValue& value, const std::string& format) const;

    Uint64Decoding getUint64Decoding() const { return uint64Decoding; }
    void setUint64Decoding(Uint64Decoding mode) { uint64Decoding = mode; }

private:
    Uint64Decoding uint64Decoding;
};

/**
 * @brief Human readable form of a value for log lines ("true", "3000", "\"text\"", "[3 bytes]")
 */
std::string describeValue(const HapValue& value);

} // namespace hapble
