#include "ValueCodec.h"

#include <glib.h>
#include <endian.h>
#include <cmath>
#include <cstring>
#include <sstream>
#include <type_traits>

#include "GLibTypes.h"
#include "Logger.h"

namespace hapble {

namespace {

// Helper for static_assert in exhaustive visitors
template <typename>
inline constexpr bool kAlwaysFalse = false;

uint16_t readUInt16LE(const ByteBuffer& buffer) {
    uint16_t value;
    memcpy(&value, buffer.data(), sizeof(value));
    return le16toh(value);
}

uint32_t readUInt32LE(const ByteBuffer& buffer, size_t offset = 0) {
    uint32_t value;
    memcpy(&value, buffer.data() + offset, sizeof(value));
    return le32toh(value);
}

void writeUInt16LE(ByteBuffer& buffer, uint16_t value) {
    value = htole16(value);
    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(&value);
    buffer.insert(buffer.end(), bytes, bytes + sizeof(value));
}

void writeUInt32LE(ByteBuffer& buffer, uint32_t value) {
    value = htole32(value);
    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(&value);
    buffer.insert(buffer.end(), bytes, bytes + sizeof(value));
}

// Truncates toward zero. NaN is 0, values beyond the 64-bit range saturate.
uint64_t floatToWireInteger(float value) {
    if (std::isnan(value)) {
        return 0;
    }

    double truncated = std::trunc(static_cast<double>(value));
    if (truncated >= 0) {
        if (truncated >= 18446744073709551616.0) {
            return UINT64_MAX;
        }
        return static_cast<uint64_t>(truncated);
    }

    if (truncated < -9223372036854775808.0) {
        return static_cast<uint64_t>(INT64_MIN);
    }
    return static_cast<uint64_t>(static_cast<int64_t>(truncated));
}

// Two's complement bit pattern of a numeric value; callers mask it to the field width
uint64_t toWireInteger(const HapValue& value, HapFormat format) {
    return std::visit([format](const auto& v) -> uint64_t {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? 1 : 0;
        } else if constexpr (std::is_same_v<T, int32_t>) {
            return static_cast<uint64_t>(static_cast<int64_t>(v));
        } else if constexpr (std::is_integral_v<T>) {
            return static_cast<uint64_t>(v);
        } else if constexpr (std::is_same_v<T, float>) {
            return floatToWireInteger(v);
        } else if constexpr (std::is_same_v<T, std::string> || std::is_same_v<T, ByteBuffer>) {
            throw InvalidValueError("Cannot encode a non-numeric value as " + toString(format));
        } else {
            static_assert(kAlwaysFalse<T>, "unhandled HapValue alternative");
        }
    }, value);
}

float toFloat(const HapValue& value) {
    return std::visit([](const auto& v) -> float {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? 1.0f : 0.0f;
        } else if constexpr (std::is_arithmetic_v<T>) {
            return static_cast<float>(v);
        } else {
            throw InvalidValueError("Cannot encode a non-numeric value as float");
        }
    }, value);
}

bool isTruthy(const HapValue& value) {
    return std::visit([](const auto& v) -> bool {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v;
        } else if constexpr (std::is_same_v<T, float>) {
            return v != 0.0f && !std::isnan(v);
        } else if constexpr (std::is_arithmetic_v<T>) {
            return v != 0;
        } else if constexpr (std::is_same_v<T, std::string>) {
            return !v.empty();
        } else {
            return true;
        }
    }, value);
}

std::string makeValidUtf8(const gchar* text, gssize length) {
    if (length == 0) {
        return "";
    }
    if (g_utf8_validate(text, length, nullptr)) {
        return std::string(text, static_cast<size_t>(length));
    }

    // Invalid sequences become U+FFFD
    GCharPtr valid(g_utf8_make_valid(text, length));
    return std::string(valid.get());
}

// g_utf8_validate() rejects NUL, so each NUL-separated run is checked on its own
std::string decodeUtf8(const ByteBuffer& buffer) {
    const gchar* text = reinterpret_cast<const gchar*>(buffer.data());
    std::string result;
    size_t start = 0;
    for (size_t i = 0; i <= buffer.size(); ++i) {
        if (i == buffer.size() || buffer[i] == 0) {
            result += makeValidUtf8(text + start, static_cast<gssize>(i - start));
            if (i < buffer.size()) {
                result.push_back('\0');
            }
            start = i + 1;
        }
    }
    return result;
}

std::string encodeBase64(const ByteBuffer& buffer) {
    GCharPtr encoded(g_base64_encode(buffer.data(), buffer.size()));
    return encoded ? std::string(encoded.get()) : std::string();
}

ByteBuffer decodeBase64(const std::string& text) {
    gsize length = 0;
    GUCharPtr decoded(g_base64_decode(text.c_str(), &length));
    if (!decoded || length == 0) {
        return ByteBuffer();
    }
    return ByteBuffer(decoded.get(), decoded.get() + length);
}

} // anonymous namespace

BufferTooShortError::BufferTooShortError(HapFormat format, size_t required, size_t actual)
    : std::out_of_range("Buffer too short for " + toString(format) + ": need " + std::to_string(required) +
                        " bytes, got " + std::to_string(actual)),
      m_required(required), m_actual(actual) {
}

ValueCodec::ValueCodec(Uint64Decoding uint64Decoding)
    : uint64Decoding(uint64Decoding) {
}

HapValue ValueCodec::decode(const ByteBuffer& buffer, const std::string& format) const {
    return decode(buffer, parseHapFormat(format));
}

HapValue ValueCodec::decode(const ByteBuffer& buffer, HapFormat format) const {
    size_t required = fixedSizeOf(format);
    if (buffer.size() < required) {
        throw BufferTooShortError(format, required, buffer.size());
    }

    switch (format) {
        case HapFormat::Bool:
            return buffer[0] != 0;
        case HapFormat::UInt8:
            return buffer[0];
        case HapFormat::UInt16:
            return readUInt16LE(buffer);
        case HapFormat::UInt32:
            return readUInt32LE(buffer);
        case HapFormat::UInt64: {
            uint64_t low = readUInt32LE(buffer, 0);
            uint64_t high = readUInt32LE(buffer, 4);
            if (uint64Decoding == Uint64Decoding::Full) {
                return low | (high << 32);
            }
            if (low != 0) {
                return low;
            }
            // The high word alone, read as a signed 32-bit number and sign-extended
            return static_cast<uint64_t>(static_cast<int64_t>(static_cast<int32_t>(high)));
        }
        case HapFormat::Int:
            return static_cast<int32_t>(readUInt32LE(buffer));
        case HapFormat::Float: {
            uint32_t bits = readUInt32LE(buffer);
            float value;
            memcpy(&value, &bits, sizeof(value));
            return value;
        }
        case HapFormat::String:
            return decodeUtf8(buffer);
        case HapFormat::Data:
            return encodeBase64(buffer);
    }

    throw UnsupportedFormatError(std::to_string(static_cast<int>(format)));
}

ByteBuffer ValueCodec::encode(const HapValue& value, const std::string& format) const {
    return encode(value, parseHapFormat(format));
}

ByteBuffer ValueCodec::encode(const HapValue& value, HapFormat format) const {
    ByteBuffer buffer;

    switch (format) {
        case HapFormat::Bool:
            buffer.push_back(isTruthy(value) ? 0x01 : 0x00);
            break;
        case HapFormat::UInt8:
            buffer.push_back(static_cast<uint8_t>(toWireInteger(value, format) & 0xff));
            break;
        case HapFormat::UInt16:
            writeUInt16LE(buffer, static_cast<uint16_t>(toWireInteger(value, format)));
            break;
        case HapFormat::UInt32:
        case HapFormat::Int:
            writeUInt32LE(buffer, static_cast<uint32_t>(toWireInteger(value, format)));
            break;
        case HapFormat::UInt64: {
            uint64_t bits = toWireInteger(value, format);
            writeUInt32LE(buffer, static_cast<uint32_t>(bits & 0xffffffff));
            writeUInt32LE(buffer, static_cast<uint32_t>(bits >> 32));
            break;
        }
        case HapFormat::Float: {
            float f = toFloat(value);
            uint32_t bits;
            memcpy(&bits, &f, sizeof(bits));
            writeUInt32LE(buffer, bits);
            break;
        }
        case HapFormat::String:
            if (const auto* text = std::get_if<std::string>(&value)) {
                buffer.assign(text->begin(), text->end());
            } else if (const auto* bytes = std::get_if<ByteBuffer>(&value)) {
                buffer = *bytes;
            } else {
                throw InvalidValueError("Cannot encode a numeric value as string");
            }
            break;
        case HapFormat::Data:
            if (const auto* text = std::get_if<std::string>(&value)) {
                buffer = decodeBase64(*text);
            } else if (const auto* bytes = std::get_if<ByteBuffer>(&value)) {
                buffer = *bytes;
            } else {
                throw InvalidValueError("Cannot encode a numeric value as data");
            }
            break;
        default:
            throw UnsupportedFormatError(std::to_string(static_cast<int>(format)));
    }

    Logger::trace(SSTR << "Encoded " << describeValue(value) << " as " << toString(format)
                       << " (" << buffer.size() << " bytes)");
    return buffer;
}

std::string describeValue(const HapValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, float>) {
            std::ostringstream out;
            out << v;
            return out.str();
        } else if constexpr (std::is_arithmetic_v<T>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + v + "\"";
        } else {
            return "[" + std::to_string(v.size()) + " bytes]";
        }
    }, value);
}

} // namespace hapble
