/**
 * @file mac_address.cpp
 * @brief MacAddress implementation.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#include "lumen/core/mac_address.hpp"

namespace lumen {
namespace core {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string format(const MacAddress::Bytes& bytes, const char* digits, bool separated) {
    std::string out;
    out.reserve(separated ? 17 : 12);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (separated && i > 0) {
            out += ':';
        }
        out += digits[bytes[i] >> 4];
        out += digits[bytes[i] & 0x0F];
    }
    return out;
}

}  // namespace

std::optional<MacAddress> MacAddress::parse(const std::string& text) {
    Bytes bytes{};
    size_t nibbles = 0;
    char separator = '\0';

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == ':' || c == '-') {
            // Separators only between byte pairs, and never mixed
            if (nibbles == 0 || nibbles % 2 != 0 || (separator && separator != c)) {
                return std::nullopt;
            }
            separator = c;
            continue;
        }
        int value = hexValue(c);
        if (value < 0 || nibbles >= kLength * 2) {
            return std::nullopt;
        }
        bytes[nibbles / 2] = static_cast<uint8_t>((bytes[nibbles / 2] << 4) | value);
        ++nibbles;
    }

    if (nibbles != kLength * 2) {
        return std::nullopt;
    }
    if (separator && text.size() != kLength * 3 - 1) {
        return std::nullopt;
    }
    return MacAddress(bytes);
}

bool MacAddress::isNone() const {
    for (uint8_t b : bytes_) {
        if (b != 0) {
            return false;
        }
    }
    return true;
}

std::string MacAddress::toString() const {
    return format(bytes_, "0123456789ABCDEF", true);
}

std::string MacAddress::toCompactString() const {
    return format(bytes_, "0123456789abcdef", false);
}

}  // namespace core
}  // namespace lumen
