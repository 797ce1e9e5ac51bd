/**
 * @file mac_address.hpp
 * @brief Hardware address used as the identity of a device.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#pragma once

#include "lumen/core/export.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

namespace lumen {
namespace core {

/**
 * @class MacAddress
 * @brief Immutable 6-byte hardware address, compared byte-for-byte.
 *
 * Devices report their address as 12 hex digits ("a8bb5006e1c2"); the
 * canonical text form is upper-case and colon separated
 * ("A8:BB:50:06:E1:C2").
 */
class LUMEN_CORE_API MacAddress {
public:
    static constexpr size_t kLength = 6;
    using Bytes = std::array<uint8_t, kLength>;

    /**
     * @brief The all-zero address.
     */
    MacAddress() : bytes_{} {}

    explicit MacAddress(const Bytes& bytes) : bytes_(bytes) {}

    /**
     * @brief Parse 12 hex digits, optionally separated by ':' or '-'.
     * @return The address, or std::nullopt if the text is not a MAC address.
     */
    static std::optional<MacAddress> parse(const std::string& text);

    /**
     * @brief The all-zero address, used where a device reported none.
     */
    static MacAddress none() { return MacAddress(); }

    bool isNone() const;

    const Bytes& bytes() const { return bytes_; }

    /**
     * @brief Canonical form, "AA:BB:CC:DD:EE:FF".
     */
    std::string toString() const;

    /**
     * @brief Lower-case digits without separators, "aabbccddeeff".
     * This is the form the device protocol expects in parameters.
     */
    std::string toCompactString() const;

    bool operator==(const MacAddress& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const MacAddress& other) const { return bytes_ != other.bytes_; }
    bool operator<(const MacAddress& other) const { return bytes_ < other.bytes_; }

private:
    Bytes bytes_;
};

inline std::ostream& operator<<(std::ostream& os, const MacAddress& mac) {
    return os << mac.toString();
}

}  // namespace core
}  // namespace lumen

namespace std {

template<>
struct hash<lumen::core::MacAddress> {
    size_t operator()(const lumen::core::MacAddress& mac) const noexcept {
        uint64_t value = 0;
        for (uint8_t b : mac.bytes()) {
            value = (value << 8) | b;
        }
        return std::hash<uint64_t>{}(value);
    }
};

}  // namespace std
