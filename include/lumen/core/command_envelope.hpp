/**
 * @file command_envelope.hpp
 * @brief JSON wire document exchanged with devices.
 *
 * Every datagram carries exactly one envelope:
 * {"method": ..., "params": {...}, "result": {...}, "env": ..., "error": {...}}
 * Requests carry method and params; replies add result or error.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#pragma once

#include "lumen/core/export.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace lumen {
namespace core {

/**
 * @enum DeviceMethod
 * @brief Protocol methods understood by devices.
 */
enum class DeviceMethod {
    GetPilot,
    SetPilot,
    GetSystemConfig,
    GetModelConfig,
    Registration
};

/**
 * @brief Wire name of a method ("getPilot", "setPilot", ...).
 */
LUMEN_CORE_API const char* deviceMethodToString(DeviceMethod method);

/**
 * @brief Parse a wire method name. Matching is exact.
 */
LUMEN_CORE_API std::optional<DeviceMethod> parseDeviceMethod(const std::string& name);

/**
 * @struct PilotParams
 * @brief Parameters of a request or fields of a reply result.
 *
 * Every field is optional and omitted from the wire when unset. Keys the
 * device reports that have no field here are kept in @c extras.
 */
struct LUMEN_CORE_API PilotParams {
    // Identity and radio
    std::optional<std::string> mac;
    std::optional<int> rssi;
    std::optional<std::string> src;

    // Light state
    std::optional<bool> state;
    std::optional<int> sceneId;
    std::optional<int> speed;
    std::optional<int> temp;
    std::optional<int> dimming;
    std::optional<int> r;
    std::optional<int> g;
    std::optional<int> b;
    std::optional<int> c;
    std::optional<int> w;

    // System config
    std::optional<int> homeId;
    std::optional<int> roomId;
    std::optional<std::string> moduleName;
    std::optional<std::string> fwVersion;

    // setPilot acknowledgement
    std::optional<bool> success;

    // Registration
    std::optional<std::string> phoneMac;
    std::optional<std::string> phoneIp;
    std::optional<bool> registration;   ///< "register" on the wire
    std::optional<std::string> id;

    /// Unrecognized keys, preserved verbatim
    nlohmann::json extras = nlohmann::json::object();

    /**
     * @brief Copy every field that is set in @p other over this one.
     * Extras are merged key by key.
     */
    void mergeFrom(const PilotParams& other);

    /**
     * @brief True if no field is set and extras are empty.
     */
    bool empty() const;

    nlohmann::json toJson() const;

    /**
     * @brief Read parameters from a JSON object. Fields whose value has
     * the wrong type are kept in extras rather than rejected.
     */
    static PilotParams fromJson(const nlohmann::json& object);

    bool operator==(const PilotParams& other) const;
    bool operator!=(const PilotParams& other) const { return !(*this == other); }
};

/**
 * @struct DeviceErrorInfo
 * @brief Error object a device returns instead of a result.
 */
struct LUMEN_CORE_API DeviceErrorInfo {
    int code = 0;
    std::string message;

    bool operator==(const DeviceErrorInfo& other) const {
        return code == other.code && message == other.message;
    }
};

/**
 * @class CommandEnvelope
 * @brief One protocol document.
 *
 * Usage:
 * @code
 * CommandEnvelope cmd(DeviceMethod::SetPilot);
 * cmd.params.state = true;
 * cmd.params.dimming = 80;
 * std::string wire = cmd.assemble();
 *
 * auto reply = CommandEnvelope::parse(responseText);
 * if (reply && reply->result) { ... }
 * @endcode
 */
class LUMEN_CORE_API CommandEnvelope {
public:
    CommandEnvelope() = default;

    explicit CommandEnvelope(DeviceMethod m)
        : method(deviceMethodToString(m))
    {}

    /**
     * @brief Serialize to compact JSON, omitting absent fields.
     * @c params is always written, as an empty object when unset.
     */
    std::string assemble() const;

    /**
     * @brief Decode a datagram payload.
     * @return The envelope, or std::nullopt if the text is not a JSON object
     *         or a known field has the wrong shape.
     */
    static std::optional<CommandEnvelope> parse(const std::string& text);

    /**
     * @brief True if this is a reply (carries a result or an error).
     */
    bool isReply() const { return result.has_value() || error.has_value(); }

    /**
     * @brief The method as an enum, if it is one devices understand.
     */
    std::optional<DeviceMethod> knownMethod() const { return parseDeviceMethod(method); }

    std::string method;
    PilotParams params;
    std::optional<PilotParams> result;
    std::optional<std::string> env;
    std::optional<DeviceErrorInfo> error;
};

}  // namespace core
}  // namespace lumen
