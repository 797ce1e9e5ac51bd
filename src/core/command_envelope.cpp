/**
 * @file command_envelope.cpp
 * @brief CommandEnvelope and PilotParams JSON mapping.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#include "lumen/core/command_envelope.hpp"

#include <cstdint>
#include <limits>

namespace lumen {
namespace core {

using nlohmann::json;

namespace {

// Applies fn(key, fieldOfA, fieldOfB) to every named field of two params
// objects. Passing the same object twice visits a single one.
template<typename A, typename B, typename Fn>
void zipFields(A& a, B& b, Fn&& fn) {
    fn("mac", a.mac, b.mac);
    fn("rssi", a.rssi, b.rssi);
    fn("src", a.src, b.src);
    fn("state", a.state, b.state);
    fn("sceneId", a.sceneId, b.sceneId);
    fn("speed", a.speed, b.speed);
    fn("temp", a.temp, b.temp);
    fn("dimming", a.dimming, b.dimming);
    fn("r", a.r, b.r);
    fn("g", a.g, b.g);
    fn("b", a.b, b.b);
    fn("c", a.c, b.c);
    fn("w", a.w, b.w);
    fn("homeId", a.homeId, b.homeId);
    fn("roomId", a.roomId, b.roomId);
    fn("moduleName", a.moduleName, b.moduleName);
    fn("fwVersion", a.fwVersion, b.fwVersion);
    fn("success", a.success, b.success);
    fn("phoneMac", a.phoneMac, b.phoneMac);
    fn("phoneIp", a.phoneIp, b.phoneIp);
    fn("register", a.registration, b.registration);
    fn("id", a.id, b.id);
}

// Integers that do not fit an int are left for extras
bool readValue(const json& value, std::optional<int>& out) {
    if (value.is_number_unsigned()) {
        uint64_t number = value.get<uint64_t>();
        if (number > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            return false;
        }
        out = static_cast<int>(number);
        return true;
    }
    if (!value.is_number_integer()) {
        return false;
    }
    int64_t number = value.get<int64_t>();
    if (number < std::numeric_limits<int>::min() || number > std::numeric_limits<int>::max()) {
        return false;
    }
    out = static_cast<int>(number);
    return true;
}

bool readValue(const json& value, std::optional<bool>& out) {
    if (!value.is_boolean()) {
        return false;
    }
    out = value.get<bool>();
    return true;
}

bool readValue(const json& value, std::optional<std::string>& out) {
    if (!value.is_string()) {
        return false;
    }
    out = value.get<std::string>();
    return true;
}

}  // namespace

// ============================================================================
// DeviceMethod
// ============================================================================

const char* deviceMethodToString(DeviceMethod method) {
    switch (method) {
        case DeviceMethod::GetPilot: return "getPilot";
        case DeviceMethod::SetPilot: return "setPilot";
        case DeviceMethod::GetSystemConfig: return "getSystemConfig";
        case DeviceMethod::GetModelConfig: return "getModelConfig";
        case DeviceMethod::Registration: return "registration";
        default: return "";
    }
}

std::optional<DeviceMethod> parseDeviceMethod(const std::string& name) {
    if (name == "getPilot") return DeviceMethod::GetPilot;
    if (name == "setPilot") return DeviceMethod::SetPilot;
    if (name == "getSystemConfig") return DeviceMethod::GetSystemConfig;
    if (name == "getModelConfig") return DeviceMethod::GetModelConfig;
    if (name == "registration") return DeviceMethod::Registration;
    return std::nullopt;
}

// ============================================================================
// PilotParams
// ============================================================================

void PilotParams::mergeFrom(const PilotParams& other) {
    zipFields(*this, other, [](const char*, auto& mine, const auto& theirs) {
        if (theirs) {
            mine = theirs;
        }
    });
    if (other.extras.is_object()) {
        for (auto it = other.extras.begin(); it != other.extras.end(); ++it) {
            extras[it.key()] = it.value();
        }
    }
}

bool PilotParams::empty() const {
    bool anySet = false;
    zipFields(*this, *this, [&anySet](const char*, const auto& field, const auto&) {
        anySet = anySet || field.has_value();
    });
    return !anySet && (extras.is_null() || extras.empty());
}

json PilotParams::toJson() const {
    json object = json::object();
    if (extras.is_object()) {
        object = extras;
    }
    zipFields(*this, *this, [&object](const char* key, const auto& field, const auto&) {
        if (field) {
            object[key] = *field;
        }
    });
    return object;
}

PilotParams PilotParams::fromJson(const json& object) {
    PilotParams params;
    if (!object.is_object()) {
        return params;
    }

    for (auto it = object.begin(); it != object.end(); ++it) {
        bool known = false;
        bool accepted = false;
        const std::string& key = it.key();
        const json& value = it.value();

        zipFields(params, params, [&](const char* name, auto& field, auto&) {
            if (!known && key == name) {
                known = true;
                accepted = value.is_null() || readValue(value, field);
            }
        });

        if (!known || !accepted) {
            params.extras[key] = value;
        }
    }

    return params;
}

bool PilotParams::operator==(const PilotParams& other) const {
    bool equal = true;
    zipFields(*this, other, [&equal](const char*, const auto& mine, const auto& theirs) {
        equal = equal && mine == theirs;
    });
    return equal && extras == other.extras;
}

// ============================================================================
// CommandEnvelope
// ============================================================================

std::string CommandEnvelope::assemble() const {
    json doc;
    doc["method"] = method;
    doc["params"] = params.toJson();

    if (env) {
        doc["env"] = *env;
    }
    if (result) {
        doc["result"] = result->toJson();
    }
    if (error) {
        doc["error"] = {{"code", error->code}, {"message", error->message}};
    }

    return doc.dump();
}

std::optional<CommandEnvelope> CommandEnvelope::parse(const std::string& text) {
    json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return std::nullopt;
    }

    CommandEnvelope envelope;

    auto it = doc.find("method");
    if (it != doc.end() && !it->is_null()) {
        if (!it->is_string()) {
            return std::nullopt;
        }
        envelope.method = it->get<std::string>();
    }

    it = doc.find("params");
    if (it != doc.end() && !it->is_null()) {
        if (!it->is_object()) {
            return std::nullopt;
        }
        envelope.params = PilotParams::fromJson(*it);
    }

    it = doc.find("result");
    if (it != doc.end() && !it->is_null()) {
        if (!it->is_object()) {
            return std::nullopt;
        }
        envelope.result = PilotParams::fromJson(*it);
    }

    it = doc.find("env");
    if (it != doc.end() && !it->is_null()) {
        if (!it->is_string()) {
            return std::nullopt;
        }
        envelope.env = it->get<std::string>();
    }

    it = doc.find("error");
    if (it != doc.end() && !it->is_null()) {
        if (!it->is_object()) {
            return std::nullopt;
        }
        DeviceErrorInfo info;
        auto code = it->find("code");
        if (code != it->end() && code->is_number_integer()) {
            info.code = code->get<int>();
        }
        auto message = it->find("message");
        if (message != it->end() && message->is_string()) {
            info.message = message->get<std::string>();
        }
        envelope.error = info;
    }

    return envelope;
}

}  // namespace core
}  // namespace lumen
