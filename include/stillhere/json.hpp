#pragma once

/**
 * @file json.hpp
 * @brief JSON serialization utilities for stillhere types
 *
 * Uses nlohmann/json for log payloads, HTTP request parsing and responses.
 */

#include "stillhere/device.hpp"
#include "stillhere/identity.hpp"
#include "stillhere/messages.hpp"
#include "stillhere/stillhere.hpp"

#include <nlohmann/json.hpp>

#include <ctime>
#include <iomanip>
#include <sstream>

namespace stillhere {
namespace json {

using nlohmann::json;

// ==================== Timestamp Helpers ====================

/// Format UNIX seconds as an ISO 8601 UTC string ("2026-01-19T12:00:00Z")
[[nodiscard]] inline std::string format_unix_timestamp(UnixSeconds ts) {
    auto time = static_cast<std::time_t>(ts);
    std::tm tm = {};
    gmtime_r(&time, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

// ==================== Device ====================

/// Convert a Device to its JSON representation (camelCase keys, as on the wire)
[[nodiscard]] inline json device_to_json(const Device& device) {
    json j = {
        {"uuid", device.uuid()},
        {"name", device.name()},
        {"lastWill", device.last_will()},
        {"ttl", device.ttl()},
        {"createdAt", device.created_at()},
        {"fireAt", device.fire_at()},
        {"fireAtIso", format_unix_timestamp(device.fire_at())},
        {"consumed", device.consumed()},
        {"versionNumber", device.version_number()},
    };
    if (device.consumer_id()) {
        j["consumerId"] = *device.consumer_id();
    } else {
        j["consumerId"] = nullptr;
    }
    return j;
}

// ==================== Messages ====================

/// Convert any known command or event to JSON; unknown types carry only "type"
[[nodiscard]] inline json message_to_json(const Message& message) {
    json j = {{"type", message.type_name()}};

    if (auto reg = dynamic_cast<const RegisterDevice*>(&message)) {
        j["uuid"] = reg->uuid;
        j["name"] = reg->name;
        j["lastWill"] = reg->last_will;
        j["ttl"] = reg->ttl;
    } else if (auto rem = dynamic_cast<const RemoveDevice*>(&message)) {
        j["uuid"] = rem->uuid;
    } else if (auto keep = dynamic_cast<const KeepAliveDevice*>(&message)) {
        j["uuid"] = keep->uuid;
    } else if (auto registered = dynamic_cast<const DeviceRegistered*>(&message)) {
        j["uuid"] = registered->uuid;
        j["name"] = registered->name;
        j["lastWill"] = registered->last_will;
        j["ttl"] = registered->ttl;
        j["fireAt"] = registered->fire_at;
    } else if (auto removed = dynamic_cast<const DeviceRemoved*>(&message)) {
        j["uuid"] = removed->uuid;
    } else if (auto kept = dynamic_cast<const DeviceKeptAlive*>(&message)) {
        j["uuid"] = kept->uuid;
        j["fireAt"] = kept->fire_at;
    }

    return j;
}

// ==================== Request Parsing ====================

/**
 * @brief Parse the body of a device registration request
 *
 * Accepts "lastWill" or "last_will". Every field is required; uuid must be
 * canonical and ttl a positive integer.
 */
[[nodiscard]] inline Result<RegisterDevice> parse_register_request(const json& j) {
    if (!j.is_object()) {
        return Result<RegisterDevice>::error(ErrorCode::InvalidArgument,
                                             "request body must be a JSON object");
    }

    auto string_field = [&j](const char* key) -> const json* {
        auto it = j.find(key);
        if (it == j.end() || !it->is_string()) {
            return nullptr;
        }
        return &*it;
    };

    const json* uuid = string_field("uuid");
    if (uuid == nullptr) {
        return Result<RegisterDevice>::error(ErrorCode::InvalidArgument,
                                             "field 'uuid' is required and must be a string");
    }
    if (!identity::is_uuid(uuid->get<std::string>())) {
        return Result<RegisterDevice>::error(ErrorCode::InvalidArgument,
                                             "field 'uuid' is not a valid UUID");
    }

    const json* name = string_field("name");
    if (name == nullptr) {
        return Result<RegisterDevice>::error(ErrorCode::InvalidArgument,
                                             "field 'name' is required and must be a string");
    }

    const json* last_will = string_field("lastWill");
    if (last_will == nullptr) {
        last_will = string_field("last_will");
    }
    if (last_will == nullptr) {
        return Result<RegisterDevice>::error(ErrorCode::InvalidArgument,
                                             "field 'lastWill' is required and must be a string");
    }

    auto ttl = j.find("ttl");
    if (ttl == j.end() || !ttl->is_number_integer()) {
        return Result<RegisterDevice>::error(ErrorCode::InvalidArgument,
                                             "field 'ttl' is required and must be an integer");
    }
    if (ttl->get<int64_t>() <= 0) {
        return Result<RegisterDevice>::error(ErrorCode::InvalidArgument,
                                             "field 'ttl' must be positive");
    }

    return Result<RegisterDevice>::ok(RegisterDevice(uuid->get<std::string>(),
                                                     name->get<std::string>(),
                                                     last_will->get<std::string>(),
                                                     ttl->get<int64_t>()));
}

// ==================== Response Building ====================

/// Error body returned by the HTTP API
[[nodiscard]] inline json build_error_response(const std::string& details) {
    return {{"details", details}};
}

/// Body acknowledging an operation on a device
[[nodiscard]] inline json build_uuid_response(const std::string& uuid) {
    return {{"uuid", uuid}};
}

}  // namespace json
}  // namespace stillhere
