#include <gtest/gtest.h>
#include <stillhere/json.hpp>

namespace stillhere {
namespace {

using Json = nlohmann::json;

constexpr const char* kUuid = "123e4567-e89b-12d3-a456-426614174000";

// ==================== Timestamps ====================

TEST(JsonTest, FormatUnixTimestamp) {
    EXPECT_EQ(json::format_unix_timestamp(0), "1970-01-01T00:00:00Z");
    EXPECT_EQ(json::format_unix_timestamp(1768824000), "2026-01-19T12:00:00Z");
}

// ==================== Device ====================

TEST(JsonTest, DeviceToJson) {
    Device device(kUuid, "sensor", "help", 10, 100);
    auto j = json::device_to_json(device);

    EXPECT_EQ(j["uuid"], kUuid);
    EXPECT_EQ(j["name"], "sensor");
    EXPECT_EQ(j["lastWill"], "help");
    EXPECT_EQ(j["ttl"], 10);
    EXPECT_EQ(j["createdAt"], 100);
    EXPECT_EQ(j["fireAt"], 110);
    EXPECT_EQ(j["consumed"], false);
    EXPECT_TRUE(j["consumerId"].is_null());

    device.consume("node");
    j = json::device_to_json(device);
    EXPECT_EQ(j["consumerId"], "node");
    EXPECT_EQ(j["versionNumber"], 1);
}

// ==================== Messages ====================

TEST(JsonTest, MessageToJsonIncludesTypeAndFields) {
    auto registered = json::message_to_json(DeviceRegistered("u", "n", "w", 10, 110));
    EXPECT_EQ(registered["type"], "DeviceRegistered");
    EXPECT_EQ(registered["fireAt"], 110);
    EXPECT_EQ(registered["lastWill"], "w");

    auto kept = json::message_to_json(DeviceKeptAlive("u", 200));
    EXPECT_EQ(kept["type"], "DeviceKeptAlive");
    EXPECT_EQ(kept["fireAt"], 200);

    auto remove = json::message_to_json(RemoveDevice("u"));
    EXPECT_EQ(remove["type"], "RemoveDevice");
    EXPECT_EQ(remove["uuid"], "u");
}

// ==================== Register Request ====================

TEST(JsonTest, ParseRegisterRequestCamelCase) {
    Json body = {{"uuid", kUuid}, {"name", "sensor"}, {"lastWill", "help"}, {"ttl", 30}};

    auto result = json::parse_register_request(body);

    ASSERT_TRUE(result.is_ok()) << result.error_message();
    EXPECT_EQ(result.value().uuid, kUuid);
    EXPECT_EQ(result.value().name, "sensor");
    EXPECT_EQ(result.value().last_will, "help");
    EXPECT_EQ(result.value().ttl, 30);
}

TEST(JsonTest, ParseRegisterRequestSnakeCase) {
    Json body = {{"uuid", kUuid}, {"name", "sensor"}, {"last_will", "help"}, {"ttl", 30}};

    auto result = json::parse_register_request(body);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().last_will, "help");
}

TEST(JsonTest, ParseRegisterRequestRejectsBadInput) {
    Json valid = {{"uuid", kUuid}, {"name", "sensor"}, {"lastWill", "help"}, {"ttl", 30}};

    auto expect_invalid = [](const Json& body) {
        auto result = json::parse_register_request(body);
        EXPECT_TRUE(result.is_error()) << body.dump();
        EXPECT_EQ(result.error_code(), ErrorCode::InvalidArgument);
    };

    expect_invalid(Json::array());

    for (const char* field : {"uuid", "name", "lastWill", "ttl"}) {
        Json missing = valid;
        missing.erase(std::string(field));
        expect_invalid(missing);
    }

    Json bad_uuid = valid;
    bad_uuid["uuid"] = "abc";
    expect_invalid(bad_uuid);

    Json zero_ttl = valid;
    zero_ttl["ttl"] = 0;
    expect_invalid(zero_ttl);

    Json string_ttl = valid;
    string_ttl["ttl"] = "30";
    expect_invalid(string_ttl);

    Json float_ttl = valid;
    float_ttl["ttl"] = 1.5;
    expect_invalid(float_ttl);
}

// ==================== Responses ====================

TEST(JsonTest, ErrorAndUuidResponses) {
    EXPECT_EQ(json::build_error_response("nope").dump(), R"({"details":"nope"})");
    EXPECT_EQ(json::build_uuid_response("u").dump(), R"({"uuid":"u"})");
}

}  // namespace
}  // namespace stillhere
