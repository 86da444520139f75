#include "chanfs/transport/rest_transport.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using chanfs::ErrorCode;
using json = nlohmann::json;
namespace rest = chanfs::transport::rest;

TEST(RestTransportTest, AttachmentLimitFollowsPremiumTier) {
    EXPECT_EQ(rest::limit_for_premium_tier(0), 10u * 1024 * 1024);
    EXPECT_EQ(rest::limit_for_premium_tier(1), 10u * 1024 * 1024);
    EXPECT_EQ(rest::limit_for_premium_tier(2), 50u * 1024 * 1024);
    EXPECT_EQ(rest::limit_for_premium_tier(3), 100u * 1024 * 1024);
}

TEST(RestTransportTest, SnowflakesCompareNumerically) {
    EXPECT_TRUE(rest::snowflake_less("9", "10"));
    EXPECT_TRUE(rest::snowflake_less("1100000000000000000", "1100000000000000001"));
    EXPECT_FALSE(rest::snowflake_less("20", "3"));
    EXPECT_FALSE(rest::snowflake_less("5", "5"));
}

TEST(RestTransportTest, DecodesChannel) {
    auto channel = rest::container_from_json(json::parse(
        R"({"id":"1200","type":0,"name":"cpnmuoj1e8","topic":"507","guild_id":"9"})"));
    ASSERT_TRUE(channel.is_ok());
    EXPECT_EQ(channel.value().id, "1200");
    EXPECT_EQ(channel.value().name, "cpnmuoj1e8");
    EXPECT_EQ(channel.value().topic, "507");

    auto no_topic = rest::container_from_json(json::parse(R"({"id":"1201","name":"co","topic":null})"));
    ASSERT_TRUE(no_topic.is_ok());
    EXPECT_EQ(no_topic.value().topic, "");

    auto broken = rest::container_from_json(json::parse(R"({"name":"co"})"));
    ASSERT_TRUE(broken.is_error());
    EXPECT_EQ(broken.error().code, ErrorCode::ProtocolError);
}

TEST(RestTransportTest, ToleratesNullOrMistypedChannelFields) {
    auto nameless = rest::container_from_json(json::parse(R"({"id":"1202","name":null,"topic":7})"));
    ASSERT_TRUE(nameless.is_ok());
    EXPECT_EQ(nameless.value().name, "");
    EXPECT_EQ(nameless.value().topic, "");

    EXPECT_TRUE(rest::is_text_channel(json::parse(R"({"id":"1","type":0})")));
    EXPECT_FALSE(rest::is_text_channel(json::parse(R"({"id":"2","type":2})")));
    EXPECT_FALSE(rest::is_text_channel(json::parse(R"({"id":"3","type":null})")));
    EXPECT_FALSE(rest::is_text_channel(json::parse(R"({"id":"4","type":"0"})")));
    EXPECT_FALSE(rest::is_text_channel(json::parse(R"({"id":"5"})")));
    EXPECT_FALSE(rest::is_text_channel(json::parse(R"("not a channel")")));
}

TEST(RestTransportTest, DecodesMessageWithAndWithoutAttachment) {
    auto block = rest::message_from_json(json::parse(R"({
        "id": "1300",
        "content": "",
        "attachments": [
            {"id": "77", "filename": "3", "size": 10485710, "url": "https://cdn.example.com/attachments/1200/77/3"}
        ]
    })"));
    ASSERT_TRUE(block.is_ok());
    ASSERT_TRUE(block.value().attachment.has_value());
    EXPECT_EQ(block.value().attachment->name, "3");
    EXPECT_EQ(block.value().attachment->size, 10485710u);
    EXPECT_EQ(block.value().attachment->url, "https://cdn.example.com/attachments/1200/77/3");

    auto notice = rest::message_from_json(json::parse(R"({"id":"1301","type":6,"attachments":[]})"));
    ASSERT_TRUE(notice.is_ok());
    EXPECT_FALSE(notice.value().attachment.has_value());

    auto sizeless = rest::message_from_json(json::parse(R"({"id":"1302","attachments":[{"filename":"1"}]})"));
    ASSERT_TRUE(sizeless.is_error());

    auto unnamed = rest::message_from_json(
        json::parse(R"({"id":"1303","attachments":[{"filename":null,"size":4,"url":null}]})"));
    ASSERT_TRUE(unnamed.is_ok());
    ASSERT_TRUE(unnamed.value().attachment.has_value());
    EXPECT_EQ(unnamed.value().attachment->name, "");
    EXPECT_EQ(unnamed.value().attachment->url, "");
}

TEST(RestTransportTest, MultipartCarriesPayloadJsonAndFile) {
    const std::vector<std::uint8_t> data = {'a', 0x00, 'b'};
    const auto body = rest::build_multipart("XyZ", "7", data);
    const std::string text(body.begin(), body.end());

    EXPECT_EQ(text.rfind("--XyZ\r\n", 0), 0u);
    EXPECT_NE(text.find("name=\"payload_json\""), std::string::npos);
    EXPECT_NE(text.find(R"({"attachments":[{"filename":"7","id":0}]})"), std::string::npos);
    EXPECT_NE(text.find("name=\"files[0]\"; filename=\"7\""), std::string::npos);
    EXPECT_NE(text.find(std::string("\r\n\r\na\0b\r\n--XyZ--\r\n", 18)), std::string::npos);
}

TEST(RestTransportTest, DescribesFailureFromErrorBody) {
    chanfs::network::HttpResponse response;
    response.status_code = 403;
    response.reason_phrase = "Forbidden";
    const std::string body = R"({"message":"Missing Permissions","code":50013})";
    response.body.assign(body.begin(), body.end());
    EXPECT_EQ(rest::describe_failure(response), "HTTP 403: Missing Permissions");

    response.body.clear();
    EXPECT_EQ(rest::describe_failure(response), "HTTP 403 Forbidden");
}
