#include "chanfs/network/http_types.hpp"

#include <gtest/gtest.h>

#include <string>

using chanfs::network::HttpMethod;
using chanfs::network::HttpMethodUtils;
using chanfs::network::HttpRequest;
using chanfs::network::HttpResponse;

TEST(HttpRequestTest, SerializesRequestLineHeadersAndBody) {
    HttpRequest request;
    request.method = HttpMethod::PATCH;
    request.target = "/api/v10/channels/7";
    request.set_body("{\"topic\":\"507\"}", "application/json");

    const auto wire = request.serialize();
    const std::string text(wire.begin(), wire.end());

    EXPECT_EQ(text.rfind("PATCH /api/v10/channels/7 HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(text.find("Content-Type: application/json\r\n"), std::string::npos);
    EXPECT_NE(text.find("Content-Length: 15\r\n"), std::string::npos);
    EXPECT_EQ(text.substr(text.size() - 17), "\r\n{\"topic\":\"507\"}");
}

TEST(HttpRequestTest, HeaderLookupIgnoresCase) {
    HttpRequest request;
    request.set_header("Authorization", "Bot abc");
    EXPECT_EQ(request.get_header("authorization"), "Bot abc");
    EXPECT_EQ(request.get_header("X-Missing"), "");
}

TEST(HttpRequestTest, MethodNames) {
    EXPECT_EQ(HttpMethodUtils::to_string(HttpMethod::DELETE_METHOD), "DELETE");
    EXPECT_EQ(HttpMethodUtils::from_string("PUT"), HttpMethod::PUT);
    EXPECT_EQ(HttpMethodUtils::from_string("BREW"), HttpMethod::UNKNOWN);
}

TEST(HttpResponseTest, SuccessRange) {
    HttpResponse response;
    response.status_code = 204;
    EXPECT_TRUE(response.is_success());
    response.status_code = 429;
    EXPECT_FALSE(response.is_success());
}
