#include <gtest/gtest.h>
#include "cvforge/util/HttpClient.hpp"

#include <stdexcept>

using cvforge::util::parseEndpoint;

TEST(ParseEndpointTest, HttpsDefaultsToPort443) {
    auto endpoint = parseEndpoint("https://api.groq.com/openai/v1/chat/completions");
    EXPECT_TRUE(endpoint.tls);
    EXPECT_EQ(endpoint.host, "api.groq.com");
    EXPECT_EQ(endpoint.port, "443");
    EXPECT_EQ(endpoint.target, "/openai/v1/chat/completions");
}

TEST(ParseEndpointTest, ExplicitPortAndBareHost) {
    auto endpoint = parseEndpoint("HTTP://127.0.0.1:8080");
    EXPECT_FALSE(endpoint.tls);
    EXPECT_EQ(endpoint.host, "127.0.0.1");
    EXPECT_EQ(endpoint.port, "8080");
    EXPECT_EQ(endpoint.target, "/");
}

TEST(ParseEndpointTest, QueryWithoutPathGetsRootTarget) {
    auto endpoint = parseEndpoint("http://localhost?debug=1");
    EXPECT_EQ(endpoint.port, "80");
    EXPECT_EQ(endpoint.target, "/?debug=1");
}

TEST(ParseEndpointTest, RejectsUnusableUrls) {
    EXPECT_THROW(parseEndpoint("api.groq.com/v1"), std::invalid_argument);
    EXPECT_THROW(parseEndpoint("ftp://example.com/file"), std::invalid_argument);
    EXPECT_THROW(parseEndpoint("https:///missing-host"), std::invalid_argument);
    EXPECT_THROW(parseEndpoint("https://example.com:http/"), std::invalid_argument);
}
