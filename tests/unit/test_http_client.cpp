/**
 * @file test_http_client.cpp
 * @brief Unit tests for the libcurl HTTP client.
 * @author Dimitris Kafetzis
 */

#include "network/http_client.hpp"

#include "http_test_server.hpp"

#include <gtest/gtest.h>

using namespace edge_twin;
using edge_twin::testing::HttpTestServer;

// ═══════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════

TEST(HttpClientTest, CreateDropsTrailingSlash) {
    auto client = HttpClient::create("http://ditto.local:8080/prefix/");
    ASSERT_TRUE(client.has_value()) << client.error().message;
    EXPECT_EQ(client->base_url(), "http://ditto.local:8080/prefix");
}

TEST(HttpClientTest, CreateRejectsBadUrls) {
    for (const char* url : {"ftp://host", "no scheme here", "http://"}) {
        auto client = HttpClient::create(url);
        ASSERT_FALSE(client.has_value()) << url;
        EXPECT_EQ(client.error().code, ErrorCode::InvalidArgument) << url;
    }
}

TEST(HttpClientTest, EscapeQueryValue) {
    EXPECT_EQ(HttpClient::escape("abc-_.~"), "abc-_.~");
    EXPECT_EQ(HttpClient::escape(R"(eq(attributes/type,"rsu"))"),
              "eq%28attributes%2Ftype%2C%22rsu%22%29");
}

// ═══════════════════════════════════════════════
// Requests over loopback
// ═══════════════════════════════════════════════

TEST(HttpClientTest, GetWithBasicAuth) {
    HttpTestServer server({HttpTestServer::reply(200, "OK", R"({"status":"UP"})")});

    auto client = HttpClient::create(server.url(), 1000, 2000);
    ASSERT_TRUE(client.has_value());
    client->set_basic_auth("ditto", "ditto");

    auto r = client->get("/health");
    ASSERT_TRUE(r.has_value()) << r.error().message;
    EXPECT_EQ(r->status, 200);
    EXPECT_TRUE(r->ok());
    EXPECT_EQ(r->body, R"({"status":"UP"})");

    auto requests = server.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method, "GET");
    EXPECT_EQ(requests[0].target, "/health");
    EXPECT_NE(requests[0].head.find("Authorization: Basic ZGl0dG86ZGl0dG8="), std::string::npos);
}

TEST(HttpClientTest, PutSendsBodyUnderBasePath) {
    HttpTestServer server({HttpTestServer::reply(204, "No Content")});

    auto client = HttpClient::create(server.url() + "/base", 1000, 2000);
    ASSERT_TRUE(client.has_value());

    auto r = client->put("/things/x", R"({"k":1})");
    ASSERT_TRUE(r.has_value()) << r.error().message;
    EXPECT_EQ(r->status, 204);
    EXPECT_TRUE(r->body.empty());

    auto requests = server.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method, "PUT");
    EXPECT_EQ(requests[0].target, "/base/things/x");
    EXPECT_EQ(requests[0].body, R"({"k":1})");
    EXPECT_NE(requests[0].head.find("Content-Type: application/json"), std::string::npos);
}

TEST(HttpClientTest, ErrorStatusIsAValue) {
    HttpTestServer server({HttpTestServer::reply(404, "Not Found", R"({"error":"gone"})")});

    auto client = HttpClient::create(server.url(), 1000, 2000);
    ASSERT_TRUE(client.has_value());

    auto r = client->del("/things/x");
    ASSERT_TRUE(r.has_value()) << r.error().message;
    EXPECT_EQ(r->status, 404);
    EXPECT_FALSE(r->ok());
    EXPECT_EQ(server.requests().at(0).method, "DELETE");
}

TEST(HttpClientTest, ConnectionRefusedIsUnavailable) {
    uint16_t port = 0;
    {
        // Grab a free port, then release it so nothing is listening there.
        HttpTestServer closed({});
        port = closed.port();
    }

    auto client = HttpClient::create("http://127.0.0.1:" + std::to_string(port), 200, 200);
    ASSERT_TRUE(client.has_value());
    auto r = client->get("/health");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::Unavailable);
}
