// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <common/fake_http_client.h>
#include <common/test_helpers_catch2.h>
#include <nlohmann/json.hpp>
#include <wamcp/bridge/bridge_api_client.h>

using namespace wamcp;
using namespace wamcp::bridge;
using nlohmann::json;
using test::FakeHttpClient;

namespace {
struct ApiFixture {
    std::shared_ptr<FakeHttpClient> http = std::make_shared<FakeHttpClient>();
    BridgeApiClient client{http};

    void reply(long status, std::string body) {
        http->setHandler([status, body](const http::HttpRequest&) -> Result<http::HttpResponse> {
            return FakeHttpClient::respond(status, body);
        });
    }
};
} // namespace

TEST_CASE("BridgeApiClient: health check", "[unit][bridge][api]") {
    ApiFixture fix;

    SECTION("200 is healthy") {
        fix.reply(200, "OK");
        CHECK(fix.client.checkHealth());

        auto requests = fix.http->requests();
        REQUIRE(requests.size() == 1);
        CHECK(requests[0].url == "http://localhost:8080/health");
        REQUIRE(requests[0].options.has_value());
        CHECK(requests[0].options->maxRetries == 0);
        CHECK(requests[0].options->connectTimeout == std::chrono::milliseconds{1000});
        CHECK(requests[0].options->readTimeout == std::chrono::milliseconds{1000});
    }

    SECTION("any other status is unhealthy") {
        fix.reply(204, "");
        CHECK_FALSE(fix.client.checkHealth());
        fix.reply(503, "starting");
        CHECK_FALSE(fix.client.checkHealth());
    }

    SECTION("transport failure is unhealthy") {
        CHECK_FALSE(fix.client.checkHealth());
    }
}

TEST_CASE("BridgeApiClient: auth status", "[unit][bridge][api]") {
    ApiFixture fix;

    SECTION("parsed body") {
        fix.reply(200, R"({"authenticated":false,"has_qr_code":true})");
        auto r = fix.client.fetchAuthStatus();
        REQUIRE(r.has_value());
        CHECK_FALSE(r.value().authenticated);
        CHECK(r.value().hasQrCode);
        CHECK(fix.http->requests()[0].url == "http://localhost:8080/api/auth-status");
    }

    SECTION("missing fields default to false") {
        fix.reply(200, R"({"authenticated":true})");
        auto r = fix.client.fetchAuthStatus();
        REQUIRE(r.has_value());
        CHECK(r.value().authenticated);
        CHECK_FALSE(r.value().hasQrCode);
    }

    SECTION("non-200") {
        fix.reply(500, "oops");
        auto r = fix.client.fetchAuthStatus();
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == ErrorCode::NetworkError);
    }

    SECTION("malformed body") {
        fix.reply(200, "<html>");
        auto r = fix.client.fetchAuthStatus();
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == ErrorCode::InvalidData);
    }
}

TEST_CASE("BridgeApiClient: sendMessage", "[unit][bridge][api]") {
    ApiFixture fix;

    SECTION("forwards the connector verdict") {
        fix.reply(200, R"({"success":true,"message":"Message sent to 15550001111"})");
        auto out = fix.client.sendMessage("15550001111", "hello");
        CHECK(out.success);
        CHECK(out.message == "Message sent to 15550001111");

        auto requests = fix.http->requests();
        REQUIRE(requests.size() == 1);
        CHECK(requests[0].url == "http://localhost:8080/api/send");
        auto body = json::parse(requests[0].body);
        CHECK(body == json{{"recipient", "15550001111"}, {"message", "hello"}});
    }

    SECTION("empty recipient is rejected locally") {
        auto out = fix.client.sendMessage("", "hello");
        CHECK_FALSE(out.success);
        CHECK(out.message == "Recipient must be provided");
        CHECK(fix.http->requests().empty());
    }

    SECTION("HTTP error") {
        fix.reply(400, "bad recipient");
        auto out = fix.client.sendMessage("x", "hello");
        CHECK_FALSE(out.success);
        CHECK(out.message == "Error: HTTP 400 - bad recipient");
    }

    SECTION("unparseable reply") {
        fix.reply(200, "not json");
        auto out = fix.client.sendMessage("x", "hello");
        CHECK_FALSE(out.success);
        CHECK(out.message == "Error parsing response: not json");
    }

    SECTION("reply without a message") {
        fix.reply(200, R"({"success":false})");
        auto out = fix.client.sendMessage("x", "hello");
        CHECK_FALSE(out.success);
        CHECK(out.message == "Unknown response");
    }

    SECTION("timeout") {
        fix.http->setHandler([](const http::HttpRequest&) -> Result<http::HttpResponse> {
            return Error{ErrorCode::Timeout, "Operation timed out"};
        });
        auto out = fix.client.sendMessage("x", "hello");
        CHECK_FALSE(out.success);
        CHECK(out.message == "Request timed out. The bridge may be unresponsive.");
    }

    SECTION("connection refused") {
        auto out = fix.client.sendMessage("x", "hello");
        CHECK_FALSE(out.success);
        CHECK(out.message == "Request error: connection refused");
    }
}

TEST_CASE("BridgeApiClient: sendFile", "[unit][bridge][api]") {
    ApiFixture fix;
    test::TempDir dir{"wamcp_send_file_"};
    const auto media = test::write_file(dir.path() / "photo.jpg", "jpeg");
    fix.reply(200, R"({"success":true,"message":"sent"})");

    auto sent = fix.client.sendFile("15550001111", media.string());
    CHECK(sent.success);
    auto body = json::parse(fix.http->requests().at(0).body);
    CHECK(body["media_path"] == media.string());

    auto missing = fix.client.sendFile("15550001111", (dir.path() / "nope.jpg").string());
    CHECK_FALSE(missing.success);
    CHECK(missing.message.rfind("Media file not found: ", 0) == 0);

    CHECK(fix.client.sendFile("15550001111", "").message == "Media path must be provided");
    CHECK(fix.client.sendFile("", media.string()).message == "Recipient must be provided");
    CHECK(fix.http->requests().size() == 1);
}

TEST_CASE("BridgeApiClient: downloadMedia", "[unit][bridge][api]") {
    ApiFixture fix;

    SECTION("returns the stored path") {
        fix.reply(200, R"({"success":true,"message":"ok","path":"/store/media/a.jpg"})");
        auto path = fix.client.downloadMedia("m1", "15550001111@s.whatsapp.net");
        CHECK(path == std::optional<std::string>("/store/media/a.jpg"));

        auto body = json::parse(fix.http->requests().at(0).body);
        CHECK(body == json{{"message_id", "m1"}, {"chat_jid", "15550001111@s.whatsapp.net"}});
        CHECK(fix.http->requests().at(0).url == "http://localhost:8080/api/download");
    }

    SECTION("failure reported by the connector") {
        fix.reply(200, R"({"success":false,"message":"no media"})");
        CHECK_FALSE(fix.client.downloadMedia("m1", "c").has_value());
    }

    SECTION("success without a path") {
        fix.reply(200, R"({"success":true})");
        CHECK_FALSE(fix.client.downloadMedia("m1", "c").has_value());
    }

    SECTION("HTTP error") {
        fix.reply(404, "unknown message");
        CHECK_FALSE(fix.client.downloadMedia("m1", "c").has_value());
    }
}

TEST_CASE("BridgeApiClient: custom endpoints", "[unit][bridge][api]") {
    auto http = std::make_shared<FakeHttpClient>(
        [](const http::HttpRequest&) -> Result<http::HttpResponse> {
            return FakeHttpClient::respond(200, "{}");
        });
    BridgeEndpoints endpoints;
    endpoints.apiBaseUrl = "http://10.0.0.2:9000/api";
    endpoints.healthUrl = "http://10.0.0.2:9000/health";
    BridgeApiClient client(http, endpoints);

    CHECK(client.checkHealth());
    REQUIRE(client.fetchAuthStatus().has_value());
    auto requests = http->requests();
    REQUIRE(requests.size() == 2);
    CHECK(requests[0].url == "http://10.0.0.2:9000/health");
    CHECK(requests[1].url == "http://10.0.0.2:9000/api/auth-status");
}
