// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <common/fake_http_client.h>
#include <common/test_helpers_catch2.h>
#include <wamcp/repository/adapter_factory.h>

using namespace wamcp;
using namespace wamcp::repository;

TEST_CASE("createDatabaseAdapter: SQLite backend", "[unit][repository][factory]") {
    test::TempDir dir{"wamcp_factory_"};
    config::SqliteBackendConfig cfg;
    cfg.messagesDbPath = (dir.path() / "messages.db").string();
    cfg.authDbPath = (dir.path() / "whatsapp.db").string();

    auto r = createDatabaseAdapter(cfg, nullptr);
    REQUIRE(r.has_value());
    CHECK(r.value()->backendName() == "sqlite");
    CHECK(r.value()->unitOfWork()->isTransactional());
    CHECK(std::filesystem::exists(dir.path() / "messages.db"));

    auto chats = r.value()->chats().listChats(ChatQuery{});
    REQUIRE(chats.has_value());
    CHECK(chats.value().empty());
}

TEST_CASE("createDatabaseAdapter: REST backend", "[unit][repository][factory]") {
    auto http = std::make_shared<test::FakeHttpClient>();

    SECTION("complete credentials") {
        auto r = createDatabaseAdapter(
            config::RestBackendConfig{"https://proj.example.co", "anon-key"}, http);
        REQUIRE(r.has_value());
        CHECK(r.value()->backendName() == "rest");
        CHECK_FALSE(r.value()->unitOfWork()->isTransactional());
        // Construction alone never talks to the server
        CHECK(http->requests().empty());
    }

    SECTION("missing key") {
        auto r = createDatabaseAdapter(config::RestBackendConfig{"https://proj.example.co", ""},
                                       http);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("missing HTTP client") {
        auto r = createDatabaseAdapter(
            config::RestBackendConfig{"https://proj.example.co", "anon-key"}, nullptr);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("createDatabaseAdapter: unopenable SQLite path", "[unit][repository][factory]") {
    config::SqliteBackendConfig cfg;
    cfg.messagesDbPath = "/proc/wamcp-cannot-create/messages.db";
    cfg.authDbPath = "/proc/wamcp-cannot-create/whatsapp.db";

    auto r = createDatabaseAdapter(cfg, nullptr);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == ErrorCode::DatabaseError);
}
