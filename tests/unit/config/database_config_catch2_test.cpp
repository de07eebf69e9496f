// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <common/test_helpers_catch2.h>
#include <wamcp/config/config_helpers.h>
#include <wamcp/config/database_config.h>

using namespace wamcp;
using namespace wamcp::config;

TEST_CASE("DatabaseConfig: sqlite URLs", "[unit][config][database]") {
    SECTION("file URL places both stores beside each other") {
        auto r = databaseConfigFromUrl("sqlite:///var/lib/wamcp/store.db", {});
        REQUIRE(r.has_value());
        REQUIRE(std::holds_alternative<SqliteBackendConfig>(r.value()));
        const auto& cfg = std::get<SqliteBackendConfig>(r.value());
        CHECK(cfg.messagesDbPath == "/var/lib/wamcp/messages.db");
        CHECK(cfg.authDbPath == "/var/lib/wamcp/whatsapp.db");
    }

    SECTION("memory URL") {
        auto r = databaseConfigFromUrl("sqlite://:memory:", {});
        REQUIRE(r.has_value());
        const auto& cfg = std::get<SqliteBackendConfig>(r.value());
        CHECK(cfg.messagesDbPath == kInMemoryDatabase);
        CHECK(cfg.authDbPath == kInMemoryDatabase);
    }

    SECTION("empty URL falls back to in-memory sqlite") {
        auto r = databaseConfigFromUrl("", {});
        REQUIRE(r.has_value());
        CHECK(std::holds_alternative<SqliteBackendConfig>(r.value()));
    }
}

TEST_CASE("DatabaseConfig: postgres URLs need REST credentials", "[unit][config][database]") {
    SECTION("missing credentials") {
        auto r = databaseConfigFromUrl("postgresql://db.example.com/postgres", {});
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("credentials select the REST backend") {
        RestCredentials creds{std::string("https://abc.supabase.co"), std::string("anon-key")};
        for (const char* url : {"postgres://u@h/db", "postgresql://u@h/db"}) {
            auto r = databaseConfigFromUrl(url, creds);
            REQUIRE(r.has_value());
            REQUIRE(std::holds_alternative<RestBackendConfig>(r.value()));
            const auto& rest = std::get<RestBackendConfig>(r.value());
            CHECK(rest.baseUrl == "https://abc.supabase.co");
            CHECK(rest.apiKey == "anon-key");
        }
    }
}

TEST_CASE("DatabaseConfig: unsupported scheme", "[unit][config][database]") {
    auto r = databaseConfigFromUrl("mysql://localhost/whatsapp", {});
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == ErrorCode::InvalidArgument);
    CHECK(r.error().message.find("mysql") != std::string::npos);
}

TEST_CASE("DatabaseConfig: credentials from environment", "[unit][config][database]") {
    test::ScopedEnvVar url("SUPABASE_URL", std::string("https://x.supabase.co"));
    test::ScopedEnvVar key("SUPABASE_KEY", std::nullopt);

    SECTION("anon key is the fallback") {
        test::ScopedEnvVar anon("SUPABASE_ANON_KEY", std::string("anon"));
        auto creds = restCredentialsFromEnv();
        REQUIRE(creds.url);
        REQUIRE(creds.key);
        CHECK(*creds.key == "anon");
    }

    SECTION("service key wins over anon key") {
        test::ScopedEnvVar service("SUPABASE_KEY", std::string("service"));
        test::ScopedEnvVar anon("SUPABASE_ANON_KEY", std::string("anon"));
        auto creds = restCredentialsFromEnv();
        REQUIRE(creds.key);
        CHECK(*creds.key == "service");
    }

    SECTION("empty values count as unset") {
        test::ScopedEnvVar anon("SUPABASE_ANON_KEY", std::string(""));
        CHECK_FALSE(restCredentialsFromEnv().key.has_value());
    }
}

TEST_CASE("ConfigHelpers: line-based TOML reader", "[unit][config][helpers]") {
    test::TempDir dir;
    auto path = test::write_file(dir.path() / "config.toml", R"(# wamcp
[database]
url = "sqlite:///tmp/x/store.db"   # inline comment

[bridge]
executable = '/opt/bridge/whatsapp-bridge'
qr_url = http://localhost:9090/qr # trailing
)");

    CHECK(parse_config_value(path, "database", "url") == "sqlite:///tmp/x/store.db");
    CHECK(parse_config_value(path, "bridge", "executable") == "/opt/bridge/whatsapp-bridge");
    CHECK(parse_config_value(path, "bridge", "qr_url") == "http://localhost:9090/qr");
    CHECK(parse_config_value(path, "bridge", "url").empty());
    CHECK(parse_config_value(dir.path() / "missing.toml", "bridge", "qr_url").empty());
}

TEST_CASE("ConfigHelpers: numeric settings", "[unit][config][helpers]") {
    CHECK(parse_non_negative("0") == 0);
    CHECK(parse_non_negative("2500") == 2500);
    CHECK_FALSE(parse_non_negative("-1").has_value());
    CHECK_FALSE(parse_non_negative("12ms").has_value());
    CHECK_FALSE(parse_non_negative("").has_value());
}
