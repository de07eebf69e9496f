// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <wamcp/core/types.h>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace wamcp::config {

inline constexpr const char* kInMemoryDatabase = ":memory:";

/// Message history and connector session state in two SQLite files.
struct SqliteBackendConfig {
    std::string messagesDbPath = kInMemoryDatabase;
    std::string authDbPath = kInMemoryDatabase;
    /// Create the chats/messages tables when missing.
    bool createSchema = true;
};

/// PostgREST endpoint in front of the remote PostgreSQL store.
struct RestBackendConfig {
    std::string baseUrl;
    std::string apiKey;
};

/// Exactly one backend is selected at startup.
using DatabaseConfig = std::variant<SqliteBackendConfig, RestBackendConfig>;

/// Credentials consulted when DATABASE_URL names a PostgreSQL database.
struct RestCredentials {
    std::optional<std::string> url;
    std::optional<std::string> key;
};

/**
 * @brief Map a DATABASE_URL value onto a backend.
 *
 * - "sqlite:///dir/file.db": messages.db and whatsapp.db inside dir
 * - "sqlite://:memory:": both stores in memory
 * - "postgres://..." / "postgresql://...": REST backend, requires credentials
 *
 * Any other scheme is InvalidArgument.
 */
Result<DatabaseConfig> databaseConfigFromUrl(std::string_view url, const RestCredentials& rest);

/// Reads SUPABASE_URL and SUPABASE_KEY (falling back to SUPABASE_ANON_KEY).
RestCredentials restCredentialsFromEnv();

std::string describe(const DatabaseConfig& config);

} // namespace wamcp::config
