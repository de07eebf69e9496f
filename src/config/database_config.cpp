// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#include <wamcp/config/config_helpers.h>
#include <wamcp/config/database_config.h>

#include <filesystem>

namespace wamcp::config {

namespace {

constexpr std::string_view kSqlitePrefix = "sqlite://";
constexpr std::string_view kMessagesFile = "messages.db";
constexpr std::string_view kAuthFile = "whatsapp.db";

template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

Result<DatabaseConfig> databaseConfigFromUrl(std::string_view url, const RestCredentials& rest) {
    if (url.empty()) {
        return DatabaseConfig{SqliteBackendConfig{}};
    }

    if (url.starts_with(kSqlitePrefix)) {
        std::string_view path = url.substr(kSqlitePrefix.size());
        if (path.empty() || path == kInMemoryDatabase || path == "/:memory:") {
            return DatabaseConfig{SqliteBackendConfig{}};
        }
        // sqlite:///abs/path keeps the leading slash of the absolute path
        auto dir = std::filesystem::path(std::string(path)).parent_path();
        SqliteBackendConfig cfg;
        cfg.messagesDbPath = (dir / kMessagesFile).string();
        cfg.authDbPath = (dir / kAuthFile).string();
        return DatabaseConfig{cfg};
    }

    if (url.starts_with("postgres://") || url.starts_with("postgresql://")) {
        if (!rest.url || !rest.key) {
            return Error{ErrorCode::InvalidArgument,
                         "PostgreSQL backend requires SUPABASE_URL and SUPABASE_KEY "
                         "(or SUPABASE_ANON_KEY)"};
        }
        return DatabaseConfig{RestBackendConfig{*rest.url, *rest.key}};
    }

    return Error{ErrorCode::InvalidArgument,
                 "Unsupported DATABASE_URL scheme: " + std::string(url.substr(0, url.find(':')))};
}

RestCredentials restCredentialsFromEnv() {
    RestCredentials creds;
    creds.url = env_value("SUPABASE_URL");
    creds.key = env_value("SUPABASE_KEY");
    if (!creds.key) {
        creds.key = env_value("SUPABASE_ANON_KEY");
    }
    return creds;
}

std::string describe(const DatabaseConfig& config) {
    return std::visit(overloaded{
                          [](const SqliteBackendConfig& c) {
                              return "sqlite(messages=" + c.messagesDbPath +
                                     ", auth=" + c.authDbPath + ")";
                          },
                          [](const RestBackendConfig& c) { return "rest(" + c.baseUrl + ")"; },
                      },
                      config);
}

} // namespace wamcp::config
