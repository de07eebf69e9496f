// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <wamcp/config/database_config.h>
#include <wamcp/http/http_client.h>
#include <wamcp/repository/repository.h>

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace wamcp::repository {

/**
 * @brief Builder for PostgREST resource paths ("table?select=...&col=op.value").
 */
class PostgrestQuery {
public:
    explicit PostgrestQuery(std::string table) : table_(std::move(table)) {}

    PostgrestQuery& select(const std::string& columns);
    /// Adds `column=op.value`. Several filters on one column are AND-combined.
    PostgrestQuery& filter(const std::string& column, const std::string& op,
                           const std::string& value);
    /// Adds `or=(cond,cond,...)`; each condition is `column.op.value`, see quotePostgrestValue.
    PostgrestQuery& anyOf(const std::vector<std::string>& conditions);
    PostgrestQuery& order(const std::string& clause);
    PostgrestQuery& limit(int n);
    PostgrestQuery& offset(int64_t n);
    PostgrestQuery& onConflict(const std::string& columns);

    [[nodiscard]] const std::string& table() const { return table_; }
    [[nodiscard]] std::string build() const;

private:
    std::string table_;
    std::vector<std::pair<std::string, std::string>> params_;
};

/// Double-quote a value for use inside a PostgREST logical expression.
std::string quotePostgrestValue(const std::string& value);

/**
 * @brief Shared state of one REST adapter.
 */
struct RestSession {
    std::string restUrl; ///< ".../rest/v1/"
    std::string apiKey;
    std::shared_ptr<http::IHttpClient> http;
    std::atomic<bool> closed{false};

    Result<nlohmann::json> fetch(const PostgrestQuery& query);
    Result<void> upsert(const PostgrestQuery& target, const nlohmann::json& row);

    [[nodiscard]] std::vector<http::Header> authHeaders() const;
};

/**
 * @brief Remote backend reached through PostgREST.
 *
 * Every request is atomic on its own; there are no multi-request transactions, so the unit
 * of work is a no-op that logs a warning on rollback.
 */
class RestDatabaseAdapter final : public IDatabaseAdapter {
public:
    RestDatabaseAdapter(const config::RestBackendConfig& config,
                        std::shared_ptr<http::IHttpClient> http);
    ~RestDatabaseAdapter() override;

    IMessageRepository& messages() override;
    IChatRepository& chats() override;
    IContactRepository& contacts() override;
    IAuthenticationRepository& authentication() override;

    std::unique_ptr<IUnitOfWork> unitOfWork() override;

    void close() override;

    [[nodiscard]] std::string_view backendName() const noexcept override { return "rest"; }

private:
    std::shared_ptr<RestSession> session_;
    std::unique_ptr<IMessageRepository> messages_;
    std::unique_ptr<IChatRepository> chats_;
    std::unique_ptr<IContactRepository> contacts_;
    std::unique_ptr<IAuthenticationRepository> auth_;
};

} // namespace wamcp::repository
