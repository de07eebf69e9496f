// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <wamcp/config/database_config.h>
#include <wamcp/metadata/database.h>
#include <wamcp/repository/repository.h>

#include <memory>
#include <mutex>

namespace wamcp::repository {

/**
 * @brief Connection shared by the SQLite repositories of one adapter.
 *
 * The authentication file is attached to the message connection as schema `auth`, so a
 * single BEGIN/COMMIT covers both files. When both paths are the same file the device
 * table is read from `main`.
 */
struct SqliteSession {
    metadata::Database db;
    std::mutex mutex;
    std::string authSchema = "main";
    bool closed = false;
};

/**
 * @brief Local file-backed backend.
 *
 * ## Responsibilities
 * - Owns the SQLite connection and the attached authentication store
 * - Hands out repositories bound to that connection
 * - Provides a genuinely transactional unit of work
 */
class SqliteDatabaseAdapter final : public IDatabaseAdapter {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    static Result<std::unique_ptr<SqliteDatabaseAdapter>>
    open(const config::SqliteBackendConfig& config);

    /// Use open(); the tag keeps construction inside this class.
    SqliteDatabaseAdapter(PrivateTag, std::shared_ptr<SqliteSession> session);
    ~SqliteDatabaseAdapter() override;

    IMessageRepository& messages() override;
    IChatRepository& chats() override;
    IContactRepository& contacts() override;
    IAuthenticationRepository& authentication() override;

    std::unique_ptr<IUnitOfWork> unitOfWork() override;

    void close() override;

    [[nodiscard]] std::string_view backendName() const noexcept override { return "sqlite"; }

    /// Raw SQL against the shared connection; used for setup and maintenance.
    Result<void> execute(const std::string& sql);

private:
    std::shared_ptr<SqliteSession> session_;
    std::unique_ptr<IMessageRepository> messages_;
    std::unique_ptr<IChatRepository> chats_;
    std::unique_ptr<IContactRepository> contacts_;
    std::unique_ptr<IAuthenticationRepository> auth_;
};

} // namespace wamcp::repository
