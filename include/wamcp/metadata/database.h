// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <wamcp/core/types.h>
#include <sqlite3.h>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wamcp::metadata {

enum class ConnectionMode {
    ReadWrite, ///< Existing file only
    Create,    ///< Create the file when missing
    Memory     ///< Private in-memory database
};

/**
 * @brief Prepared statement owned by a Database connection.
 *
 * Obtained from Database::prepare and only valid while that connection is open.
 * Parameter indices are 1-based, column indices 0-based.
 */
class Statement {
public:
    Statement() = default;
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, int value);
    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, bool value) { return bind(index, value ? 1 : 0); }
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, const std::string& value) {
        return bind(index, std::string_view(value));
    }
    Result<void> bind(int index, const char* value) { return bind(index, std::string_view(value)); }
    Result<void> bind(int index, const std::optional<std::string>& value);

    /// Binds each argument to the next parameter, starting at 1.
    template <typename... Args> Result<void> bindAll(Args&&... args) {
        int index = 0;
        Result<void> status;
        ((status = status ? bind(++index, std::forward<Args>(args)) : status), ...);
        return status;
    }

    /// Runs a statement that must not produce rows.
    Result<void> execute();

    /// Advances to the next row; false once the result set is exhausted.
    Result<bool> step();

    int getInt(int column) const;
    int64_t getInt64(int column) const;
    std::string getString(int column) const;
    std::optional<std::string> getOptionalString(int column) const;
    bool isNull(int column) const;

private:
    friend class Database;
    Statement(sqlite3* db, sqlite3_stmt* stmt) : db_(db), stmt_(stmt) {}

    Result<void> checkBind(int rc, int index) const;
    Error stepError(int rc) const;

    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * @brief Owning wrapper around one sqlite3 connection.
 *
 * Not internally synchronized; owners serialize access to a connection.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    Result<void> open(const std::string& path, ConnectionMode mode = ConnectionMode::ReadWrite);
    void close();

    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }
    [[nodiscard]] const std::string& path() const { return path_; }

    Result<Statement> prepare(const std::string& sql);

    /// Runs one or more statements that return no rows.
    Result<void> execute(const std::string& sql);

    /**
     * @brief Attach another database file under the given schema name.
     *
     * Attached schemas share this connection's transactions. The schema name must be a
     * plain identifier.
     */
    Result<void> attach(const std::string& path, const std::string& schema);

    Result<void> beginTransaction();
    Result<void> commit();
    Result<void> rollback();

    [[nodiscard]] bool inTransaction() const { return inTransaction_; }

    /// Rows touched by the most recent INSERT, UPDATE or DELETE.
    int changes() const;

    Result<bool> tableExists(const std::string& table, const std::string& schema = "main");

private:
    Result<void> requireOpen() const;

    sqlite3* db_ = nullptr;
    std::string path_;
    bool inTransaction_ = false;
};

/**
 * @brief Assembles the SELECT statements issued by the repositories.
 *
 * Conditions added with where/andWhere are joined with AND.
 */
class QueryBuilder {
public:
    QueryBuilder& select(const std::vector<std::string>& columns = {});
    QueryBuilder& distinct();
    QueryBuilder& from(const std::string& table);
    QueryBuilder& join(const std::string& table, const std::string& on);
    QueryBuilder& leftJoin(const std::string& table, const std::string& on);
    /// Replaces any conditions added so far.
    QueryBuilder& where(const std::string& condition);
    QueryBuilder& andWhere(const std::string& condition);
    QueryBuilder& groupBy(const std::string& column);
    QueryBuilder& orderBy(const std::string& column, bool ascending = true);
    QueryBuilder& limit(int limit);
    QueryBuilder& offset(int64_t offset);

    [[nodiscard]] std::string build() const;

private:
    bool distinct_ = false;
    std::string table_;
    std::vector<std::string> columns_;
    std::vector<std::string> joins_;
    std::vector<std::string> conditions_;
    std::string groupBy_;
    std::vector<std::string> ordering_;
    std::optional<int> limit_;
    std::optional<int64_t> offset_;
};

} // namespace wamcp::metadata
