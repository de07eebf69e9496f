// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#include <spdlog/spdlog.h>
#include <wamcp/metadata/database.h>

#include <algorithm>
#include <cctype>
#include <utility>

#include <fmt/format.h>

namespace wamcp::metadata {

namespace {

constexpr int kBusyTimeoutMs = 5000;
constexpr std::size_t kSqlSnippetLength = 100;

int openFlags(ConnectionMode mode) {
    switch (mode) {
        case ConnectionMode::Create:
            return SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
        case ConnectionMode::Memory:
            return SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_MEMORY;
        case ConnectionMode::ReadWrite:
            break;
    }
    return SQLITE_OPEN_READWRITE;
}

bool isIdentifier(const std::string& name) {
    return !name.empty() && !std::isdigit(static_cast<unsigned char>(name.front())) &&
           std::all_of(name.begin(), name.end(), [](char c) {
               return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
           });
}

std::string snippet(const char* sql) {
    if (!sql) {
        return {};
    }
    std::string_view text(sql);
    if (text.size() <= kSqlSnippetLength) {
        return std::string(text);
    }
    return std::string(text.substr(0, kSqlSnippetLength)) + "...";
}

} // namespace

Statement::~Statement() {
    sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)), stmt_(std::exchange(other.stmt_, nullptr)) {}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        sqlite3_finalize(stmt_);
        db_ = std::exchange(other.db_, nullptr);
        stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
}

Result<void> Statement::checkBind(int rc, int index) const {
    if (rc == SQLITE_OK) {
        return {};
    }
    return Error{ErrorCode::DatabaseError,
                 fmt::format("Failed to bind parameter {}: {}", index, sqlite3_errstr(rc))};
}

Result<void> Statement::bind(int index, std::nullptr_t) {
    return checkBind(sqlite3_bind_null(stmt_, index), index);
}

Result<void> Statement::bind(int index, int value) {
    return checkBind(sqlite3_bind_int(stmt_, index, value), index);
}

Result<void> Statement::bind(int index, int64_t value) {
    return checkBind(sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)), index);
}

Result<void> Statement::bind(int index, std::string_view value) {
    return checkBind(sqlite3_bind_text(stmt_, index, value.data(),
                                       static_cast<int>(value.size()), SQLITE_TRANSIENT),
                     index);
}

Result<void> Statement::bind(int index, const std::optional<std::string>& value) {
    return value ? bind(index, std::string_view(*value)) : bind(index, nullptr);
}

Error Statement::stepError(int rc) const {
    std::string detail = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    if (rc == SQLITE_CONSTRAINT) {
        detail += fmt::format(" [SQL: {}]", snippet(sqlite3_sql(stmt_)));
    }
    return Error{ErrorCode::DatabaseError, "Failed to step statement: " + detail};
}

Result<bool> Statement::step() {
    if (!stmt_) {
        return Error{ErrorCode::InvalidState, "Statement is not prepared"};
    }
    // Lock contention is absorbed by the connection's busy timeout
    switch (int rc = sqlite3_step(stmt_)) {
        case SQLITE_ROW:
            return true;
        case SQLITE_DONE:
            return false;
        default:
            return stepError(rc);
    }
}

Result<void> Statement::execute() {
    auto row = step();
    if (!row) {
        return row.error();
    }
    if (row.value()) {
        return Error{ErrorCode::InvalidState,
                     "Statement returned rows: " + snippet(sqlite3_sql(stmt_))};
    }
    return {};
}

int Statement::getInt(int column) const {
    return sqlite3_column_int(stmt_, column);
}

int64_t Statement::getInt64(int column) const {
    return static_cast<int64_t>(sqlite3_column_int64(stmt_, column));
}

std::string Statement::getString(int column) const {
    const auto* text = sqlite3_column_text(stmt_, column);
    const int size = sqlite3_column_bytes(stmt_, column);
    return text ? std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(size))
                : std::string();
}

std::optional<std::string> Statement::getOptionalString(int column) const {
    if (isNull(column)) {
        return std::nullopt;
    }
    return getString(column);
}

bool Statement::isNull(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)), path_(std::move(other.path_)),
      inTransaction_(std::exchange(other.inTransaction_, false)) {}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = std::exchange(other.db_, nullptr);
        path_ = std::move(other.path_);
        inTransaction_ = std::exchange(other.inTransaction_, false);
    }
    return *this;
}

Result<void> Database::requireOpen() const {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }
    return {};
}

Result<void> Database::open(const std::string& path, ConnectionMode mode) {
    if (db_) {
        return Error{ErrorCode::InvalidState, "Database already open: " + path_};
    }

    sqlite3* handle = nullptr;
    const int rc = sqlite3_open_v2(path.c_str(), &handle, openFlags(mode), nullptr);
    if (rc != SQLITE_OK) {
        std::string reason = handle ? sqlite3_errmsg(handle) : sqlite3_errstr(rc);
        sqlite3_close(handle);
        return Error{ErrorCode::DatabaseError,
                     fmt::format("Failed to open database {}: {}", path, reason)};
    }

    sqlite3_busy_timeout(handle, kBusyTimeoutMs);
    db_ = handle;
    path_ = path;
    spdlog::debug("[Database] Opened {}", path);
    return {};
}

void Database::close() {
    if (db_) {
        if (sqlite3_close(db_) != SQLITE_OK) {
            spdlog::warn("[Database] Closing {} with unfinalized statements", path_);
            sqlite3_close_v2(db_);
        }
        db_ = nullptr;
    }
    path_.clear();
    inTransaction_ = false;
}

Result<Statement> Database::prepare(const std::string& sql) {
    if (auto r = requireOpen(); !r) {
        return r.error();
    }
    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &stmt,
                                      nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt);
        return Error{ErrorCode::DatabaseError,
                     "Failed to prepare statement: " + std::string(sqlite3_errmsg(db_))};
    }
    return Statement(db_, stmt);
}

Result<void> Database::execute(const std::string& sql) {
    if (auto r = requireOpen(); !r) {
        return r;
    }
    char* errMsg = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string reason = errMsg ? errMsg : sqlite3_errmsg(db_);
        sqlite3_free(errMsg);
        spdlog::error("[Database] SQL failed ({}): {}", reason, snippet(sql.c_str()));
        return Error{ErrorCode::DatabaseError, "Failed to execute SQL: " + reason};
    }
    return {};
}

Result<void> Database::attach(const std::string& path, const std::string& schema) {
    if (!isIdentifier(schema)) {
        return Error{ErrorCode::InvalidArgument, "Invalid schema name: " + schema};
    }
    auto stmt = prepare("ATTACH DATABASE ? AS " + schema);
    if (!stmt) {
        return stmt.error();
    }
    auto attached = std::move(stmt).value();
    if (auto r = attached.bind(1, path); !r) {
        return r;
    }
    return attached.execute();
}

Result<void> Database::beginTransaction() {
    if (inTransaction_) {
        return Error{ErrorCode::InvalidState, "Already in transaction"};
    }
    auto r = execute("BEGIN");
    inTransaction_ = r.has_value();
    return r;
}

Result<void> Database::commit() {
    if (!inTransaction_) {
        return Error{ErrorCode::InvalidState, "Not in transaction"};
    }
    auto r = execute("COMMIT");
    if (r) {
        inTransaction_ = false;
    }
    return r;
}

Result<void> Database::rollback() {
    if (!inTransaction_) {
        return Error{ErrorCode::InvalidState, "Not in transaction"};
    }
    // SQLite ends the transaction even when ROLLBACK reports an error
    inTransaction_ = false;
    return execute("ROLLBACK");
}

int Database::changes() const {
    return db_ ? sqlite3_changes(db_) : 0;
}

Result<bool> Database::tableExists(const std::string& table, const std::string& schema) {
    if (!isIdentifier(schema)) {
        return Error{ErrorCode::InvalidArgument, "Invalid schema name: " + schema};
    }
    auto stmt = prepare("SELECT 1 FROM " + schema +
                        ".sqlite_master WHERE type = 'table' AND name = ? LIMIT 1");
    if (!stmt) {
        return stmt.error();
    }
    auto lookup = std::move(stmt).value();
    if (auto r = lookup.bind(1, table); !r) {
        return r.error();
    }
    return lookup.step();
}

QueryBuilder& QueryBuilder::select(const std::vector<std::string>& columns) {
    columns_ = columns;
    return *this;
}

QueryBuilder& QueryBuilder::distinct() {
    distinct_ = true;
    return *this;
}

QueryBuilder& QueryBuilder::from(const std::string& table) {
    table_ = table;
    return *this;
}

QueryBuilder& QueryBuilder::join(const std::string& table, const std::string& on) {
    joins_.push_back(fmt::format("JOIN {} ON {}", table, on));
    return *this;
}

QueryBuilder& QueryBuilder::leftJoin(const std::string& table, const std::string& on) {
    joins_.push_back(fmt::format("LEFT JOIN {} ON {}", table, on));
    return *this;
}

QueryBuilder& QueryBuilder::where(const std::string& condition) {
    conditions_.assign(1, condition);
    return *this;
}

QueryBuilder& QueryBuilder::andWhere(const std::string& condition) {
    conditions_.push_back(condition);
    return *this;
}

QueryBuilder& QueryBuilder::groupBy(const std::string& column) {
    groupBy_ = column;
    return *this;
}

QueryBuilder& QueryBuilder::orderBy(const std::string& column, bool ascending) {
    ordering_.push_back(column + (ascending ? " ASC" : " DESC"));
    return *this;
}

QueryBuilder& QueryBuilder::limit(int limit) {
    limit_ = limit;
    return *this;
}

QueryBuilder& QueryBuilder::offset(int64_t offset) {
    offset_ = offset;
    return *this;
}

std::string QueryBuilder::build() const {
    auto joined = [](const std::vector<std::string>& parts, std::string_view sep) {
        std::string out;
        for (const auto& part : parts) {
            if (!out.empty()) {
                out += sep;
            }
            out += part;
        }
        return out;
    };

    std::string sql = distinct_ ? "SELECT DISTINCT " : "SELECT ";
    sql += columns_.empty() ? std::string("*") : joined(columns_, ", ");
    sql += " FROM " + table_;
    if (!joins_.empty()) {
        sql += " " + joined(joins_, " ");
    }
    if (!conditions_.empty()) {
        sql += " WHERE " + joined(conditions_, " AND ");
    }
    if (!groupBy_.empty()) {
        sql += " GROUP BY " + groupBy_;
    }
    if (!ordering_.empty()) {
        sql += " ORDER BY " + joined(ordering_, ", ");
    }
    if (limit_ && *limit_ >= 0) {
        sql += fmt::format(" LIMIT {}", *limit_);
    }
    if (offset_ && *offset_ > 0) {
        sql += fmt::format(" OFFSET {}", *offset_);
    }
    return sql;
}

} // namespace wamcp::metadata
