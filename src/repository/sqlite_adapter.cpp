// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#include <spdlog/spdlog.h>
#include <wamcp/core/time_utils.h>
#include <wamcp/repository/context_assembler.h>
#include <wamcp/repository/sqlite_adapter.h>

#include <algorithm>
#include <variant>

namespace wamcp::repository {

using metadata::ConnectionMode;
using metadata::Database;
using metadata::QueryBuilder;
using metadata::Statement;

namespace {

constexpr const char* kDeviceTable = "whatsmeow_device";
constexpr const char* kNotGroupClause = "c.jid NOT LIKE '%@g.us'";

const std::vector<std::string> kMessageColumns = {"m.id",        "m.timestamp", "m.sender",
                                                  "m.content",   "m.is_from_me", "m.chat_jid",
                                                  "c.name",      "m.media_type"};

const std::vector<std::string> kChatColumns = {"c.jid",     "c.name",   "c.last_message_time",
                                               "m.content", "m.sender", "m.is_from_me"};

const std::vector<std::string> kChatColumnsNoLast = {"c.jid", "c.name", "c.last_message_time",
                                                     "NULL",  "NULL",   "NULL"};

constexpr const char* kLastMessageJoin =
    "c.jid = m.chat_jid AND julianday(c.last_message_time) = julianday(m.timestamp)";

const char* kSchema[] = {
    "CREATE TABLE IF NOT EXISTS chats ("
    " jid TEXT PRIMARY KEY,"
    " name TEXT,"
    " last_message_time TIMESTAMP)",
    "CREATE TABLE IF NOT EXISTS messages ("
    " id TEXT NOT NULL,"
    " chat_jid TEXT NOT NULL,"
    " sender TEXT,"
    " content TEXT,"
    " timestamp TIMESTAMP,"
    " is_from_me BOOLEAN,"
    " media_type TEXT,"
    " filename TEXT,"
    " url TEXT,"
    " media_key BLOB,"
    " file_sha256 BLOB,"
    " file_enc_sha256 BLOB,"
    " file_length INTEGER,"
    " PRIMARY KEY (id, chat_jid),"
    " FOREIGN KEY (chat_jid) REFERENCES chats(jid))",
    "CREATE INDEX IF NOT EXISTS idx_messages_chat_timestamp ON messages(chat_jid, timestamp)",
    "CREATE INDEX IF NOT EXISTS idx_chats_last_message_time ON chats(last_message_time)",
};

using SqlParam = std::variant<std::string, int>;

std::string likePattern(const std::string& text) {
    return "%" + text + "%";
}

Result<Statement> prepareBound(Database& db, const std::string& sql,
                               const std::vector<SqlParam>& params) {
    auto stmtResult = db.prepare(sql);
    if (!stmtResult) {
        return stmtResult.error();
    }
    Statement stmt = std::move(stmtResult).value();
    int index = 1;
    for (const auto& param : params) {
        auto r = std::visit([&](const auto& v) { return stmt.bind(index, v); }, param);
        if (!r) {
            return r.error();
        }
        ++index;
    }
    return stmt;
}

Message readMessage(const Statement& stmt) {
    Message msg;
    msg.id = stmt.getString(0);
    msg.timestampText = stmt.getString(1);
    if (auto ts = Timestamp::parseStored(msg.timestampText)) {
        msg.timestamp = *ts;
    } else {
        spdlog::warn("[SqliteMessages] Message {} has an unreadable timestamp '{}'", msg.id,
                     msg.timestampText);
    }
    msg.sender = stmt.getString(2);
    msg.content = stmt.getString(3);
    msg.isFromMe = stmt.getInt(4) != 0;
    msg.chatJid = stmt.getString(5);
    msg.chatName = stmt.getOptionalString(6);
    msg.mediaType = stmt.getOptionalString(7);
    return msg;
}

Chat readChat(const Statement& stmt) {
    Chat chat;
    chat.jid = stmt.getString(0);
    chat.name = stmt.getOptionalString(1);
    if (auto ts = stmt.getOptionalString(2)) {
        chat.lastMessageTime = Timestamp::parseStored(*ts);
    }
    chat.lastMessage = stmt.getOptionalString(3);
    chat.lastSender = stmt.getOptionalString(4);
    if (!stmt.isNull(5)) {
        chat.lastIsFromMe = stmt.getInt(5) != 0;
    }
    return chat;
}

template <typename T, typename Reader>
Result<std::vector<T>> collect(Database& db, const std::string& sql,
                               const std::vector<SqlParam>& params, Reader&& reader) {
    auto stmtResult = prepareBound(db, sql, params);
    if (!stmtResult) {
        return stmtResult.error();
    }
    Statement stmt = std::move(stmtResult).value();
    std::vector<T> rows;
    while (true) {
        auto step = stmt.step();
        if (!step) {
            return step.error();
        }
        if (!step.value()) {
            break;
        }
        rows.push_back(reader(stmt));
    }
    return rows;
}

Error closedError() {
    return Error{ErrorCode::InvalidState, "Database adapter is closed"};
}

class SqliteMessageRepository final : public IMessageRepository {
public:
    explicit SqliteMessageRepository(std::shared_ptr<SqliteSession> session)
        : session_(std::move(session)) {}

    Result<std::vector<Message>> listMessages(const MessageQuery& query) override {
        auto offset = pageOffset(query.limit, query.page);
        if (!offset) {
            return offset.error();
        }

        QueryBuilder qb;
        qb.select(kMessageColumns).from("messages m").join("chats c", "m.chat_jid = c.jid");
        std::vector<SqlParam> params;

        if (query.after) {
            auto tp = Timestamp::parse(*query.after);
            if (!tp) {
                return tp.error();
            }
            qb.andWhere("julianday(m.timestamp) > julianday(?)");
            params.emplace_back(Timestamp::format(tp.value()));
        }
        if (query.before) {
            auto tp = Timestamp::parse(*query.before);
            if (!tp) {
                return tp.error();
            }
            qb.andWhere("julianday(m.timestamp) < julianday(?)");
            params.emplace_back(Timestamp::format(tp.value()));
        }
        if (query.sender) {
            qb.andWhere("m.sender = ?");
            params.emplace_back(*query.sender);
        }
        if (query.chatJid) {
            qb.andWhere("m.chat_jid = ?");
            params.emplace_back(*query.chatJid);
        }
        if (query.text) {
            qb.andWhere("LOWER(m.content) LIKE LOWER(?)");
            params.emplace_back(likePattern(*query.text));
        }
        qb.orderBy("julianday(m.timestamp)", false)
            .limit(query.limit)
            .offset(offset.value());

        Result<std::vector<Message>> matches = std::vector<Message>{};
        {
            std::lock_guard<std::mutex> lock(session_->mutex);
            if (session_->closed) {
                return closedError();
            }
            matches = collect<Message>(session_->db, qb.build(), params, readMessage);
        }
        if (!matches || !query.includeContext) {
            return matches;
        }
        return ContextAssembler{*this}.expand(matches.value(), query.contextBefore,
                                              query.contextAfter);
    }

    Result<MessageContext> getMessageContext(const std::string& messageId, int before,
                                             int after) override {
        std::lock_guard<std::mutex> lock(session_->mutex);
        if (session_->closed) {
            return closedError();
        }
        auto& db = session_->db;

        QueryBuilder target;
        target.select(kMessageColumns)
            .from("messages m")
            .join("chats c", "m.chat_jid = c.jid")
            .where("m.id = ?")
            .limit(1);
        auto found = collect<Message>(db, target.build(), {messageId}, readMessage);
        if (!found) {
            return found.error();
        }
        if (found.value().empty()) {
            return Error{ErrorCode::NotFound, "Message with ID " + messageId + " not found"};
        }

        MessageContext ctx;
        ctx.message = std::move(found.value().front());

        QueryBuilder earlier;
        earlier.select(kMessageColumns)
            .from("messages m")
            .join("chats c", "m.chat_jid = c.jid")
            .where("m.chat_jid = ?")
            .andWhere("julianday(m.timestamp) < julianday(?)")
            .orderBy("julianday(m.timestamp)", false)
            .limit(std::max(0, before));
        auto beforeRows = collect<Message>(
            db, earlier.build(), {ctx.message.chatJid, ctx.message.timestampText}, readMessage);
        if (!beforeRows) {
            return beforeRows.error();
        }
        ctx.before = std::move(beforeRows.value());
        std::reverse(ctx.before.begin(), ctx.before.end());

        QueryBuilder later;
        later.select(kMessageColumns)
            .from("messages m")
            .join("chats c", "m.chat_jid = c.jid")
            .where("m.chat_jid = ?")
            .andWhere("julianday(m.timestamp) > julianday(?)")
            .orderBy("julianday(m.timestamp)", true)
            .limit(std::max(0, after));
        auto afterRows = collect<Message>(
            db, later.build(), {ctx.message.chatJid, ctx.message.timestampText}, readMessage);
        if (!afterRows) {
            return afterRows.error();
        }
        ctx.after = std::move(afterRows.value());
        return ctx;
    }

    std::string getSenderName(const std::string& senderJid) override {
        std::lock_guard<std::mutex> lock(session_->mutex);
        if (session_->closed) {
            return senderJid;
        }
        auto readName = [](const Statement& s) { return s.getOptionalString(0); };

        auto exact = collect<std::optional<std::string>>(
            session_->db, "SELECT name FROM chats WHERE jid = ? LIMIT 1", {senderJid}, readName);
        if (exact && !exact.value().empty() && exact.value().front() &&
            !exact.value().front()->empty()) {
            return *exact.value().front();
        }

        const std::string phone = phoneFromJid(senderJid);
        auto partial = collect<std::optional<std::string>>(
            session_->db, "SELECT name FROM chats WHERE jid LIKE ? LIMIT 1", {likePattern(phone)},
            readName);
        if (!partial) {
            spdlog::debug("[SqliteMessages] Sender lookup failed for {}: {}", senderJid,
                          partial.error().message);
            return senderJid;
        }
        if (!partial.value().empty() && partial.value().front() &&
            !partial.value().front()->empty()) {
            return *partial.value().front();
        }
        return senderJid;
    }

    Result<void> storeMessage(const Message& message) override {
        std::lock_guard<std::mutex> lock(session_->mutex);
        if (session_->closed) {
            return closedError();
        }
        auto stmtResult = session_->db.prepare(
            "INSERT INTO messages (id, chat_jid, sender, content, timestamp, is_from_me, media_type)"
            " VALUES (?, ?, ?, ?, ?, ?, ?)"
            " ON CONFLICT(id, chat_jid) DO UPDATE SET sender = excluded.sender,"
            " content = excluded.content, timestamp = excluded.timestamp,"
            " is_from_me = excluded.is_from_me, media_type = excluded.media_type");
        if (!stmtResult) {
            return stmtResult.error();
        }
        Statement stmt = std::move(stmtResult).value();
        const std::string ts = message.timestampText.empty() ? Timestamp::format(message.timestamp)
                                                             : message.timestampText;
        if (auto r = stmt.bindAll(message.id, message.chatJid, message.sender, message.content, ts,
                                  message.isFromMe, message.mediaType);
            !r) {
            return r;
        }
        return stmt.execute();
    }

private:
    std::shared_ptr<SqliteSession> session_;
};

class SqliteChatRepository final : public IChatRepository {
public:
    explicit SqliteChatRepository(std::shared_ptr<SqliteSession> session)
        : session_(std::move(session)) {}

    Result<std::vector<Chat>> listChats(const ChatQuery& query) override {
        auto offset = pageOffset(query.limit, query.page);
        if (!offset) {
            return offset.error();
        }
        QueryBuilder qb = baseQuery(query.includeLastMessage);
        std::vector<SqlParam> params;
        if (query.text) {
            qb.andWhere("(LOWER(c.name) LIKE LOWER(?) OR c.jid LIKE ?)");
            params.emplace_back(likePattern(*query.text));
            params.emplace_back(likePattern(*query.text));
        }
        if (query.sortBy == ChatSort::Name) {
            qb.orderBy("c.name IS NULL").orderBy("c.name");
        } else {
            qb.orderBy("julianday(c.last_message_time)", false);
        }
        qb.limit(query.limit).offset(offset.value());

        std::lock_guard<std::mutex> lock(session_->mutex);
        if (session_->closed) {
            return closedError();
        }
        return collect<Chat>(session_->db, qb.build(), params, readChat);
    }

    Result<std::optional<Chat>> getChat(const std::string& jid, bool includeLastMessage) override {
        QueryBuilder qb = baseQuery(includeLastMessage);
        qb.andWhere("c.jid = ?").limit(1);
        return first(qb.build(), {jid});
    }

    Result<std::optional<Chat>> getDirectChatByContact(const std::string& phone) override {
        QueryBuilder qb = baseQuery(true);
        qb.andWhere("c.jid LIKE ?").andWhere(kNotGroupClause).limit(1);
        return first(qb.build(), {likePattern(phone)});
    }

    Result<void> upsertChat(const Chat& chat) override {
        std::lock_guard<std::mutex> lock(session_->mutex);
        if (session_->closed) {
            return closedError();
        }
        auto stmtResult = session_->db.prepare(
            "INSERT INTO chats (jid, name, last_message_time) VALUES (?, ?, ?)"
            " ON CONFLICT(jid) DO UPDATE SET"
            " name = COALESCE(excluded.name, chats.name),"
            " last_message_time = COALESCE(excluded.last_message_time, chats.last_message_time)");
        if (!stmtResult) {
            return stmtResult.error();
        }
        Statement stmt = std::move(stmtResult).value();
        std::optional<std::string> ts;
        if (chat.lastMessageTime) {
            ts = Timestamp::format(*chat.lastMessageTime);
        }
        if (auto r = stmt.bindAll(chat.jid, chat.name, ts); !r) {
            return r;
        }
        return stmt.execute();
    }

private:
    static QueryBuilder baseQuery(bool includeLastMessage) {
        QueryBuilder qb;
        if (includeLastMessage) {
            qb.select(kChatColumns)
                .from("chats c")
                .leftJoin("messages m", kLastMessageJoin)
                .groupBy("c.jid");
        } else {
            qb.select(kChatColumnsNoLast).from("chats c");
        }
        return qb;
    }

    Result<std::optional<Chat>> first(const std::string& sql, const std::vector<SqlParam>& params) {
        std::lock_guard<std::mutex> lock(session_->mutex);
        if (session_->closed) {
            return closedError();
        }
        auto rows = collect<Chat>(session_->db, sql, params, readChat);
        if (!rows) {
            return rows.error();
        }
        if (rows.value().empty()) {
            return std::optional<Chat>{};
        }
        return std::optional<Chat>{std::move(rows.value().front())};
    }

    std::shared_ptr<SqliteSession> session_;
};

class SqliteContactRepository final : public IContactRepository {
public:
    explicit SqliteContactRepository(std::shared_ptr<SqliteSession> session)
        : session_(std::move(session)) {}

    Result<std::vector<Contact>> searchContacts(const std::string& query) override {
        QueryBuilder qb;
        qb.select({"c.jid", "c.name"})
            .distinct()
            .from("chats c")
            .where("(LOWER(c.name) LIKE LOWER(?) OR LOWER(c.jid) LIKE LOWER(?))")
            .andWhere(kNotGroupClause)
            .orderBy("c.name")
            .orderBy("c.jid")
            .limit(kContactSearchLimit);

        std::lock_guard<std::mutex> lock(session_->mutex);
        if (session_->closed) {
            return closedError();
        }
        return collect<Contact>(session_->db, qb.build(),
                                {likePattern(query), likePattern(query)},
                                [](const Statement& s) {
                                    Contact contact;
                                    contact.jid = s.getString(0);
                                    contact.name = s.getOptionalString(1);
                                    contact.phoneNumber = phoneFromJid(contact.jid);
                                    return contact;
                                });
    }

    Result<std::vector<Chat>> getContactChats(const std::string& jid, int limit,
                                              int page) override {
        auto offset = pageOffset(limit, page);
        if (!offset) {
            return offset.error();
        }
        QueryBuilder qb;
        qb.select(kChatColumns)
            .from("chats c")
            .leftJoin("messages m", kLastMessageJoin)
            .where("(c.jid = ? OR c.jid IN (SELECT chat_jid FROM messages WHERE sender = ?))")
            .groupBy("c.jid")
            .orderBy("julianday(c.last_message_time)", false)
            .orderBy("c.jid")
            .limit(limit)
            .offset(offset.value());

        std::lock_guard<std::mutex> lock(session_->mutex);
        if (session_->closed) {
            return closedError();
        }
        return collect<Chat>(session_->db, qb.build(), {jid, jid}, readChat);
    }

    Result<std::optional<Message>> getLastInteraction(const std::string& jid) override {
        QueryBuilder qb;
        qb.select(kMessageColumns)
            .from("messages m")
            .join("chats c", "m.chat_jid = c.jid")
            .where("(m.sender = ? OR c.jid = ?)")
            .orderBy("julianday(m.timestamp)", false)
            .limit(1);

        std::lock_guard<std::mutex> lock(session_->mutex);
        if (session_->closed) {
            return closedError();
        }
        auto rows = collect<Message>(session_->db, qb.build(), {jid, jid}, readMessage);
        if (!rows) {
            return rows.error();
        }
        if (rows.value().empty()) {
            return std::optional<Message>{};
        }
        return std::optional<Message>{std::move(rows.value().front())};
    }

private:
    std::shared_ptr<SqliteSession> session_;
};

class SqliteAuthenticationRepository final : public IAuthenticationRepository {
public:
    explicit SqliteAuthenticationRepository(std::shared_ptr<SqliteSession> session)
        : session_(std::move(session)) {}

    AuthStatus checkAuthenticationStatus() noexcept override {
        std::lock_guard<std::mutex> lock(session_->mutex);
        if (session_->closed) {
            return {false, "Database error: adapter is closed"};
        }
        auto& db = session_->db;
        auto exists = db.tableExists(kDeviceTable, session_->authSchema);
        if (!exists) {
            return {false, "Database error: " + exists.error().message};
        }
        if (!exists.value()) {
            return {false, "No device table found"};
        }

        auto count = collect<int64_t>(
            db, "SELECT COUNT(*) FROM " + session_->authSchema + "." + kDeviceTable, {},
            [](const Statement& s) { return s.getInt64(0); });
        if (!count) {
            return {false, "Database error: " + count.error().message};
        }
        if (count.value().empty() || count.value().front() == 0) {
            return {false, "No device registered"};
        }
        return {true, std::nullopt};
    }

private:
    std::shared_ptr<SqliteSession> session_;
};

class SqliteUnitOfWork final : public IUnitOfWork {
public:
    explicit SqliteUnitOfWork(std::shared_ptr<SqliteSession> session)
        : session_(std::move(session)) {}

    Result<void> begin() override {
        std::lock_guard<std::mutex> lock(session_->mutex);
        if (session_->closed) {
            return closedError();
        }
        return session_->db.beginTransaction();
    }

    Result<void> commit() override {
        std::lock_guard<std::mutex> lock(session_->mutex);
        if (session_->closed) {
            return closedError();
        }
        return session_->db.commit();
    }

    Result<void> rollback() override {
        std::lock_guard<std::mutex> lock(session_->mutex);
        if (session_->closed) {
            return closedError();
        }
        return session_->db.rollback();
    }

    void discard() noexcept override {
        std::lock_guard<std::mutex> lock(session_->mutex);
        if (session_->closed || !session_->db.inTransaction()) {
            return;
        }
        spdlog::debug("[SqliteUnitOfWork] Discarding uncommitted transaction");
        if (auto r = session_->db.rollback(); !r) {
            spdlog::warn("[SqliteUnitOfWork] Discard failed: {}", r.error().message);
        }
    }

    [[nodiscard]] bool isTransactional() const noexcept override { return true; }

private:
    std::shared_ptr<SqliteSession> session_;
};

bool isMemoryPath(const std::string& path) {
    return path.empty() || path == config::kInMemoryDatabase;
}

} // namespace

Result<std::unique_ptr<SqliteDatabaseAdapter>>
SqliteDatabaseAdapter::open(const config::SqliteBackendConfig& config) {
    auto session = std::make_shared<SqliteSession>();

    const bool memory = isMemoryPath(config.messagesDbPath);
    auto opened = session->db.open(memory ? std::string(config::kInMemoryDatabase)
                                          : config.messagesDbPath,
                                   memory ? ConnectionMode::Memory : ConnectionMode::Create);
    if (!opened) {
        return opened.error();
    }

    const bool sameFile = !memory && config.authDbPath == config.messagesDbPath;
    if (!sameFile) {
        const std::string authPath =
            isMemoryPath(config.authDbPath) ? std::string(config::kInMemoryDatabase)
                                            : config.authDbPath;
        if (auto r = session->db.attach(authPath, "auth"); !r) {
            return Error{ErrorCode::DatabaseError,
                         "Failed to attach auth database '" + authPath + "': " + r.error().message};
        }
        session->authSchema = "auth";
    }

    if (config.createSchema) {
        for (const char* ddl : kSchema) {
            if (auto r = session->db.execute(ddl); !r) {
                return r.error();
            }
        }
    }

    spdlog::debug("[SqliteAdapter] Opened messages={} auth={} (schema {})", config.messagesDbPath,
                  config.authDbPath, session->authSchema);
    return std::make_unique<SqliteDatabaseAdapter>(PrivateTag{}, std::move(session));
}

SqliteDatabaseAdapter::SqliteDatabaseAdapter(PrivateTag, std::shared_ptr<SqliteSession> session)
    : session_(std::move(session)),
      messages_(std::make_unique<SqliteMessageRepository>(session_)),
      chats_(std::make_unique<SqliteChatRepository>(session_)),
      contacts_(std::make_unique<SqliteContactRepository>(session_)),
      auth_(std::make_unique<SqliteAuthenticationRepository>(session_)) {}

SqliteDatabaseAdapter::~SqliteDatabaseAdapter() {
    close();
}

IMessageRepository& SqliteDatabaseAdapter::messages() {
    return *messages_;
}

IChatRepository& SqliteDatabaseAdapter::chats() {
    return *chats_;
}

IContactRepository& SqliteDatabaseAdapter::contacts() {
    return *contacts_;
}

IAuthenticationRepository& SqliteDatabaseAdapter::authentication() {
    return *auth_;
}

std::unique_ptr<IUnitOfWork> SqliteDatabaseAdapter::unitOfWork() {
    return std::make_unique<SqliteUnitOfWork>(session_);
}

void SqliteDatabaseAdapter::close() {
    std::lock_guard<std::mutex> lock(session_->mutex);
    if (session_->closed) {
        return;
    }
    if (session_->db.inTransaction()) {
        spdlog::warn("[SqliteAdapter] Closing with an open transaction; rolling back");
        if (auto r = session_->db.rollback(); !r) {
            spdlog::error("[SqliteAdapter] Rollback on close failed: {}", r.error().message);
        }
    }
    session_->db.close();
    session_->closed = true;
}

Result<void> SqliteDatabaseAdapter::execute(const std::string& sql) {
    std::lock_guard<std::mutex> lock(session_->mutex);
    if (session_->closed) {
        return closedError();
    }
    return session_->db.execute(sql);
}

} // namespace wamcp::repository
