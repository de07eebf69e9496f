// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#include <spdlog/spdlog.h>
#include <wamcp/core/time_utils.h>
#include <wamcp/repository/context_assembler.h>
#include <wamcp/repository/rest_adapter.h>

#include <algorithm>
#include <cstddef>
#include <set>

namespace wamcp::repository {

using nlohmann::json;

namespace {

constexpr const char* kMessageSelect =
    "id,chat_jid,sender,content,timestamp,is_from_me,media_type,chats(name)";
constexpr const char* kChatListSelect =
    "jid,name,last_message_time,last_message,last_sender,last_is_from_me";
constexpr const char* kChatSelect = "jid,name,last_message_time";
constexpr const char* kGroupPattern = "*@g.us";

// Requested page size when scanning a contact's messages for chat ids. The server may
// return fewer rows per page (PostgREST max-rows), so the scan stops only on an empty page.
constexpr int kSenderScanPage = 1000;
// Identifiers per `in.(...)` filter, keeping request URLs well below server limits.
constexpr std::size_t kInListChunk = 100;

std::optional<std::string> optString(const json& row, const char* key) {
    auto it = row.find(key);
    if (it == row.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

std::optional<bool> optBool(const json& row, const char* key) {
    auto it = row.find(key);
    if (it == row.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_boolean()) {
        return it->get<bool>();
    }
    if (it->is_number_integer()) {
        return it->get<int64_t>() != 0;
    }
    return std::nullopt;
}

Message messageFromRow(const json& row) {
    Message msg;
    msg.id = optString(row, "id").value_or("");
    msg.chatJid = optString(row, "chat_jid").value_or("");
    msg.sender = optString(row, "sender").value_or("");
    msg.content = optString(row, "content").value_or("");
    msg.timestampText = optString(row, "timestamp").value_or("");
    if (auto ts = Timestamp::parseStored(msg.timestampText)) {
        msg.timestamp = *ts;
    } else {
        spdlog::warn("[RestMessages] Message {} has an unreadable timestamp '{}'", msg.id,
                     msg.timestampText);
    }
    msg.isFromMe = optBool(row, "is_from_me").value_or(false);
    msg.mediaType = optString(row, "media_type");
    if (auto it = row.find("chats"); it != row.end() && it->is_object()) {
        msg.chatName = optString(*it, "name");
    }
    return msg;
}

Chat chatFromRow(const json& row) {
    Chat chat;
    chat.jid = optString(row, "jid").value_or("");
    chat.name = optString(row, "name");
    if (auto ts = optString(row, "last_message_time")) {
        chat.lastMessageTime = Timestamp::parseStored(*ts);
    }
    chat.lastMessage = optString(row, "last_message");
    chat.lastSender = optString(row, "last_sender");
    chat.lastIsFromMe = optBool(row, "last_is_from_me");
    return chat;
}

template <typename T, typename Mapper> std::vector<T> mapRows(const json& rows, Mapper&& mapper) {
    std::vector<T> out;
    out.reserve(rows.size());
    for (const auto& row : rows) {
        out.push_back(mapper(row));
    }
    return out;
}

std::string wildcard(const std::string& text) {
    return "*" + text + "*";
}

class RestMessageRepository final : public IMessageRepository {
public:
    explicit RestMessageRepository(std::shared_ptr<RestSession> session)
        : session_(std::move(session)) {}

    Result<std::vector<Message>> listMessages(const MessageQuery& query) override {
        auto offset = pageOffset(query.limit, query.page);
        if (!offset) {
            return offset.error();
        }
        PostgrestQuery q("messages");
        q.select(kMessageSelect);
        if (query.after) {
            auto tp = Timestamp::parse(*query.after);
            if (!tp) {
                return tp.error();
            }
            q.filter("timestamp", "gt", Timestamp::format(tp.value()));
        }
        if (query.before) {
            auto tp = Timestamp::parse(*query.before);
            if (!tp) {
                return tp.error();
            }
            q.filter("timestamp", "lt", Timestamp::format(tp.value()));
        }
        if (query.sender) {
            q.filter("sender", "eq", *query.sender);
        }
        if (query.chatJid) {
            q.filter("chat_jid", "eq", *query.chatJid);
        }
        if (query.text) {
            q.filter("content", "ilike", wildcard(*query.text));
        }
        q.order("timestamp.desc.nullslast").limit(query.limit).offset(offset.value());

        auto rows = session_->fetch(q);
        if (!rows) {
            return rows.error();
        }
        auto matches = mapRows<Message>(rows.value(), messageFromRow);
        if (!query.includeContext) {
            return matches;
        }
        return ContextAssembler{*this}.expand(matches, query.contextBefore, query.contextAfter);
    }

    Result<MessageContext> getMessageContext(const std::string& messageId, int before,
                                             int after) override {
        PostgrestQuery target("messages");
        target.select(kMessageSelect).filter("id", "eq", messageId).limit(1);
        auto found = session_->fetch(target);
        if (!found) {
            return found.error();
        }
        if (found.value().empty()) {
            return Error{ErrorCode::NotFound, "Message with ID " + messageId + " not found"};
        }

        MessageContext ctx;
        ctx.message = messageFromRow(found.value().front());

        if (before > 0) {
            PostgrestQuery q("messages");
            q.select(kMessageSelect)
                .filter("chat_jid", "eq", ctx.message.chatJid)
                .filter("timestamp", "lt", ctx.message.timestampText)
                .order("timestamp.desc")
                .limit(before);
            auto rows = session_->fetch(q);
            if (!rows) {
                return rows.error();
            }
            ctx.before = mapRows<Message>(rows.value(), messageFromRow);
            std::reverse(ctx.before.begin(), ctx.before.end());
        }

        if (after > 0) {
            PostgrestQuery q("messages");
            q.select(kMessageSelect)
                .filter("chat_jid", "eq", ctx.message.chatJid)
                .filter("timestamp", "gt", ctx.message.timestampText)
                .order("timestamp.asc")
                .limit(after);
            auto rows = session_->fetch(q);
            if (!rows) {
                return rows.error();
            }
            ctx.after = mapRows<Message>(rows.value(), messageFromRow);
        }
        return ctx;
    }

    std::string getSenderName(const std::string& senderJid) override {
        auto lookup = [&](const std::string& op, const std::string& value) {
            PostgrestQuery q("chats");
            q.select("name").filter("jid", op, value).limit(1);
            auto rows = session_->fetch(q);
            if (!rows || rows.value().empty()) {
                return std::optional<std::string>{};
            }
            auto name = optString(rows.value().front(), "name");
            if (name && name->empty()) {
                return std::optional<std::string>{};
            }
            return name;
        };

        if (auto name = lookup("eq", senderJid)) {
            return *name;
        }
        if (auto name = lookup("like", wildcard(phoneFromJid(senderJid)))) {
            return *name;
        }
        return senderJid;
    }

    Result<void> storeMessage(const Message& message) override {
        json row = {
            {"id", message.id},
            {"chat_jid", message.chatJid},
            {"sender", message.sender},
            {"content", message.content},
            {"timestamp", message.timestampText.empty() ? Timestamp::format(message.timestamp)
                                                        : message.timestampText},
            {"is_from_me", message.isFromMe},
        };
        row["media_type"] = message.mediaType ? json(*message.mediaType) : json(nullptr);
        PostgrestQuery target("messages");
        target.onConflict("id,chat_jid");
        return session_->upsert(target, row);
    }

private:
    std::shared_ptr<RestSession> session_;
};

class RestChatRepository final : public IChatRepository {
public:
    explicit RestChatRepository(std::shared_ptr<RestSession> session)
        : session_(std::move(session)) {}

    Result<std::vector<Chat>> listChats(const ChatQuery& query) override {
        auto offset = pageOffset(query.limit, query.page);
        if (!offset) {
            return offset.error();
        }
        PostgrestQuery q(query.includeLastMessage ? "chat_list" : "chats");
        q.select(query.includeLastMessage ? kChatListSelect : kChatSelect);
        if (query.text) {
            const auto pattern = quotePostgrestValue(wildcard(*query.text));
            q.anyOf({"name.ilike." + pattern, "jid.ilike." + pattern});
        }
        q.order(query.sortBy == ChatSort::Name ? "name.asc.nullslast"
                                               : "last_message_time.desc.nullslast");
        q.limit(query.limit).offset(offset.value());

        auto rows = session_->fetch(q);
        if (!rows) {
            return rows.error();
        }
        return mapRows<Chat>(rows.value(), chatFromRow);
    }

    Result<std::optional<Chat>> getChat(const std::string& jid, bool includeLastMessage) override {
        PostgrestQuery q(includeLastMessage ? "chat_list" : "chats");
        q.select(includeLastMessage ? kChatListSelect : kChatSelect)
            .filter("jid", "eq", jid)
            .limit(1);
        return first(q);
    }

    Result<std::optional<Chat>> getDirectChatByContact(const std::string& phone) override {
        PostgrestQuery q("chat_list");
        q.select(kChatListSelect)
            .filter("jid", "like", wildcard(phone))
            .filter("jid", "not.like", kGroupPattern)
            .limit(1);
        return first(q);
    }

    Result<void> upsertChat(const Chat& chat) override {
        json row = {{"jid", chat.jid}};
        if (chat.name) {
            row["name"] = *chat.name;
        }
        if (chat.lastMessageTime) {
            row["last_message_time"] = Timestamp::format(*chat.lastMessageTime);
        }
        PostgrestQuery target("chats");
        target.onConflict("jid");
        return session_->upsert(target, row);
    }

private:
    Result<std::optional<Chat>> first(const PostgrestQuery& q) {
        auto rows = session_->fetch(q);
        if (!rows) {
            return rows.error();
        }
        if (rows.value().empty()) {
            return std::optional<Chat>{};
        }
        return std::optional<Chat>{chatFromRow(rows.value().front())};
    }

    std::shared_ptr<RestSession> session_;
};

class RestContactRepository final : public IContactRepository {
public:
    explicit RestContactRepository(std::shared_ptr<RestSession> session)
        : session_(std::move(session)) {}

    Result<std::vector<Contact>> searchContacts(const std::string& query) override {
        const auto pattern = quotePostgrestValue(wildcard(query));
        PostgrestQuery q("chats");
        q.select("jid,name")
            .anyOf({"name.ilike." + pattern, "jid.ilike." + pattern})
            .filter("jid", "not.like", kGroupPattern)
            .order("name.asc.nullsfirst,jid.asc")
            .limit(kContactSearchLimit);

        auto rows = session_->fetch(q);
        if (!rows) {
            return rows.error();
        }
        return mapRows<Contact>(rows.value(), [](const json& row) {
            Contact contact;
            contact.jid = optString(row, "jid").value_or("");
            contact.name = optString(row, "name");
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
        auto jids = chatsWithSender(jid);
        if (!jids) {
            return jids.error();
        }
        jids.value().insert(jid);

        std::vector<std::string> pending(jids.value().begin(), jids.value().end());
        std::vector<Chat> chats;
        for (std::size_t i = 0; i < pending.size(); i += kInListChunk) {
            const auto last = std::min(pending.size(), i + kInListChunk);
            std::string inList = "(";
            for (std::size_t j = i; j < last; ++j) {
                if (j > i) {
                    inList += ",";
                }
                inList += quotePostgrestValue(pending[j]);
            }
            inList += ")";

            PostgrestQuery q("chat_list");
            q.select(kChatListSelect).filter("jid", "in", inList);
            auto rows = session_->fetch(q);
            if (!rows) {
                return rows.error();
            }
            for (const auto& row : rows.value()) {
                chats.push_back(chatFromRow(row));
            }
        }

        // Most recently active first, chats without activity last, then by jid
        std::sort(chats.begin(), chats.end(), [](const Chat& a, const Chat& b) {
            if (a.lastMessageTime.has_value() != b.lastMessageTime.has_value()) {
                return a.lastMessageTime.has_value();
            }
            if (a.lastMessageTime && *a.lastMessageTime != *b.lastMessageTime) {
                return *a.lastMessageTime > *b.lastMessageTime;
            }
            return a.jid < b.jid;
        });

        const auto skip = static_cast<std::size_t>(
            std::min<int64_t>(offset.value(), static_cast<int64_t>(chats.size())));
        const auto take = std::min(chats.size() - skip, static_cast<std::size_t>(limit));
        return std::vector<Chat>(chats.begin() + static_cast<std::ptrdiff_t>(skip),
                                 chats.begin() + static_cast<std::ptrdiff_t>(skip + take));
    }

    Result<std::optional<Message>> getLastInteraction(const std::string& jid) override {
        const auto value = quotePostgrestValue(jid);
        PostgrestQuery q("messages");
        q.select(kMessageSelect)
            .anyOf({"sender.eq." + value, "chat_jid.eq." + value})
            .order("timestamp.desc.nullslast")
            .limit(1);
        auto rows = session_->fetch(q);
        if (!rows) {
            return rows.error();
        }
        if (rows.value().empty()) {
            return std::optional<Message>{};
        }
        return std::optional<Message>{messageFromRow(rows.value().front())};
    }

private:
    /// Distinct chats the contact has written in, read page by page.
    Result<std::set<std::string>> chatsWithSender(const std::string& jid) {
        std::set<std::string> jids;
        int64_t scanned = 0;
        while (true) {
            PostgrestQuery q("messages");
            q.select("chat_jid")
                .filter("sender", "eq", jid)
                .order("chat_jid.asc,id.asc")
                .limit(kSenderScanPage)
                .offset(scanned);
            auto rows = session_->fetch(q);
            if (!rows) {
                return rows.error();
            }
            if (rows.value().empty()) {
                return jids;
            }
            scanned += static_cast<int64_t>(rows.value().size());
            for (const auto& row : rows.value()) {
                if (auto chatJid = optString(row, "chat_jid")) {
                    jids.insert(*chatJid);
                }
            }
        }
    }

    std::shared_ptr<RestSession> session_;
};

class RestAuthenticationRepository final : public IAuthenticationRepository {
public:
    explicit RestAuthenticationRepository(std::shared_ptr<RestSession> session)
        : session_(std::move(session)) {}

    AuthStatus checkAuthenticationStatus() noexcept override {
        PostgrestQuery q("whatsmeow_device");
        q.select("jid").limit(1);
        auto rows = session_->fetch(q);
        if (!rows) {
            const auto& msg = rows.error().message;
            if (rows.error().code == ErrorCode::NotFound ||
                msg.find("does not exist") != std::string::npos) {
                return {false, "No device table found"};
            }
            return {false, "Database error: " + msg};
        }
        if (rows.value().empty()) {
            return {false, "No device registered"};
        }
        return {true, std::nullopt};
    }

private:
    std::shared_ptr<RestSession> session_;
};

class RestUnitOfWork final : public IUnitOfWork {
public:
    Result<void> begin() override {
        spdlog::debug("[RestUnitOfWork] begin (no transaction; each request commits on its own)");
        return {};
    }

    Result<void> commit() override { return {}; }

    Result<void> rollback() override {
        spdlog::warn("[RestUnitOfWork] Rollback requested but not supported by the REST backend. "
                     "Each operation is atomic but cannot be rolled back.");
        return {};
    }

    void discard() noexcept override {}

    [[nodiscard]] bool isTransactional() const noexcept override { return false; }
};

} // namespace

PostgrestQuery& PostgrestQuery::select(const std::string& columns) {
    params_.emplace_back("select", columns);
    return *this;
}

PostgrestQuery& PostgrestQuery::filter(const std::string& column, const std::string& op,
                                       const std::string& value) {
    params_.emplace_back(column, op + "." + value);
    return *this;
}

PostgrestQuery& PostgrestQuery::anyOf(const std::vector<std::string>& conditions) {
    std::string expr = "(";
    for (size_t i = 0; i < conditions.size(); ++i) {
        if (i > 0) {
            expr += ",";
        }
        expr += conditions[i];
    }
    expr += ")";
    params_.emplace_back("or", expr);
    return *this;
}

PostgrestQuery& PostgrestQuery::order(const std::string& clause) {
    params_.emplace_back("order", clause);
    return *this;
}

PostgrestQuery& PostgrestQuery::limit(int n) {
    params_.emplace_back("limit", std::to_string(n));
    return *this;
}

PostgrestQuery& PostgrestQuery::offset(int64_t n) {
    if (n > 0) {
        params_.emplace_back("offset", std::to_string(n));
    }
    return *this;
}

PostgrestQuery& PostgrestQuery::onConflict(const std::string& columns) {
    params_.emplace_back("on_conflict", columns);
    return *this;
}

std::string PostgrestQuery::build() const {
    if (params_.empty()) {
        return table_;
    }
    return table_ + "?" + http::buildQueryString(params_);
}

std::string quotePostgrestValue(const std::string& value) {
    std::string out = "\"";
    for (char c : value) {
        if (c == '"' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::vector<http::Header> RestSession::authHeaders() const {
    return {{"apikey", apiKey},
            {"Authorization", "Bearer " + apiKey},
            {"Accept", "application/json"}};
}

Result<json> RestSession::fetch(const PostgrestQuery& query) {
    if (closed.load()) {
        return Error{ErrorCode::InvalidState, "Database adapter is closed"};
    }
    auto response = http->get(restUrl + query.build(), authHeaders());
    if (!response) {
        return response.error();
    }
    const auto& res = response.value();
    if (!res.ok()) {
        const auto code = res.status == 404 ? ErrorCode::NotFound : ErrorCode::DatabaseError;
        return Error{code, "PostgREST " + query.table() + " returned HTTP " +
                               std::to_string(res.status) + ": " + res.body};
    }
    auto body = json::parse(res.body, nullptr, false);
    if (body.is_discarded() || !body.is_array()) {
        return Error{ErrorCode::InvalidData, "Unexpected PostgREST payload for " + query.table()};
    }
    return body;
}

Result<void> RestSession::upsert(const PostgrestQuery& target, const json& row) {
    if (closed.load()) {
        return Error{ErrorCode::InvalidState, "Database adapter is closed"};
    }
    auto headers = authHeaders();
    headers.push_back({"Prefer", "resolution=merge-duplicates,return=minimal"});
    auto response = http->postJson(restUrl + target.build(), row.dump(), std::move(headers));
    if (!response) {
        return response.error();
    }
    if (!response.value().ok()) {
        return Error{ErrorCode::DatabaseError, "PostgREST upsert into " + target.table() +
                                                   " returned HTTP " +
                                                   std::to_string(response.value().status) +
                                                   ": " + response.value().body};
    }
    return {};
}

RestDatabaseAdapter::RestDatabaseAdapter(const config::RestBackendConfig& config,
                                         std::shared_ptr<http::IHttpClient> http)
    : session_(std::make_shared<RestSession>()) {
    std::string base = config.baseUrl;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    session_->restUrl = base + "/rest/v1/";
    session_->apiKey = config.apiKey;
    session_->http = std::move(http);

    messages_ = std::make_unique<RestMessageRepository>(session_);
    chats_ = std::make_unique<RestChatRepository>(session_);
    contacts_ = std::make_unique<RestContactRepository>(session_);
    auth_ = std::make_unique<RestAuthenticationRepository>(session_);
    spdlog::debug("[RestAdapter] Using PostgREST at {}", session_->restUrl);
}

RestDatabaseAdapter::~RestDatabaseAdapter() {
    close();
}

IMessageRepository& RestDatabaseAdapter::messages() {
    return *messages_;
}

IChatRepository& RestDatabaseAdapter::chats() {
    return *chats_;
}

IContactRepository& RestDatabaseAdapter::contacts() {
    return *contacts_;
}

IAuthenticationRepository& RestDatabaseAdapter::authentication() {
    return *auth_;
}

std::unique_ptr<IUnitOfWork> RestDatabaseAdapter::unitOfWork() {
    return std::make_unique<RestUnitOfWork>();
}

void RestDatabaseAdapter::close() {
    session_->closed.store(true);
}

} // namespace wamcp::repository
