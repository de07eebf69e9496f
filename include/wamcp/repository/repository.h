// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <wamcp/core/types.h>
#include <wamcp/domain/models.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wamcp::repository {

inline constexpr int kContactSearchLimit = 50;

/**
 * @brief Filters for listMessages. All set filters are AND-combined.
 *
 * `after` / `before` are ISO 8601 strings and are exclusive bounds.
 */
struct MessageQuery {
    std::optional<std::string> after;
    std::optional<std::string> before;
    std::optional<std::string> sender;
    std::optional<std::string> chatJid;
    std::optional<std::string> text;
    int limit = 20;
    int page = 0;
    bool includeContext = true;
    int contextBefore = 1;
    int contextAfter = 1;
};

enum class ChatSort { LastActive, Name };

struct ChatQuery {
    std::optional<std::string> text;
    int limit = 20;
    int page = 0;
    bool includeLastMessage = true;
    ChatSort sortBy = ChatSort::LastActive;
};

/// "last_active" / "name"; anything else is InvalidArgument.
Result<ChatSort> parseChatSort(std::string_view value);

/**
 * @brief Row offset of a page.
 *
 * Fails with InvalidArgument for a negative limit or page. Computed in 64 bits, so any
 * non-negative pair is representable; a page past the end simply yields no rows.
 */
Result<int64_t> pageOffset(int limit, int page);

class IMessageRepository {
public:
    virtual ~IMessageRepository() = default;

    /**
     * @brief Messages matching the query, newest first.
     *
     * With includeContext the result is the concatenation, per match and in match order,
     * of (before-window, match, after-window). Windows may overlap; nothing is deduplicated.
     * Malformed date bounds fail with InvalidArgument.
     */
    virtual Result<std::vector<Message>> listMessages(const MessageQuery& query) = 0;

    /**
     * @brief Same-chat neighbours of a message. NotFound when the id is unknown.
     */
    virtual Result<MessageContext> getMessageContext(const std::string& messageId, int before = 5,
                                                     int after = 5) = 0;

    /// Display name for a sender JID; falls back to the JID itself.
    virtual std::string getSenderName(const std::string& senderJid) = 0;

    /// Insert or replace a message row.
    virtual Result<void> storeMessage(const Message& message) = 0;
};

class IChatRepository {
public:
    virtual ~IChatRepository() = default;

    virtual Result<std::vector<Chat>> listChats(const ChatQuery& query) = 0;
    virtual Result<std::optional<Chat>> getChat(const std::string& jid,
                                                bool includeLastMessage = true) = 0;

    /// First non-group chat whose JID contains the given phone number.
    virtual Result<std::optional<Chat>> getDirectChatByContact(const std::string& phone) = 0;

    /// Insert a chat or update its name and last activity.
    virtual Result<void> upsertChat(const Chat& chat) = 0;
};

class IContactRepository {
public:
    virtual ~IContactRepository() = default;

    /// Non-group identities matching name or JID, ordered by name then JID, at most 50.
    virtual Result<std::vector<Contact>> searchContacts(const std::string& query) = 0;

    /// Chats the contact wrote in, plus the contact's own direct chat, most recent first.
    virtual Result<std::vector<Chat>> getContactChats(const std::string& jid, int limit = 20,
                                                      int page = 0) = 0;

    virtual Result<std::optional<Message>> getLastInteraction(const std::string& jid) = 0;
};

class IAuthenticationRepository {
public:
    virtual ~IAuthenticationRepository() = default;

    /// Authenticated iff the device table has at least one row. Never fails.
    virtual AuthStatus checkAuthenticationStatus() noexcept = 0;
};

/**
 * @brief Transaction boundary over one adapter.
 *
 * Non-transactional backends implement begin/commit as no-ops and log on rollback;
 * isTransactional() reports which guarantee the caller actually has.
 */
class IUnitOfWork {
public:
    virtual ~IUnitOfWork() = default;

    virtual Result<void> begin() = 0;
    virtual Result<void> commit() = 0;
    virtual Result<void> rollback() = 0;

    /// Drop uncommitted work without reporting it as a rollback.
    virtual void discard() noexcept = 0;

    [[nodiscard]] virtual bool isTransactional() const noexcept = 0;
};

/**
 * @brief Composite handle for one storage backend.
 */
class IDatabaseAdapter {
public:
    virtual ~IDatabaseAdapter() = default;

    virtual IMessageRepository& messages() = 0;
    virtual IChatRepository& chats() = 0;
    virtual IContactRepository& contacts() = 0;
    virtual IAuthenticationRepository& authentication() = 0;

    virtual std::unique_ptr<IUnitOfWork> unitOfWork() = 0;

    virtual void close() = 0;

    [[nodiscard]] virtual std::string_view backendName() const noexcept = 0;
};

/**
 * @brief Scoped unit of work.
 *
 * Opening begins a transaction. If the scope unwinds because of an exception the work is
 * rolled back; if it exits normally without commit() the work is discarded silently.
 * Commit is never implicit.
 *
 * @code
 * auto scope = TransactionScope::open(adapter);
 * if (!scope) return scope.error();
 * adapter.messages().storeMessage(msg);
 * return scope.value().commit();
 * @endcode
 */
class TransactionScope {
public:
    static Result<TransactionScope> open(IDatabaseAdapter& adapter);

    ~TransactionScope();

    TransactionScope(TransactionScope&& other) noexcept;
    TransactionScope& operator=(TransactionScope&&) = delete;
    TransactionScope(const TransactionScope&) = delete;
    TransactionScope& operator=(const TransactionScope&) = delete;

    Result<void> commit();

    [[nodiscard]] bool committed() const noexcept { return committed_; }
    [[nodiscard]] bool isTransactional() const noexcept;

private:
    explicit TransactionScope(std::unique_ptr<IUnitOfWork> uow);

    std::unique_ptr<IUnitOfWork> uow_;
    int uncaughtAtOpen_;
    bool committed_ = false;
};

} // namespace wamcp::repository
