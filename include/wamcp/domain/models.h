// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <wamcp/core/types.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wamcp {

inline constexpr std::string_view kGroupJidSuffix = "@g.us";

/// True when the identifier names a group conversation.
bool isGroupJid(std::string_view jid);

/// User part of a JID ("15551234567@s.whatsapp.net" -> "15551234567").
std::string phoneFromJid(std::string_view jid);

/**
 * @brief A message row as synced by the connector.
 *
 * `timestampText` keeps the stored representation so range queries can compare against
 * the exact value the backend holds.
 */
struct Message {
    std::string id;
    TimePoint timestamp{};
    std::string timestampText;
    std::string sender;
    std::string content;
    bool isFromMe = false;
    std::string chatJid;
    std::optional<std::string> chatName;
    std::optional<std::string> mediaType;
};

struct Chat {
    std::string jid;
    std::optional<std::string> name;
    std::optional<TimePoint> lastMessageTime;
    std::optional<std::string> lastMessage;
    std::optional<std::string> lastSender;
    std::optional<bool> lastIsFromMe;

    [[nodiscard]] bool isGroup() const { return isGroupJid(jid); }
};

struct Contact {
    std::string phoneNumber;
    std::optional<std::string> name;
    std::string jid;
};

/// Target message with its same-chat neighbours, both lists in ascending time order.
struct MessageContext {
    Message message;
    std::vector<Message> before;
    std::vector<Message> after;
};

/// (authenticated, reason). Reason is set when not authenticated or when the source
/// wants to report how the verdict was reached.
struct AuthStatus {
    bool authenticated = false;
    std::optional<std::string> reason;
};

/// Recomputed on every check; never cached.
struct BridgeStatus {
    bool isRunning = false;
    bool apiResponsive = false;
    bool isAuthenticated = false;
    std::optional<std::string> errorMessage;
};

struct ReadinessResult {
    bool ready = false;
    std::string message;
    std::optional<std::string> qrUrl;

    bool operator==(const ReadinessResult&) const = default;
};

} // namespace wamcp
