// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

#include <CLI/CLI.hpp>

#include <wamcp/bridge/bridge_runtime.h>
#include <wamcp/config/runtime_config.h>
#include <wamcp/core/time_utils.h>
#include <wamcp/repository/repository.h>

namespace {

std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitNotReady = 2;

void printMessage(const wamcp::Message& m, wamcp::repository::IMessageRepository& repo) {
    std::string from = m.isFromMe ? std::string("Me") : repo.getSenderName(m.sender);
    std::cout << "[" << wamcp::Timestamp::format(m.timestamp) << "] ";
    if (m.chatName) {
        std::cout << "Chat: " << *m.chatName << " ";
    }
    std::cout << "From: " << from << ": ";
    if (m.mediaType) {
        std::cout << "[" << *m.mediaType << " - Message ID: " << m.id
                  << " - Chat JID: " << m.chatJid << "] ";
    }
    std::cout << m.content << "\n";
}

void printChat(const wamcp::Chat& c) {
    std::cout << "Chat: " << c.name.value_or("Unknown Chat") << " (" << c.jid << ")";
    if (c.isGroup()) {
        std::cout << " [group]";
    }
    std::cout << "\n";
    if (c.lastMessageTime) {
        std::cout << "  Last active: " << wamcp::Timestamp::format(*c.lastMessageTime) << "\n";
    }
    if (c.lastMessage) {
        std::cout << "  Last message: "
                  << (c.lastIsFromMe.value_or(false) ? std::string("Me")
                                                     : c.lastSender.value_or(""))
                  << ": " << *c.lastMessage << "\n";
    }
}

int reportError(const wamcp::Error& err) {
    std::cerr << "Error: " << err.message << " (" << wamcp::errorToString(err.code) << ")\n";
    return kExitError;
}

struct MessagesArgs {
    wamcp::repository::MessageQuery query;
    bool noContext = false;
};

struct ChatsArgs {
    wamcp::repository::ChatQuery query;
    std::string sort = "last_active";
    bool noLastMessage = false;
};

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"wamcp-bridge - WhatsApp connector supervisor and history query tool"};
    app.require_subcommand(1);

    std::string log_level = "info";
    std::string log_file;
    std::string config_path;

    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}))
        ->default_val("info");
    app.add_option("--log-file", log_file, "Log file path (optional)");
    app.add_option("-c,--config", config_path, "Config file (default: ~/.config/wamcp/config.toml)");

    auto* status_cmd = app.add_subcommand("status", "Show connector status");
    auto* ready_cmd = app.add_subcommand("ready", "Start the connector if needed and check auth");

    int wait_timeout = 120;
    auto* wait_cmd = app.add_subcommand("wait-auth", "Wait until the connector is authenticated");
    wait_cmd->add_option("--timeout", wait_timeout, "Seconds to wait")->default_val(120);

    std::string send_to;
    std::string send_message;
    std::string send_file;
    auto* send_cmd = app.add_subcommand("send", "Send a text message or a file");
    send_cmd->add_option("--to", send_to, "Phone number or JID")->required();
    auto* msg_opt = send_cmd->add_option("--message", send_message, "Message text");
    auto* file_opt = send_cmd->add_option("--file", send_file, "Path of the file to send");
    msg_opt->excludes(file_opt);
    send_cmd->require_option(1);

    std::string dl_message_id;
    std::string dl_chat;
    auto* download_cmd = app.add_subcommand("download", "Download media from a message");
    download_cmd->add_option("--message-id", dl_message_id, "Message ID")->required();
    download_cmd->add_option("--chat", dl_chat, "Chat JID")->required();

    MessagesArgs msgs;
    auto* messages_cmd = app.add_subcommand("messages", "List messages");
    messages_cmd->add_option("--after", msgs.query.after, "Only messages after (ISO 8601)");
    messages_cmd->add_option("--before", msgs.query.before, "Only messages before (ISO 8601)");
    messages_cmd->add_option("--sender", msgs.query.sender, "Sender phone number or JID");
    messages_cmd->add_option("--chat", msgs.query.chatJid, "Chat JID");
    messages_cmd->add_option("-q,--query", msgs.query.text, "Text to search for");
    messages_cmd->add_option("--limit", msgs.query.limit, "Page size")->default_val(20);
    messages_cmd->add_option("--page", msgs.query.page, "Page number")->default_val(0);
    messages_cmd->add_flag("--no-context", msgs.noContext, "Only matching messages");
    messages_cmd->add_option("--context-before", msgs.query.contextBefore)->default_val(1);
    messages_cmd->add_option("--context-after", msgs.query.contextAfter)->default_val(1);

    std::string ctx_id;
    int ctx_before = 5;
    int ctx_after = 5;
    auto* context_cmd = app.add_subcommand("context", "Show messages around a message");
    context_cmd->add_option("--id", ctx_id, "Message ID")->required();
    context_cmd->add_option("--before", ctx_before)->default_val(5);
    context_cmd->add_option("--after", ctx_after)->default_val(5);

    ChatsArgs chats;
    auto* chats_cmd = app.add_subcommand("chats", "List chats");
    chats_cmd->add_option("-q,--query", chats.query.text, "Name or JID filter");
    chats_cmd->add_option("--limit", chats.query.limit)->default_val(20);
    chats_cmd->add_option("--page", chats.query.page)->default_val(0);
    chats_cmd->add_option("--sort", chats.sort)
        ->check(CLI::IsMember({"last_active", "name"}))
        ->default_val("last_active");
    chats_cmd->add_flag("--no-last-message", chats.noLastMessage);

    std::string chat_jid;
    std::string chat_phone;
    auto* chat_cmd = app.add_subcommand("chat", "Show one chat");
    auto* jid_opt = chat_cmd->add_option("--jid", chat_jid, "Chat JID");
    auto* phone_opt = chat_cmd->add_option("--phone", chat_phone, "Direct chat by phone number");
    jid_opt->excludes(phone_opt);
    chat_cmd->require_option(1);

    std::string contact_query;
    auto* contacts_cmd = app.add_subcommand("contacts", "Search contacts");
    contacts_cmd->add_option("-q,--query", contact_query, "Name or number")->required();

    std::string contact_jid;
    int contact_limit = 20;
    int contact_page = 0;
    auto* contact_chats_cmd = app.add_subcommand("contact-chats", "Chats involving a contact");
    contact_chats_cmd->add_option("--jid", contact_jid, "Contact JID")->required();
    contact_chats_cmd->add_option("--limit", contact_limit)->default_val(20);
    contact_chats_cmd->add_option("--page", contact_page)->default_val(0);

    std::string last_jid;
    auto* last_cmd = app.add_subcommand("last-interaction", "Most recent message with a contact");
    last_cmd->add_option("--jid", last_jid, "Contact JID")->required();

    CLI11_PARSE(app, argc, argv);

    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (!log_file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, 10 * 1024 * 1024, 3));
        }
        auto logger = std::make_shared<spdlog::logger>("wamcp", sinks.begin(), sinks.end());
        spdlog::set_default_logger(logger);
        spdlog::set_level(spdlog::level::from_str(log_level));
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Failed to setup logging: " << e.what() << std::endl;
        return kExitError;
    }

    auto config = wamcp::config::loadRuntimeConfig(config_path);
    if (!config) {
        return reportError(config.error());
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    wamcp::bridge::BridgeRuntime runtime(std::move(config).value());

    auto withDatabase = [&](auto&& fn) -> int {
        auto db = runtime.database();
        if (!db) {
            return reportError(db.error());
        }
        return fn(*db.value());
    };

    auto requireReady = [&]() -> bool {
        auto ready = runtime.ensureReady();
        if (!ready.ready) {
            std::cerr << ready.message << "\n";
            if (ready.qrUrl) {
                std::cerr << "QR code: " << *ready.qrUrl << "\n";
            }
        }
        return ready.ready;
    };

    auto run = [&]() -> int {
        if (status_cmd->parsed()) {
            auto st = runtime.getBridgeStatus();
            std::cout << "Running:       " << (st.isRunning ? "yes" : "no") << "\n"
                      << "API responsive: " << (st.apiResponsive ? "yes" : "no") << "\n"
                      << "Authenticated: " << (st.isAuthenticated ? "yes" : "no") << "\n";
            if (st.errorMessage) {
                std::cout << "Detail:        " << *st.errorMessage << "\n";
            }
            return kExitOk;
        }

        if (ready_cmd->parsed()) {
            auto ready = runtime.ensureReady();
            std::cout << ready.message << "\n";
            if (ready.qrUrl) {
                std::cout << "QR code: " << *ready.qrUrl << "\n";
            }
            return ready.ready ? kExitOk : kExitNotReady;
        }

        if (wait_cmd->parsed()) {
            auto started = runtime.ensureReady();
            if (started.ready) {
                std::cout << started.message << "\n";
                return kExitOk;
            }
            auto result = runtime.waitForAuthentication(std::chrono::seconds{wait_timeout});
            if (result.authenticated) {
                std::cout << "Authenticated\n";
                return kExitOk;
            }
            std::cout << result.detail.value_or("Not authenticated") << "\n";
            return kExitNotReady;
        }

        if (send_cmd->parsed()) {
            if (!requireReady()) {
                return kExitNotReady;
            }
            auto outcome = send_file.empty() ? runtime.api().sendMessage(send_to, send_message)
                                             : runtime.api().sendFile(send_to, send_file);
            std::cout << outcome.message << "\n";
            return outcome.success ? kExitOk : kExitError;
        }

        if (download_cmd->parsed()) {
            if (!requireReady()) {
                return kExitNotReady;
            }
            auto path = runtime.api().downloadMedia(dl_message_id, dl_chat);
            if (!path) {
                std::cerr << "Failed to download media\n";
                return kExitError;
            }
            std::cout << *path << "\n";
            return kExitOk;
        }

        if (messages_cmd->parsed()) {
            return withDatabase([&](wamcp::repository::IDatabaseAdapter& db) {
                msgs.query.includeContext = !msgs.noContext;
                auto res = db.messages().listMessages(msgs.query);
                if (!res) {
                    return reportError(res.error());
                }
                if (res.value().empty()) {
                    std::cout << "No messages to display.\n";
                }
                for (const auto& m : res.value()) {
                    printMessage(m, db.messages());
                }
                return kExitOk;
            });
        }

        if (context_cmd->parsed()) {
            return withDatabase([&](wamcp::repository::IDatabaseAdapter& db) {
                auto res = db.messages().getMessageContext(ctx_id, ctx_before, ctx_after);
                if (!res) {
                    return reportError(res.error());
                }
                const auto& ctx = res.value();
                for (const auto& m : ctx.before) {
                    printMessage(m, db.messages());
                }
                std::cout << ">> ";
                printMessage(ctx.message, db.messages());
                for (const auto& m : ctx.after) {
                    printMessage(m, db.messages());
                }
                return kExitOk;
            });
        }

        if (chats_cmd->parsed()) {
            return withDatabase([&](wamcp::repository::IDatabaseAdapter& db) {
                auto sort = wamcp::repository::parseChatSort(chats.sort);
                if (!sort) {
                    return reportError(sort.error());
                }
                chats.query.sortBy = sort.value();
                chats.query.includeLastMessage = !chats.noLastMessage;
                auto res = db.chats().listChats(chats.query);
                if (!res) {
                    return reportError(res.error());
                }
                for (const auto& c : res.value()) {
                    printChat(c);
                }
                return kExitOk;
            });
        }

        if (chat_cmd->parsed()) {
            return withDatabase([&](wamcp::repository::IDatabaseAdapter& db) {
                auto res = chat_jid.empty() ? db.chats().getDirectChatByContact(chat_phone)
                                            : db.chats().getChat(chat_jid);
                if (!res) {
                    return reportError(res.error());
                }
                if (!res.value()) {
                    std::cout << "Chat not found\n";
                    return kExitError;
                }
                printChat(*res.value());
                return kExitOk;
            });
        }

        if (contacts_cmd->parsed()) {
            return withDatabase([&](wamcp::repository::IDatabaseAdapter& db) {
                auto res = db.contacts().searchContacts(contact_query);
                if (!res) {
                    return reportError(res.error());
                }
                for (const auto& c : res.value()) {
                    std::cout << c.name.value_or(c.phoneNumber) << " (" << c.jid << ")\n";
                }
                return kExitOk;
            });
        }

        if (contact_chats_cmd->parsed()) {
            return withDatabase([&](wamcp::repository::IDatabaseAdapter& db) {
                auto res = db.contacts().getContactChats(contact_jid, contact_limit, contact_page);
                if (!res) {
                    return reportError(res.error());
                }
                for (const auto& c : res.value()) {
                    printChat(c);
                }
                return kExitOk;
            });
        }

        if (last_cmd->parsed()) {
            return withDatabase([&](wamcp::repository::IDatabaseAdapter& db) {
                auto res = db.contacts().getLastInteraction(last_jid);
                if (!res) {
                    return reportError(res.error());
                }
                if (!res.value()) {
                    std::cout << "No interactions found\n";
                    return kExitOk;
                }
                printMessage(*res.value(), db.messages());
                return kExitOk;
            });
        }

        return kExitError;
    };

    std::atomic<bool> finished{false};
    int exitCode = kExitOk;
    std::thread worker([&] {
        try {
            exitCode = run();
        } catch (const std::exception& e) {
            spdlog::error("Fatal error: {}", e.what());
            exitCode = kExitError;
        }
        finished = true;
    });

    while (!finished) {
        if (!g_running) {
            // Storage stays open until the worker returns
            spdlog::info("Received shutdown signal, stopping connector...");
            runtime.process().stop();
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    worker.join();

    // Leaving main also stops the connector through ~BridgeRuntime
    return exitCode;
}
