// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <wamcp/bridge/bridge_api_client.h>

#include <filesystem>

namespace wamcp::bridge {

using json = nlohmann::json;

namespace {

// Health check budget: 2 s total, never retried
http::HttpOptions healthCheckOptions() {
    http::HttpOptions opts;
    opts.connectTimeout = std::chrono::milliseconds{1000};
    opts.readTimeout = std::chrono::milliseconds{1000};
    opts.maxRetries = 0;
    return opts;
}

std::string transportMessage(const Error& err) {
    if (err.code == ErrorCode::Timeout) {
        return "Request timed out. The bridge may be unresponsive.";
    }
    return "Request error: " + err.message;
}

} // namespace

BridgeApiClient::BridgeApiClient(std::shared_ptr<http::IHttpClient> http,
                                 BridgeEndpoints endpoints)
    : http_(std::move(http)), endpoints_(std::move(endpoints)) {}

bool BridgeApiClient::checkHealth() {
    auto res = http_->get(endpoints_.healthUrl, {}, healthCheckOptions());
    if (!res) {
        spdlog::debug("[BridgeApi] Health check failed: {}", res.error().message);
        return false;
    }
    return res.value().status == 200;
}

Result<BridgeAuthState> BridgeApiClient::fetchAuthStatus() {
    auto res = http_->get(endpoints_.authStatusUrl());
    if (!res) {
        return res.error();
    }
    const auto& resp = res.value();
    if (resp.status != 200) {
        return Error{ErrorCode::NetworkError,
                     "auth-status returned HTTP " + std::to_string(resp.status)};
    }

    try {
        auto body = json::parse(resp.body);
        BridgeAuthState state;
        state.authenticated = body.value("authenticated", false);
        state.hasQrCode = body.value("has_qr_code", false);
        return state;
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("Malformed auth-status body: ") + e.what()};
    }
}

SendOutcome BridgeApiClient::postSend(const std::string& body) {
    auto res = http_->postJson(endpoints_.sendUrl(), body);
    if (!res) {
        return {false, transportMessage(res.error())};
    }
    const auto& resp = res.value();
    if (resp.status != 200) {
        return {false, "Error: HTTP " + std::to_string(resp.status) + " - " + resp.body};
    }
    try {
        auto result = json::parse(resp.body);
        return {result.value("success", false), result.value("message", "Unknown response")};
    } catch (const json::exception&) {
        return {false, "Error parsing response: " + resp.body};
    }
}

SendOutcome BridgeApiClient::sendMessage(const std::string& recipient,
                                         const std::string& message) {
    if (recipient.empty()) {
        return {false, "Recipient must be provided"};
    }
    json payload = {{"recipient", recipient}, {"message", message}};
    return postSend(payload.dump());
}

SendOutcome BridgeApiClient::sendFile(const std::string& recipient, const std::string& mediaPath) {
    if (recipient.empty()) {
        return {false, "Recipient must be provided"};
    }
    if (mediaPath.empty()) {
        return {false, "Media path must be provided"};
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(mediaPath, ec)) {
        return {false, "Media file not found: " + mediaPath};
    }
    json payload = {{"recipient", recipient}, {"media_path", mediaPath}};
    return postSend(payload.dump());
}

std::optional<std::string> BridgeApiClient::downloadMedia(const std::string& messageId,
                                                          const std::string& chatJid) {
    json payload = {{"message_id", messageId}, {"chat_jid", chatJid}};
    auto res = http_->postJson(endpoints_.downloadUrl(), payload.dump());
    if (!res) {
        spdlog::warn("[BridgeApi] {}", transportMessage(res.error()));
        return std::nullopt;
    }
    const auto& resp = res.value();
    if (resp.status != 200) {
        spdlog::warn("[BridgeApi] Error: HTTP {} - {}", resp.status, resp.body);
        return std::nullopt;
    }

    try {
        auto result = json::parse(resp.body);
        if (!result.value("success", false)) {
            spdlog::warn("[BridgeApi] Download failed: {}",
                         result.value("message", "Unknown error"));
            return std::nullopt;
        }
        auto path = result.value("path", "");
        if (path.empty()) {
            spdlog::warn("[BridgeApi] Download reported success without a path");
            return std::nullopt;
        }
        spdlog::info("[BridgeApi] Media downloaded successfully: {}", path);
        return path;
    } catch (const json::exception&) {
        spdlog::warn("[BridgeApi] Error parsing response: {}", resp.body);
        return std::nullopt;
    }
}

} // namespace wamcp::bridge
