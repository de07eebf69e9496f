// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <wamcp/core/types.h>
#include <wamcp/http/http_client.h>

#include <memory>
#include <optional>
#include <string>

namespace wamcp::bridge {

/// Connector HTTP endpoints. Paths under the API base are fixed.
struct BridgeEndpoints {
    std::string apiBaseUrl = "http://localhost:8080/api";
    std::string healthUrl = "http://localhost:8080/health";
    std::string qrUrl = "http://localhost:8080/qr";

    [[nodiscard]] std::string authStatusUrl() const { return apiBaseUrl + "/auth-status"; }
    [[nodiscard]] std::string sendUrl() const { return apiBaseUrl + "/send"; }
    [[nodiscard]] std::string downloadUrl() const { return apiBaseUrl + "/download"; }
};

/// Body of the auth-status endpoint.
struct BridgeAuthState {
    bool authenticated = false;
    bool hasQrCode = false;
};

struct SendOutcome {
    bool success = false;
    std::string message;
};

/**
 * @brief The two connector checks readiness depends on.
 */
class IBridgeApi {
public:
    virtual ~IBridgeApi() = default;

    /// True only for an HTTP 200 from the health endpoint within the check budget.
    virtual bool checkHealth() = 0;

    /// Error for transport failures, non-200 replies and malformed bodies.
    virtual Result<BridgeAuthState> fetchAuthStatus() = 0;
};

/**
 * @brief Client for the connector's local REST API.
 *
 * Send and download calls never fail with an Error: every outcome is folded into the returned
 * value with a human readable message, matching what the operator sees from the connector.
 */
class BridgeApiClient final : public IBridgeApi {
public:
    explicit BridgeApiClient(std::shared_ptr<http::IHttpClient> http,
                             BridgeEndpoints endpoints = {});

    bool checkHealth() override;
    Result<BridgeAuthState> fetchAuthStatus() override;

    SendOutcome sendMessage(const std::string& recipient, const std::string& message);
    SendOutcome sendFile(const std::string& recipient, const std::string& mediaPath);

    /// Local path of the downloaded file, or nullopt (reason is logged).
    std::optional<std::string> downloadMedia(const std::string& messageId,
                                             const std::string& chatJid);

    [[nodiscard]] const BridgeEndpoints& endpoints() const { return endpoints_; }

private:
    SendOutcome postSend(const std::string& body);

    std::shared_ptr<http::IHttpClient> http_;
    BridgeEndpoints endpoints_;
};

} // namespace wamcp::bridge
