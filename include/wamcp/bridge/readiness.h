// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <wamcp/bridge/bridge_api_client.h>
#include <wamcp/bridge/bridge_process.h>
#include <wamcp/bridge/output_monitor.h>
#include <wamcp/domain/models.h>

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace wamcp::bridge {

struct ReadinessOptions {
    std::chrono::milliseconds healthPollBudget{30000};
    std::chrono::milliseconds healthPollInterval{1000};
    std::chrono::milliseconds authPollInterval{500};
    std::string qrUrl = "http://localhost:8080/qr";
};

/// Outcome of waitForAuthentication(). `detail` is the QR block or a diagnostic.
struct AuthWaitResult {
    bool authenticated = false;
    std::optional<std::string> detail;
};

/**
 * @brief Brings the connector to the ready state: running, API reachable, authenticated.
 *
 * Every call re-evaluates live state; nothing is cached between calls, so callers may retry
 * freely. None of the public operations fail: each resolves to flags plus a message.
 *
 * Authentication is asked of the connector first. Any transport failure, non-200 reply or
 * malformed body falls back to `authFallback`, normally the storage backend's
 * checkAuthenticationStatus().
 */
class ReadinessOrchestrator {
public:
    using AuthFallback = std::function<AuthStatus()>;

    ReadinessOrchestrator(IBridgeSupervisor& supervisor, IBridgeApi& api,
                          AuthFallback authFallback, OutputMonitor* monitor = nullptr,
                          ReadinessOptions options = {});

    AuthStatus checkAuthentication() noexcept;

    BridgeStatus getBridgeStatus() noexcept;

    ReadinessResult ensureReady() noexcept;

    /**
     * @brief Poll authentication until it succeeds, a QR block appears or time runs out.
     *
     * Returns (true, none) once authenticated and (false, qr) the first time a fresh QR
     * block is available. A dead connector or an expired timeout return false with a
     * diagnostic; the timeout diagnostic carries the connector's last output lines.
     */
    AuthWaitResult waitForAuthentication(std::chrono::milliseconds timeout) noexcept;

    [[nodiscard]] const ReadinessOptions& options() const { return options_; }

private:
    ReadinessResult ensureReadyImpl();
    bool waitForHealth();
    void drainOutput();

    IBridgeSupervisor& supervisor_;
    IBridgeApi& api_;
    AuthFallback authFallback_;
    OutputMonitor* monitor_;
    ReadinessOptions options_;
};

} // namespace wamcp::bridge
