// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#include <spdlog/spdlog.h>
#include <wamcp/bridge/readiness.h>

#include <exception>
#include <thread>

namespace wamcp::bridge {

ReadinessOrchestrator::ReadinessOrchestrator(IBridgeSupervisor& supervisor, IBridgeApi& api,
                                             AuthFallback authFallback, OutputMonitor* monitor,
                                             ReadinessOptions options)
    : supervisor_(supervisor), api_(api), authFallback_(std::move(authFallback)),
      monitor_(monitor), options_(std::move(options)) {}

AuthStatus ReadinessOrchestrator::checkAuthentication() noexcept {
    try {
        auto remote = api_.fetchAuthStatus();
        if (remote) {
            const auto& state = remote.value();
            if (state.authenticated) {
                return {true, "Authenticated via bridge"};
            }
            if (state.hasQrCode) {
                return {false, "QR code available for scanning"};
            }
            return {false, "Not authenticated"};
        }
        spdlog::debug("[Readiness] Connector auth-status unavailable ({}), using storage",
                      remote.error().message);

        if (!authFallback_) {
            return {false, "Unable to check authentication: no fallback configured"};
        }
        return authFallback_();
    } catch (const std::exception& e) {
        spdlog::warn("[Readiness] Authentication check failed: {}", e.what());
        return {false, std::string("Unable to check authentication: ") + e.what()};
    }
}

BridgeStatus ReadinessOrchestrator::getBridgeStatus() noexcept {
    BridgeStatus status;
    try {
        status.isRunning = supervisor_.isRunning();
        status.apiResponsive = api_.checkHealth();
    } catch (const std::exception& e) {
        spdlog::warn("[Readiness] Status check failed: {}", e.what());
    }
    auto auth = checkAuthentication();
    status.isAuthenticated = auth.authenticated;
    status.errorMessage = std::move(auth.reason);
    return status;
}

void ReadinessOrchestrator::drainOutput() {
    if (monitor_ == nullptr) {
        return;
    }
    auto lines = monitor_->lines().drain();
    if (!lines.empty()) {
        spdlog::debug("[Readiness] Drained {} connector output lines", lines.size());
    }
    if (auto qr = monitor_->qrCode().consume()) {
        spdlog::info("[Readiness] Scan this QR code with your WhatsApp app:\n{}", *qr);
    }
}

bool ReadinessOrchestrator::waitForHealth() {
    const auto deadline = std::chrono::steady_clock::now() + options_.healthPollBudget;
    while (true) {
        drainOutput();
        if (api_.checkHealth()) {
            return true;
        }
        if (std::chrono::steady_clock::now() + options_.healthPollInterval > deadline) {
            return false;
        }
        std::this_thread::sleep_for(options_.healthPollInterval);
    }
}

ReadinessResult ReadinessOrchestrator::ensureReadyImpl() {
    drainOutput();

    auto status = getBridgeStatus();
    if (status.isRunning && status.apiResponsive && status.isAuthenticated) {
        return {true, "Bridge is ready", std::nullopt};
    }

    if (!status.isRunning) {
        auto started = supervisor_.start();
        if (!started.success) {
            return {false, "Failed to start bridge: " + started.message, std::nullopt};
        }
        if (!waitForHealth()) {
            spdlog::warn("[Readiness] Connector API did not respond within {} ms",
                         options_.healthPollBudget.count());
            return {false, "Bridge started but API is not responsive", std::nullopt};
        }
    }

    drainOutput();
    auto auth = checkAuthentication();
    if (auth.authenticated) {
        return {true, "Bridge is ready and authenticated", std::nullopt};
    }

    spdlog::info("[Readiness] Connector not authenticated ({}); QR page at {}",
                 auth.reason.value_or("unknown"), options_.qrUrl);
    return {false,
            "Bridge is running but not authenticated. Please scan the QR code via the web "
            "interface.",
            options_.qrUrl};
}

ReadinessResult ReadinessOrchestrator::ensureReady() noexcept {
    try {
        return ensureReadyImpl();
    } catch (const std::exception& e) {
        spdlog::error("[Readiness] ensureReady failed: {}", e.what());
        return {false, std::string("Readiness check failed: ") + e.what(), std::nullopt};
    }
}

AuthWaitResult ReadinessOrchestrator::waitForAuthentication(
    std::chrono::milliseconds timeout) noexcept {
    try {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (checkAuthentication().authenticated) {
                return {true, std::nullopt};
            }

            if (monitor_ != nullptr) {
                (void)monitor_->lines().drain();
                if (auto qr = monitor_->qrCode().consume()) {
                    return {false, std::move(*qr)};
                }
            }

            if (!supervisor_.isRunning()) {
                return {false, "Bridge process stopped unexpectedly"};
            }
            std::this_thread::sleep_for(options_.authPollInterval);
        }

        std::string diagnostic = "Authentication timeout after " +
                                 std::to_string(timeout.count() / 1000) + " seconds";
        if (monitor_ != nullptr) {
            auto recent = monitor_->recentLines();
            if (!recent.empty()) {
                diagnostic += ". Recent bridge output:";
                for (const auto& line : recent) {
                    diagnostic += "\n" + line;
                }
            }
        }
        return {false, std::move(diagnostic)};
    } catch (const std::exception& e) {
        spdlog::error("[Readiness] waitForAuthentication failed: {}", e.what());
        return {false, std::string("Authentication wait failed: ") + e.what()};
    }
}

} // namespace wamcp::bridge
