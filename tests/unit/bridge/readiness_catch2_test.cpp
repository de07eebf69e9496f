// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <wamcp/bridge/readiness.h>

#include <stdexcept>

using namespace std::chrono_literals;
using namespace wamcp;
using namespace wamcp::bridge;

namespace {

class FakeSupervisor final : public IBridgeSupervisor {
public:
    bool running = false;
    StartOutcome outcome{true, "Bridge started successfully (pid 4242)"};
    int starts = 0;
    int stops = 0;

    StartOutcome start() override {
        ++starts;
        if (outcome.success) {
            running = true;
        }
        return outcome;
    }

    void stop() noexcept override {
        ++stops;
        running = false;
    }

    bool isRunning() override { return running; }
};

class FakeBridgeApi final : public IBridgeApi {
public:
    bool healthy = true;
    /// Unset means the auth-status endpoint is unreachable.
    std::optional<BridgeAuthState> auth = BridgeAuthState{true, false};
    /// Report authenticated only from this many auth-status calls on.
    int authenticatedAfter = 0;
    int healthChecks = 0;
    int authChecks = 0;

    bool checkHealth() override {
        ++healthChecks;
        return healthy;
    }

    Result<BridgeAuthState> fetchAuthStatus() override {
        ++authChecks;
        if (!auth) {
            return Error{ErrorCode::NetworkError, "connection refused"};
        }
        BridgeAuthState state = *auth;
        if (authChecks <= authenticatedAfter) {
            state.authenticated = false;
        }
        return state;
    }
};

struct ReadinessFixture {
    FakeSupervisor supervisor;
    FakeBridgeApi api;
    OutputMonitor monitor;
    int fallbackCalls = 0;
    AuthStatus fallbackStatus{false, "No device registered"};
    ReadinessOptions options;

    ReadinessFixture() {
        options.healthPollBudget = 200ms;
        options.healthPollInterval = 10ms;
        options.authPollInterval = 10ms;
        options.qrUrl = "http://localhost:8080/qr";
    }

    ReadinessOrchestrator orchestrator() {
        return ReadinessOrchestrator(
            supervisor, api,
            [this]() {
                ++fallbackCalls;
                return fallbackStatus;
            },
            &monitor, options);
    }
};

} // namespace

TEST_CASE("Readiness: ready connector is left alone", "[unit][bridge][readiness]") {
    ReadinessFixture fix;
    fix.supervisor.running = true;
    auto orch = fix.orchestrator();

    const ReadinessResult expected{true, "Bridge is ready", std::nullopt};
    CHECK(orch.ensureReady() == expected);
    CHECK(orch.ensureReady() == expected);
    CHECK(fix.supervisor.starts == 0);
    CHECK(fix.fallbackCalls == 0);
}

TEST_CASE("Readiness: starts a stopped connector once", "[unit][bridge][readiness]") {
    ReadinessFixture fix;
    auto orch = fix.orchestrator();

    auto first = orch.ensureReady();
    CHECK(first.ready);
    CHECK(first.message == "Bridge is ready and authenticated");
    CHECK_FALSE(first.qrUrl.has_value());
    CHECK(fix.supervisor.starts == 1);

    auto second = orch.ensureReady();
    CHECK(second.ready);
    CHECK(second.message == "Bridge is ready");
    CHECK(fix.supervisor.starts == 1);
}

TEST_CASE("Readiness: start failure is reported", "[unit][bridge][readiness]") {
    ReadinessFixture fix;
    fix.supervisor.outcome = {false, "Bridge executable not found at /opt/wa/whatsapp-bridge"};
    auto orch = fix.orchestrator();

    auto r = orch.ensureReady();
    CHECK_FALSE(r.ready);
    CHECK(r.message ==
          "Failed to start bridge: Bridge executable not found at /opt/wa/whatsapp-bridge");
    CHECK_FALSE(r.qrUrl.has_value());
    // Only the status check ran; no health polling after a failed start
    CHECK(fix.api.healthChecks == 1);
}

TEST_CASE("Readiness: unresponsive API after start", "[unit][bridge][readiness]") {
    ReadinessFixture fix;
    fix.api.healthy = false;
    auto orch = fix.orchestrator();

    const auto begin = std::chrono::steady_clock::now();
    auto r = orch.ensureReady();
    const auto elapsed = std::chrono::steady_clock::now() - begin;

    CHECK_FALSE(r.ready);
    CHECK(r.message == "Bridge started but API is not responsive");
    CHECK(fix.supervisor.starts == 1);
    CHECK(fix.api.healthChecks > 2);
    CHECK(elapsed < 2s);
}

TEST_CASE("Readiness: running but not authenticated", "[unit][bridge][readiness]") {
    ReadinessFixture fix;
    fix.supervisor.running = true;
    fix.api.auth = BridgeAuthState{false, true};
    auto orch = fix.orchestrator();

    auto r = orch.ensureReady();
    CHECK_FALSE(r.ready);
    CHECK(r.message == "Bridge is running but not authenticated. Please scan the QR code via the "
                       "web interface.");
    CHECK(r.qrUrl == std::optional<std::string>("http://localhost:8080/qr"));
    CHECK(fix.supervisor.starts == 0);
}

TEST_CASE("Readiness: running process with a dead API is not restarted",
          "[unit][bridge][readiness]") {
    ReadinessFixture fix;
    fix.supervisor.running = true;
    fix.api.healthy = false;
    fix.api.auth.reset();
    auto orch = fix.orchestrator();

    auto r = orch.ensureReady();
    CHECK_FALSE(r.ready);
    CHECK(r.qrUrl.has_value());
    CHECK(fix.supervisor.starts == 0);
}

TEST_CASE("Readiness: authentication sources", "[unit][bridge][readiness]") {
    ReadinessFixture fix;
    auto orch = fix.orchestrator();

    SECTION("connector answer wins") {
        auto s = orch.checkAuthentication();
        CHECK(s.authenticated);
        CHECK(fix.fallbackCalls == 0);

        fix.api.auth = BridgeAuthState{false, true};
        CHECK(orch.checkAuthentication().reason ==
              std::optional<std::string>("QR code available for scanning"));
        fix.api.auth = BridgeAuthState{false, false};
        CHECK(orch.checkAuthentication().reason ==
              std::optional<std::string>("Not authenticated"));
        CHECK(fix.fallbackCalls == 0);
    }

    SECTION("storage fallback when the connector cannot answer") {
        fix.api.auth.reset();
        auto s = orch.checkAuthentication();
        CHECK_FALSE(s.authenticated);
        CHECK(s.reason == std::optional<std::string>("No device registered"));
        CHECK(fix.fallbackCalls == 1);

        fix.fallbackStatus = {true, std::nullopt};
        CHECK(orch.checkAuthentication().authenticated);
    }

    SECTION("a throwing fallback becomes a reason") {
        fix.api.auth.reset();
        ReadinessOrchestrator throwing(
            fix.supervisor, fix.api, []() -> AuthStatus { throw std::runtime_error("disk gone"); },
            &fix.monitor, fix.options);
        auto s = throwing.checkAuthentication();
        CHECK_FALSE(s.authenticated);
        CHECK(s.reason == std::optional<std::string>("Unable to check authentication: disk gone"));
    }
}

TEST_CASE("Readiness: status is recomputed each call", "[unit][bridge][readiness]") {
    ReadinessFixture fix;
    auto orch = fix.orchestrator();

    auto down = orch.getBridgeStatus();
    CHECK_FALSE(down.isRunning);
    CHECK(down.apiResponsive);
    CHECK(down.isAuthenticated);

    fix.supervisor.running = true;
    fix.api.healthy = false;
    fix.api.auth.reset();
    auto up = orch.getBridgeStatus();
    CHECK(up.isRunning);
    CHECK_FALSE(up.apiResponsive);
    CHECK_FALSE(up.isAuthenticated);
    CHECK(up.errorMessage == std::optional<std::string>("No device registered"));
}

TEST_CASE("Readiness: waiting for authentication", "[unit][bridge][readiness]") {
    ReadinessFixture fix;
    fix.supervisor.running = true;
    auto orch = fix.orchestrator();

    SECTION("succeeds once the connector reports a session") {
        fix.api.authenticatedAfter = 3;
        auto r = orch.waitForAuthentication(5s);
        CHECK(r.authenticated);
        CHECK_FALSE(r.detail.has_value());
        CHECK(fix.api.authChecks == 4);
    }

    SECTION("returns the QR block the first time it appears") {
        fix.api.auth = BridgeAuthState{false, true};
        fix.monitor.processLine("Scan this QR code with your WhatsApp app:");
        fix.monitor.processLine("█▀▀▀█ ▄▄ █▀▀▀█");
        fix.monitor.processLine("");

        auto r = orch.waitForAuthentication(5s);
        CHECK_FALSE(r.authenticated);
        CHECK(r.detail == std::optional<std::string>("█▀▀▀█ ▄▄ █▀▀▀█"));
    }

    SECTION("connector death ends the wait") {
        fix.api.auth = BridgeAuthState{false, false};
        fix.supervisor.running = false;
        auto r = orch.waitForAuthentication(5s);
        CHECK_FALSE(r.authenticated);
        CHECK(r.detail == std::optional<std::string>("Bridge process stopped unexpectedly"));
    }

    SECTION("timeout carries recent output") {
        fix.api.auth = BridgeAuthState{false, false};
        fix.monitor.processLine("Connecting to WhatsApp...");
        fix.monitor.processLine("Waiting for pairing");

        auto r = orch.waitForAuthentication(1000ms);
        CHECK_FALSE(r.authenticated);
        CHECK(r.detail == std::optional<std::string>(
                              "Authentication timeout after 1 seconds. Recent bridge output:\n"
                              "Connecting to WhatsApp...\nWaiting for pairing"));
    }
}
