// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <wamcp/bridge/bridge_api_client.h>
#include <wamcp/bridge/bridge_process.h>
#include <wamcp/bridge/output_monitor.h>
#include <wamcp/bridge/readiness.h>
#include <wamcp/config/runtime_config.h>
#include <wamcp/repository/repository.h>

#include <memory>
#include <mutex>

namespace wamcp::bridge {

/**
 * @brief Process-wide context: one connector, one HTTP client, one storage adapter.
 *
 * Constructing a runtime is the decision that this process manages the connector. The
 * storage adapter is created on first use and kept until shutdown(); the connector is
 * stopped by shutdown() or the destructor.
 */
class BridgeRuntime {
public:
    explicit BridgeRuntime(config::RuntimeConfig config,
                           std::shared_ptr<http::IHttpClient> http = nullptr);
    ~BridgeRuntime();

    BridgeRuntime(const BridgeRuntime&) = delete;
    BridgeRuntime& operator=(const BridgeRuntime&) = delete;

    /// Lazily opened storage adapter. The pointer stays valid until shutdown().
    Result<repository::IDatabaseAdapter*> database();

    ReadinessResult ensureReady() noexcept;
    BridgeStatus getBridgeStatus() noexcept;
    AuthWaitResult waitForAuthentication(std::chrono::milliseconds timeout) noexcept;

    BridgeApiClient& api() { return *api_; }
    BridgeProcess& process() { return *process_; }
    OutputMonitor& monitor() { return *monitor_; }
    [[nodiscard]] const config::RuntimeConfig& config() const { return config_; }

    /// Stop the connector and close storage. Safe to call more than once.
    void shutdown() noexcept;

private:
    AuthStatus storageAuthStatus() noexcept;

    config::RuntimeConfig config_;
    std::shared_ptr<http::IHttpClient> http_;
    std::shared_ptr<OutputMonitor> monitor_;
    std::unique_ptr<BridgeProcess> process_;
    std::unique_ptr<BridgeApiClient> api_;
    std::unique_ptr<ReadinessOrchestrator> readiness_;

    std::mutex adapterMutex_;
    std::unique_ptr<repository::IDatabaseAdapter> adapter_;
};

} // namespace wamcp::bridge
