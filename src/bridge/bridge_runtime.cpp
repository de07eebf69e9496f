// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#include <spdlog/spdlog.h>
#include <wamcp/bridge/bridge_runtime.h>
#include <wamcp/repository/adapter_factory.h>

namespace wamcp::bridge {

BridgeRuntime::BridgeRuntime(config::RuntimeConfig config,
                             std::shared_ptr<http::IHttpClient> http)
    : config_(std::move(config)), http_(std::move(http)) {
    if (!http_) {
        http_ = std::make_shared<http::CurlHttpClient>(config_.http);
    }
    monitor_ = std::make_shared<OutputMonitor>();
    process_ = std::make_unique<BridgeProcess>(config_.bridge, monitor_);
    api_ = std::make_unique<BridgeApiClient>(http_, config_.endpoints);
    readiness_ = std::make_unique<ReadinessOrchestrator>(
        *process_, *api_, [this] { return storageAuthStatus(); }, monitor_.get(),
        config_.readiness);
    spdlog::debug("[BridgeRuntime] Storage backend: {}", config::describe(config_.database));
}

BridgeRuntime::~BridgeRuntime() {
    shutdown();
}

Result<repository::IDatabaseAdapter*> BridgeRuntime::database() {
    std::lock_guard<std::mutex> lock(adapterMutex_);
    if (!adapter_) {
        auto created = repository::createDatabaseAdapter(config_.database, http_);
        if (!created) {
            spdlog::error("[BridgeRuntime] Failed to open storage: {}", created.error().message);
            return created.error();
        }
        adapter_ = std::move(created).value();
        spdlog::info("[BridgeRuntime] Opened {} storage backend", adapter_->backendName());
    }
    return adapter_.get();
}

AuthStatus BridgeRuntime::storageAuthStatus() noexcept {
    auto db = database();
    if (!db) {
        return {false, "Unable to check authentication: " + db.error().message};
    }
    return db.value()->authentication().checkAuthenticationStatus();
}

ReadinessResult BridgeRuntime::ensureReady() noexcept {
    return readiness_->ensureReady();
}

BridgeStatus BridgeRuntime::getBridgeStatus() noexcept {
    return readiness_->getBridgeStatus();
}

AuthWaitResult BridgeRuntime::waitForAuthentication(std::chrono::milliseconds timeout) noexcept {
    return readiness_->waitForAuthentication(timeout);
}

void BridgeRuntime::shutdown() noexcept {
    if (process_) {
        process_->stop();
    }
    std::lock_guard<std::mutex> lock(adapterMutex_);
    if (adapter_) {
        adapter_->close();
        adapter_.reset();
        spdlog::debug("[BridgeRuntime] Storage closed");
    }
}

} // namespace wamcp::bridge
