// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <wamcp/bridge/bridge_api_client.h>
#include <wamcp/bridge/bridge_process.h>
#include <wamcp/bridge/readiness.h>
#include <wamcp/config/database_config.h>
#include <wamcp/core/types.h>
#include <wamcp/http/http_client.h>

#include <filesystem>
#include <string>

namespace wamcp::config {

inline constexpr const char* kDefaultBridgeExecutable = "../whatsapp-bridge/whatsapp-bridge";

/**
 * @brief Everything a BridgeRuntime needs, resolved once at startup.
 */
struct RuntimeConfig {
    DatabaseConfig database = SqliteBackendConfig{};
    bridge::BridgeProcessConfig bridge;
    bridge::BridgeEndpoints endpoints;
    http::HttpOptions http;
    bridge::ReadinessOptions readiness;
    /// Config file that was read; empty when none existed.
    std::filesystem::path sourcePath;
};

/**
 * @brief Resolve the runtime configuration.
 *
 * Priority: DATABASE_URL from the environment, then the config file (`configPath`, or
 * $XDG_CONFIG_HOME/wamcp/config.toml), then built-in defaults. A missing config file is not
 * an error; malformed values and unsupported database URLs are InvalidArgument.
 */
Result<RuntimeConfig> loadRuntimeConfig(const std::string& configPath = "");

/// Health endpoint that belongs to an API base ("http://h:p/api" -> "http://h:p/health").
std::string healthUrlForApiBase(std::string_view apiBaseUrl);

} // namespace wamcp::config
