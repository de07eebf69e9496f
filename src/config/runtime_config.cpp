// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#include <spdlog/spdlog.h>
#include <wamcp/config/config_helpers.h>
#include <wamcp/config/runtime_config.h>

namespace wamcp::config {

namespace {

// Reads an integer key into `out`; absent keys leave it untouched
Result<void> readMillis(const std::filesystem::path& path, const std::string& section,
                        const std::string& key, std::chrono::milliseconds& out) {
    auto raw = parse_config_value(path, section, key);
    if (raw.empty()) {
        return {};
    }
    auto value = parse_non_negative(raw);
    if (!value) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid value for [" + section + "] " + key + ": '" + raw + "'"};
    }
    out = std::chrono::milliseconds{*value};
    return {};
}

} // namespace

std::string healthUrlForApiBase(std::string_view apiBaseUrl) {
    std::string base(apiBaseUrl);
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    constexpr std::string_view kApiSuffix = "/api";
    if (base.ends_with(kApiSuffix)) {
        base.resize(base.size() - kApiSuffix.size());
    }
    return base + "/health";
}

Result<RuntimeConfig> loadRuntimeConfig(const std::string& configPath) {
    RuntimeConfig cfg;
    cfg.bridge.executable = kDefaultBridgeExecutable;

    const auto path = get_config_path(configPath);
    std::error_code ec;
    const bool haveFile = std::filesystem::is_regular_file(path, ec);
    if (haveFile) {
        cfg.sourcePath = path;
        spdlog::debug("[Config] Reading {}", path.string());
    } else if (!configPath.empty()) {
        return Error{ErrorCode::FileNotFound, "Config file not found: " + path.string()};
    }

    std::string databaseUrl;
    if (auto env = env_value("DATABASE_URL")) {
        databaseUrl = *env;
    } else if (haveFile) {
        databaseUrl = parse_config_value(path, "database", "url");
    }
    auto database = databaseConfigFromUrl(databaseUrl, restCredentialsFromEnv());
    if (!database) {
        return database.error();
    }
    cfg.database = std::move(database).value();

    if (!haveFile) {
        return cfg;
    }

    if (auto exe = parse_config_value(path, "bridge", "executable"); !exe.empty()) {
        cfg.bridge.executable = expand_tilde(exe);
    }
    if (auto workdir = parse_config_value(path, "bridge", "workdir"); !workdir.empty()) {
        cfg.bridge.workdir = expand_tilde(workdir);
    }
    if (auto base = parse_config_value(path, "bridge", "api_base_url"); !base.empty()) {
        while (!base.empty() && base.back() == '/') {
            base.pop_back();
        }
        cfg.endpoints.apiBaseUrl = base;
        cfg.endpoints.healthUrl = healthUrlForApiBase(base);
    }
    if (auto qr = parse_config_value(path, "bridge", "qr_url"); !qr.empty()) {
        cfg.endpoints.qrUrl = qr;
    }
    cfg.readiness.qrUrl = cfg.endpoints.qrUrl;

    if (auto r = readMillis(path, "http", "connect_timeout_ms", cfg.http.connectTimeout); !r) {
        return r.error();
    }
    if (auto r = readMillis(path, "http", "read_timeout_ms", cfg.http.readTimeout); !r) {
        return r.error();
    }
    if (auto raw = parse_config_value(path, "http", "max_retries"); !raw.empty()) {
        auto retries = parse_non_negative(raw);
        if (!retries) {
            return Error{ErrorCode::InvalidArgument,
                         "Invalid value for [http] max_retries: '" + raw + "'"};
        }
        cfg.http.maxRetries = static_cast<int>(*retries);
    }

    return cfg;
}

} // namespace wamcp::config
