// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#include <spdlog/spdlog.h>
#include <wamcp/repository/adapter_factory.h>
#include <wamcp/repository/rest_adapter.h>
#include <wamcp/repository/sqlite_adapter.h>

#include <type_traits>

namespace wamcp::repository {

Result<std::unique_ptr<IDatabaseAdapter>>
createDatabaseAdapter(const config::DatabaseConfig& config,
                      std::shared_ptr<http::IHttpClient> http) {
    spdlog::info("[AdapterFactory] Initializing database backend: {}", config::describe(config));

    return std::visit(
        [&](const auto& backend) -> Result<std::unique_ptr<IDatabaseAdapter>> {
            using T = std::decay_t<decltype(backend)>;
            if constexpr (std::is_same_v<T, config::SqliteBackendConfig>) {
                auto adapter = SqliteDatabaseAdapter::open(backend);
                if (!adapter) {
                    return adapter.error();
                }
                return std::unique_ptr<IDatabaseAdapter>(std::move(adapter).value());
            } else {
                if (!http) {
                    return Error{ErrorCode::InvalidArgument,
                                 "REST backend requires an HTTP client"};
                }
                if (backend.baseUrl.empty() || backend.apiKey.empty()) {
                    return Error{ErrorCode::InvalidArgument,
                                 "REST backend requires a base URL and an API key"};
                }
                return std::unique_ptr<IDatabaseAdapter>(
                    std::make_unique<RestDatabaseAdapter>(backend, std::move(http)));
            }
        },
        config);
}

} // namespace wamcp::repository
