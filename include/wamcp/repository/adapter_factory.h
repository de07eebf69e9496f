// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <wamcp/config/database_config.h>
#include <wamcp/http/http_client.h>
#include <wamcp/repository/repository.h>

#include <memory>

namespace wamcp::repository {

/**
 * @brief Build the adapter selected by the configuration variant.
 *
 * @param http Shared client used by the REST backend; ignored for SQLite.
 */
Result<std::unique_ptr<IDatabaseAdapter>>
createDatabaseAdapter(const config::DatabaseConfig& config,
                      std::shared_ptr<http::IHttpClient> http);

} // namespace wamcp::repository
