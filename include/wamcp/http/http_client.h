// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <wamcp/core/types.h>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace wamcp::http {

struct Header {
    std::string name;
    std::string value;
};

/**
 * @brief Timeouts and retry policy for outbound requests.
 *
 * Retries apply to transport failures (refused, reset, timed out) and to the listed
 * status codes; the n-th retry waits backoffFactor * 2^(n-1).
 */
struct HttpOptions {
    std::chrono::milliseconds connectTimeout{3000};
    std::chrono::milliseconds readTimeout{15000};
    int maxRetries = 3;
    std::chrono::milliseconds backoffFactor{300};
    std::vector<long> retryStatuses{429, 500, 502, 503, 504};
};

enum class Method { Get, Post };

struct HttpRequest {
    Method method = Method::Get;
    std::string url;
    std::vector<Header> headers;
    std::string body;
    /// Overrides the client's defaults for this request only.
    std::optional<HttpOptions> options;
};

struct HttpResponse {
    long status = 0;
    std::string body;

    [[nodiscard]] bool ok() const { return status >= 200 && status < 300; }
};

/**
 * @brief Blocking HTTP client seam.
 *
 * A response with any status is a success at this level; only transport failures are errors
 * (ErrorCode::NetworkError or ErrorCode::Timeout).
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual Result<HttpResponse> send(const HttpRequest& request) = 0;

    Result<HttpResponse> get(std::string url, std::vector<Header> headers = {},
                             std::optional<HttpOptions> options = std::nullopt);
    Result<HttpResponse> postJson(std::string url, std::string body,
                                  std::vector<Header> headers = {},
                                  std::optional<HttpOptions> options = std::nullopt);
};

/**
 * @brief libcurl implementation; one easy handle per attempt.
 */
class CurlHttpClient final : public IHttpClient {
public:
    explicit CurlHttpClient(HttpOptions defaults = {});
    ~CurlHttpClient() override = default;

    Result<HttpResponse> send(const HttpRequest& request) override;

    [[nodiscard]] const HttpOptions& defaults() const { return defaults_; }

private:
    HttpOptions defaults_;
};

/// Percent-encode everything outside the RFC 3986 unreserved set.
std::string urlEncode(std::string_view value);

/// "k1=v1&k2=v2" with both keys and values encoded. Repeated keys are kept.
std::string buildQueryString(const std::vector<std::pair<std::string, std::string>>& params);

} // namespace wamcp::http
