// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#include <wamcp/http/http_client.h>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <mutex>
#include <thread>

namespace wamcp::http {

namespace {

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view url) {
    Error err;
    err.message = std::string(url) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            err.code = ErrorCode::NetworkError;
            break;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            err.code = ErrorCode::InvalidArgument;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

bool isTransient(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
            return true;
        default:
            return false;
    }
}

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;
    static_cast<std::string*>(userdata)->append(ptr, total);
    return total;
}

curl_slist* build_header_list(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return list;
}

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct Attempt {
    CURLcode code = CURLE_OK;
    HttpResponse response;
};

Attempt performOnce(const HttpRequest& request, const HttpOptions& opts) {
    Attempt attempt;
    CURL* curl = curl_easy_init();
    if (!curl) {
        attempt.code = CURLE_FAILED_INIT;
        return attempt;
    }

    auto* list = build_header_list(request.headers);
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(opts.connectTimeout.count()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                     static_cast<long>((opts.connectTimeout + opts.readTimeout).count()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &attempt.response.body);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);
    if (request.method == Method::Post) {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    }

    attempt.code = curl_easy_perform(curl);
    if (attempt.code == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &attempt.response.status);
    }

    if (list)
        curl_slist_free_all(list);
    curl_easy_cleanup(curl);
    return attempt;
}

} // namespace

Result<HttpResponse> IHttpClient::get(std::string url, std::vector<Header> headers,
                                      std::optional<HttpOptions> options) {
    HttpRequest req;
    req.method = Method::Get;
    req.url = std::move(url);
    req.headers = std::move(headers);
    req.options = std::move(options);
    return send(req);
}

Result<HttpResponse> IHttpClient::postJson(std::string url, std::string body,
                                           std::vector<Header> headers,
                                           std::optional<HttpOptions> options) {
    HttpRequest req;
    req.method = Method::Post;
    req.url = std::move(url);
    req.body = std::move(body);
    req.headers = std::move(headers);
    req.headers.push_back({"Content-Type", "application/json"});
    req.options = std::move(options);
    return send(req);
}

CurlHttpClient::CurlHttpClient(HttpOptions defaults) : defaults_(std::move(defaults)) {
    ensureCurlGlobalInit();
}

Result<HttpResponse> CurlHttpClient::send(const HttpRequest& request) {
    const HttpOptions& opts = request.options ? *request.options : defaults_;
    const int attempts = 1 + std::max(0, opts.maxRetries);

    for (int i = 0; i < attempts; ++i) {
        if (i > 0) {
            auto delay = opts.backoffFactor * (1 << (i - 1));
            spdlog::debug("[HttpClient] Retry {}/{} for {} in {}ms", i, opts.maxRetries,
                          request.url, delay.count());
            std::this_thread::sleep_for(delay);
        }

        Attempt attempt = performOnce(request, opts);
        const bool last = i + 1 == attempts;
        if (attempt.code != CURLE_OK) {
            if (!last && isTransient(attempt.code)) {
                continue;
            }
            return makeCurlError(attempt.code, request.url);
        }

        const bool retryStatus =
            std::find(opts.retryStatuses.begin(), opts.retryStatuses.end(),
                      attempt.response.status) != opts.retryStatuses.end();
        if (retryStatus && !last) {
            continue;
        }
        return attempt.response;
    }
    return Error{ErrorCode::InternalError, "Retry loop exhausted without a result"};
}

std::string urlEncode(std::string_view value) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::string buildQueryString(const std::vector<std::pair<std::string, std::string>>& params) {
    std::string out;
    for (const auto& [key, value] : params) {
        if (!out.empty()) {
            out.push_back('&');
        }
        out += urlEncode(key);
        out.push_back('=');
        out += urlEncode(value);
    }
    return out;
}

} // namespace wamcp::http
