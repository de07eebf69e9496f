// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdlib>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace wamcp::test {

/// PostgREST request decoded back into table and parameters.
struct PostgrestRequest {
    std::string table;
    std::vector<std::pair<std::string, std::string>> params;

    std::vector<std::string> all(const std::string& key) const {
        std::vector<std::string> out;
        for (const auto& [k, v] : params) {
            if (k == key) {
                out.push_back(v);
            }
        }
        return out;
    }

    std::string get(const std::string& key) const {
        auto values = all(key);
        return values.empty() ? std::string{} : values.front();
    }

    bool has(const std::string& key) const { return !all(key).empty(); }
};

inline std::string percent_decode(const std::string& s) {
    std::string out;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            out.push_back(static_cast<char>(std::strtol(s.substr(i + 1, 2).c_str(), nullptr, 16)));
            i += 2;
        } else {
            out.push_back(s[i]);
        }
    }
    return out;
}

/**
 * @brief Split a request URL under @p restPrefix ("https://host/rest/v1/").
 *
 * Returns nullopt when the URL does not start with the prefix.
 */
inline std::optional<PostgrestRequest> parse_postgrest_url(const std::string& url,
                                                           const std::string& restPrefix) {
    if (url.rfind(restPrefix, 0) != 0) {
        return std::nullopt;
    }
    PostgrestRequest parsed;
    const auto rest = url.substr(restPrefix.size());
    const auto q = rest.find('?');
    parsed.table = rest.substr(0, q);
    if (q == std::string::npos) {
        return parsed;
    }
    size_t pos = q + 1;
    while (pos <= rest.size()) {
        auto amp = rest.find('&', pos);
        if (amp == std::string::npos) {
            amp = rest.size();
        }
        const auto pair = rest.substr(pos, amp - pos);
        const auto eq = pair.find('=');
        parsed.params.emplace_back(percent_decode(pair.substr(0, eq)),
                                   percent_decode(pair.substr(eq + 1)));
        pos = amp + 1;
    }
    return parsed;
}

} // namespace wamcp::test
