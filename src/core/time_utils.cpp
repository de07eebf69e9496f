// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#include <wamcp/core/time_utils.h>

#include <chrono>
#include <fmt/format.h>
#include <regex>
#include <string>

namespace wamcp {

namespace {

std::optional<TimePoint> parseIso(std::string_view text) {
    // 1 year, 2 month, 3 day, 4 hour, 5 minute, 6 second, 7 fraction, 8 offset
    static const std::regex isoRegex(
        R"(^(\d{4})-(\d{2})-(\d{2})(?:[T ](\d{2}):(\d{2})(?::(\d{2})(?:\.(\d{1,9}))?)?)"
        R"(\s*(Z|z|[+-]\d{2}(?::?\d{2})?)?)?$)");

    std::match_results<std::string_view::const_iterator> match;
    if (!std::regex_match(text.begin(), text.end(), match, isoRegex)) {
        return std::nullopt;
    }

    using namespace std::chrono;
    const int y = std::stoi(match[1].str());
    const unsigned mo = static_cast<unsigned>(std::stoi(match[2].str()));
    const unsigned d = static_cast<unsigned>(std::stoi(match[3].str()));
    const year_month_day ymd{year{y}, month{mo}, day{d}};
    if (!ymd.ok()) {
        return std::nullopt;
    }

    int hh = 0, mm = 0, ss = 0;
    if (match[4].matched) {
        hh = std::stoi(match[4].str());
        mm = std::stoi(match[5].str());
        if (match[6].matched) {
            ss = std::stoi(match[6].str());
        }
    }
    if (hh > 23 || mm > 59 || ss > 59) {
        return std::nullopt;
    }

    microseconds frac{0};
    if (match[7].matched) {
        std::string digits = match[7].str();
        digits.resize(6, '0');
        frac = microseconds{std::stoll(digits)};
    }

    minutes offset{0};
    if (match[8].matched) {
        const std::string tz = match[8].str();
        if (tz != "Z" && tz != "z") {
            const int sign = tz[0] == '-' ? -1 : 1;
            const int oh = std::stoi(tz.substr(1, 2));
            const int om = tz.size() > 3 ? std::stoi(tz.substr(tz.size() - 2)) : 0;
            if (oh > 23 || om > 59) {
                return std::nullopt;
            }
            offset = minutes{sign * (oh * 60 + om)};
        }
    }

    const auto local = sys_days{ymd} + hours{hh} + minutes{mm} + seconds{ss} + frac;
    return time_point_cast<TimePoint::duration>(local - offset);
}

} // namespace

Result<TimePoint> Timestamp::parse(std::string_view text) {
    if (text.empty()) {
        return Error{ErrorCode::InvalidArgument, "Empty timestamp"};
    }
    if (auto tp = parseIso(text)) {
        return *tp;
    }
    return Error{ErrorCode::InvalidArgument,
                 "Invalid date format: '" + std::string(text) +
                     "'. Expected ISO 8601 (YYYY-MM-DD or YYYY-MM-DDTHH:MM:SS[+HH[:MM]])"};
}

std::optional<TimePoint> Timestamp::parseStored(std::string_view text) {
    return parseIso(text);
}

std::string Timestamp::format(TimePoint tp) {
    using namespace std::chrono;
    const auto us = floor<microseconds>(tp);
    const auto dayPoint = floor<days>(us);
    const year_month_day ymd{dayPoint};
    const hh_mm_ss tod{us - dayPoint};
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:06}+00:00", int(ymd.year()),
                       unsigned(ymd.month()), unsigned(ymd.day()), tod.hours().count(),
                       tod.minutes().count(), tod.seconds().count(), tod.subseconds().count());
}

} // namespace wamcp
