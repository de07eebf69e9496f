// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <wamcp/core/time_utils.h>

using namespace wamcp;
using namespace std::chrono;

namespace {
TimePoint utc(int y, unsigned mo, unsigned d, int h = 0, int mi = 0, int s = 0) {
    return sys_days{year{y} / month{mo} / day{d}} + hours{h} + minutes{mi} + seconds{s};
}
} // namespace

TEST_CASE("Timestamp: accepted ISO 8601 forms", "[unit][core][time]") {
    SECTION("date only is midnight UTC") {
        auto r = Timestamp::parse("2024-03-01");
        REQUIRE(r.has_value());
        CHECK(r.value() == utc(2024, 3, 1));
    }

    SECTION("T and space separators") {
        auto t = Timestamp::parse("2024-03-01T12:30:05");
        auto s = Timestamp::parse("2024-03-01 12:30:05");
        REQUIRE(t.has_value());
        REQUIRE(s.has_value());
        CHECK(t.value() == utc(2024, 3, 1, 12, 30, 5));
        CHECK(t.value() == s.value());
    }

    SECTION("minutes without seconds") {
        auto r = Timestamp::parse("2024-03-01T08:15");
        REQUIRE(r.has_value());
        CHECK(r.value() == utc(2024, 3, 1, 8, 15));
    }

    SECTION("fractional seconds keep microseconds") {
        auto r = Timestamp::parse("2024-03-01T12:00:00.250");
        REQUIRE(r.has_value());
        CHECK(r.value() - utc(2024, 3, 1, 12) == milliseconds{250});
    }

    SECTION("offsets are normalized to UTC") {
        auto z = Timestamp::parse("2024-03-01T12:00:00Z");
        auto plus = Timestamp::parse("2024-03-01T14:00:00+02:00");
        auto minus = Timestamp::parse("2024-03-01T07:00:00-0500");
        REQUIRE(z.has_value());
        REQUIRE(plus.has_value());
        REQUIRE(minus.has_value());
        CHECK(z.value() == utc(2024, 3, 1, 12));
        CHECK(plus.value() == z.value());
        CHECK(minus.value() == z.value());
    }

    SECTION("hour-only offsets") {
        auto plus = Timestamp::parse("2024-03-01T17:00:00+05");
        auto minus = Timestamp::parse("2024-03-01 09:00-03");
        REQUIRE(plus.has_value());
        REQUIRE(minus.has_value());
        CHECK(plus.value() == utc(2024, 3, 1, 12));
        CHECK(minus.value() == utc(2024, 3, 1, 12));
    }
}

TEST_CASE("Timestamp: malformed input is InvalidArgument", "[unit][core][time]") {
    for (const char* bad : {"", "yesterday", "2024-13-01", "2024-02-30", "2024-03-01T25:00",
                            "2024/03/01", "2024-03-01T12:00:00+25:00", "2024-03-01T12:00:00+5",
                            "2024-03-01T12:00:00+25", "20240301"}) {
        INFO(bad);
        auto r = Timestamp::parse(bad);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("Timestamp: error message names the rejected text", "[unit][core][time]") {
    auto r = Timestamp::parse("not-a-date");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().message.find("not-a-date") != std::string::npos);
    CHECK(r.error().message.find("ISO 8601") != std::string::npos);
}

TEST_CASE("Timestamp: stored values parse leniently", "[unit][core][time]") {
    CHECK(Timestamp::parseStored("2024-03-01 12:00:00+00:00").has_value());
    CHECK_FALSE(Timestamp::parseStored("garbage").has_value());
}

TEST_CASE("Timestamp: format is fixed-width UTC with microseconds", "[unit][core][time]") {
    auto tp = utc(2024, 1, 2, 3, 4, 5) + microseconds{42};
    CHECK(Timestamp::format(tp) == "2024-01-02T03:04:05.000042+00:00");

    auto back = Timestamp::parse(Timestamp::format(tp));
    REQUIRE(back.has_value());
    CHECK(back.value() == tp);
}
