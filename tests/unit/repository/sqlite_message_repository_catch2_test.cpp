// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <common/test_helpers_catch2.h>

#include "sqlite_fixture.h"

#include <limits>

using namespace wamcp;
using namespace wamcp::repository;
using wamcp::test::ids;

namespace {
MessageQuery matchesOnly() {
    MessageQuery q;
    q.includeContext = false;
    return q;
}

using Ids = std::vector<std::string>;
} // namespace

TEST_CASE("SqliteMessages: newest first without context", "[unit][repository][sqlite]") {
    test::SeededSqlite fix;
    auto r = fix.adapter->messages().listMessages(matchesOnly());
    REQUIRE(r.has_value());
    CHECK(ids(r.value()) == Ids{"g2", "a5", "a4", "a3", "a2", "g1", "a1"});

    const auto& rows = r.value();
    for (size_t i = 1; i < rows.size(); ++i) {
        CHECK(rows[i - 1].timestamp > rows[i].timestamp);
    }
}

TEST_CASE("SqliteMessages: row mapping", "[unit][repository][sqlite]") {
    test::SeededSqlite fix;
    auto q = matchesOnly();
    q.chatJid = test::kTeamJid;
    q.sender = test::kAliceJid;
    auto r = fix.adapter->messages().listMessages(q);
    REQUIRE(r.has_value());
    REQUIRE(r.value().size() == 1);

    const auto& m = r.value().front();
    CHECK(m.id == "g1");
    CHECK(m.content == "team meeting");
    CHECK(m.chatJid == test::kTeamJid);
    CHECK(m.chatName == std::optional<std::string>("Team"));
    CHECK(m.mediaType == std::optional<std::string>("image"));
    CHECK_FALSE(m.isFromMe);
    CHECK(m.timestampText == "2024-01-01 10:00:30+00:00");
    CHECK(Timestamp::format(m.timestamp) == "2024-01-01T10:00:30.000000+00:00");
}

TEST_CASE("SqliteMessages: date bounds are exclusive", "[unit][repository][sqlite]") {
    test::SeededSqlite fix;
    auto q = matchesOnly();
    q.after = "2024-01-01T10:01:00";
    q.before = "2024-01-01T10:04:00Z";
    auto r = fix.adapter->messages().listMessages(q);
    REQUIRE(r.has_value());
    CHECK(ids(r.value()) == Ids{"a4", "a3"});

    SECTION("offsets are honored") {
        q.after = "2024-01-01T12:03:30+02:00";
        q.before.reset();
        auto shifted = fix.adapter->messages().listMessages(q);
        REQUIRE(shifted.has_value());
        CHECK(ids(shifted.value()) == Ids{"g2", "a5"});
    }

    SECTION("date-only bounds") {
        q.after = "2023-12-31";
        q.before = "2024-01-02";
        auto all = fix.adapter->messages().listMessages(q);
        REQUIRE(all.has_value());
        CHECK(all.value().size() == 7);
    }
}

TEST_CASE("SqliteMessages: malformed date filter", "[unit][repository][sqlite]") {
    test::SeededSqlite fix;
    auto q = matchesOnly();
    q.after = "last tuesday";
    auto r = fix.adapter->messages().listMessages(q);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("SqliteMessages: filters combine", "[unit][repository][sqlite]") {
    test::SeededSqlite fix;

    SECTION("text is case-insensitive substring") {
        auto q = matchesOnly();
        q.text = "LUNCH";
        auto r = fix.adapter->messages().listMessages(q);
        REQUIRE(r.has_value());
        CHECK(ids(r.value()) == Ids{"a3"});
    }

    SECTION("sender") {
        auto q = matchesOnly();
        q.sender = test::kAliceJid;
        auto r = fix.adapter->messages().listMessages(q);
        REQUIRE(r.has_value());
        CHECK(ids(r.value()) == Ids{"a5", "a3", "g1", "a1"});
    }

    SECTION("chat") {
        auto q = matchesOnly();
        q.chatJid = test::kTeamJid;
        auto r = fix.adapter->messages().listMessages(q);
        REQUIRE(r.has_value());
        CHECK(ids(r.value()) == Ids{"g2", "g1"});
    }

    SECTION("no match") {
        auto q = matchesOnly();
        q.text = "nothing like this";
        auto r = fix.adapter->messages().listMessages(q);
        REQUIRE(r.has_value());
        CHECK(r.value().empty());
    }
}

TEST_CASE("SqliteMessages: paging", "[unit][repository][sqlite]") {
    test::SeededSqlite fix;
    auto q = matchesOnly();
    q.limit = 2;
    q.page = 1;
    auto r = fix.adapter->messages().listMessages(q);
    REQUIRE(r.has_value());
    CHECK(ids(r.value()) == Ids{"a4", "a3"});

    q.page = 3;
    auto last = fix.adapter->messages().listMessages(q);
    REQUIRE(last.has_value());
    CHECK(ids(last.value()) == Ids{"a1"});

    // page * limit does not fit in an int
    q.limit = 1000;
    q.page = std::numeric_limits<int>::max() / 10;
    auto far = fix.adapter->messages().listMessages(q);
    REQUIRE(far.has_value());
    CHECK(far.value().empty());

    q.limit = -1;
    auto bad = fix.adapter->messages().listMessages(q);
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("SqliteMessages: context windows around matches", "[unit][repository][sqlite]") {
    test::SeededSqlite fix;
    MessageQuery q;
    q.text = "lunch";

    SECTION("one before, one after") {
        auto r = fix.adapter->messages().listMessages(q);
        REQUIRE(r.has_value());
        CHECK(ids(r.value()) == Ids{"a2", "a3", "a4"});
    }

    SECTION("windows stay inside the chat") {
        q.text.reset();
        q.chatJid = test::kTeamJid;
        q.contextBefore = 3;
        q.contextAfter = 3;
        auto r = fix.adapter->messages().listMessages(q);
        REQUIRE(r.has_value());
        // Each match expands to its own window; overlapping windows are not merged
        CHECK(ids(r.value()) == Ids{"g1", "g2", "g1", "g2"});
    }

    SECTION("zero-width windows") {
        q.contextBefore = 0;
        q.contextAfter = 0;
        auto r = fix.adapter->messages().listMessages(q);
        REQUIRE(r.has_value());
        CHECK(ids(r.value()) == Ids{"a3"});
    }
}

TEST_CASE("SqliteMessages: message context", "[unit][repository][sqlite]") {
    test::SeededSqlite fix;
    auto& repo = fix.adapter->messages();

    SECTION("neighbours in ascending order") {
        auto r = repo.getMessageContext("a3");
        REQUIRE(r.has_value());
        CHECK(r.value().message.id == "a3");
        CHECK(ids(r.value().before) == Ids{"a1", "a2"});
        CHECK(ids(r.value().after) == Ids{"a4", "a5"});
    }

    SECTION("window sizes are upper bounds") {
        auto r = repo.getMessageContext("a3", 1, 0);
        REQUIRE(r.has_value());
        CHECK(ids(r.value().before) == Ids{"a2"});
        CHECK(r.value().after.empty());
    }

    SECTION("first message has nothing before") {
        auto r = repo.getMessageContext("a1", 5, 1);
        REQUIRE(r.has_value());
        CHECK(r.value().before.empty());
        CHECK(ids(r.value().after) == Ids{"a2"});
    }

    SECTION("unknown id") {
        auto r = repo.getMessageContext("does-not-exist");
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == ErrorCode::NotFound);
    }
}

TEST_CASE("SqliteMessages: sender names", "[unit][repository][sqlite]") {
    test::SeededSqlite fix;
    auto& repo = fix.adapter->messages();

    CHECK(repo.getSenderName(test::kAliceJid) == "Alice");
    CHECK(repo.getSenderName("15550001111") == "Alice");
    CHECK(repo.getSenderName(test::kBobJid) == test::kBobJid);
    // Chat exists but has no name
    CHECK(repo.getSenderName(test::kQuietJid) == test::kQuietJid);
}

TEST_CASE("SqliteMessages: storeMessage replaces by id and chat", "[unit][repository][sqlite]") {
    test::SeededSqlite fix;
    fix.message("a5", test::kAliceJid, test::kAliceJid, "great, see you",
                "2024-01-01 10:04:00+00:00", false);

    auto r = fix.adapter->messages().getMessageContext("a5", 0, 0);
    REQUIRE(r.has_value());
    CHECK(r.value().message.content == "great, see you");

    auto all = fix.adapter->messages().listMessages(matchesOnly());
    REQUIRE(all.has_value());
    CHECK(all.value().size() == 7);
}

TEST_CASE("SqliteMessages: unreadable stored timestamp", "[unit][repository][sqlite]") {
    test::SeededSqlite fix;
    fix.message("bad-ts", test::kAliceJid, test::kAliceJid, "clock skew", "not a time", false);

    test::ScopedLogCapture logs;
    auto r = fix.adapter->messages().getMessageContext("bad-ts", 0, 0);
    REQUIRE(r.has_value());
    CHECK(r.value().message.content == "clock skew");
    CHECK(r.value().message.timestampText == "not a time");
    CHECK(r.value().message.timestamp == TimePoint{});
    CHECK(logs.text().find("bad-ts has an unreadable timestamp 'not a time'") !=
          std::string::npos);
}

TEST_CASE("SqliteMessages: closed adapter", "[unit][repository][sqlite]") {
    test::SeededSqlite fix;
    fix.adapter->close();

    auto r = fix.adapter->messages().listMessages(matchesOnly());
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == ErrorCode::InvalidState);
    CHECK(fix.adapter->messages().getSenderName(test::kAliceJid) == test::kAliceJid);
}
