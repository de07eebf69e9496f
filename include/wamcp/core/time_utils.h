// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <wamcp/core/types.h>
#include <optional>
#include <string>
#include <string_view>

namespace wamcp {

/**
 * @brief ISO 8601 timestamp parsing and formatting.
 *
 * Accepted forms:
 * - "2024-01-01"
 * - "2024-01-01T12:30", "2024-01-01 12:30:05", "2024-01-01T12:30:05.123456"
 * - any of the above with a time part followed by "Z", "+HH:MM", "+HHMM" or "+HH"
 *   (or the "-" forms)
 *
 * Values without an offset are taken as UTC.
 */
class Timestamp {
public:
    /**
     * @brief Strict parse used for caller-supplied filters.
     * @return InvalidArgument when the text is not an accepted ISO 8601 form
     */
    static Result<TimePoint> parse(std::string_view text);

    /**
     * @brief Lenient parse used for stored rows; returns nullopt instead of failing.
     */
    static std::optional<TimePoint> parseStored(std::string_view text);

    /**
     * @brief Format as "YYYY-MM-DDTHH:MM:SS.ffffff+00:00" in UTC.
     */
    static std::string format(TimePoint tp);
};

} // namespace wamcp
