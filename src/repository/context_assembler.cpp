// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#include <wamcp/repository/context_assembler.h>

#include <algorithm>
#include <iterator>

namespace wamcp::repository {

Result<std::vector<Message>> ContextAssembler::expand(const std::vector<Message>& matches,
                                                     int before, int after) const {
    std::vector<Message> out;
    out.reserve(matches.size() * static_cast<size_t>(1 + std::max(0, before) + std::max(0, after)));

    for (const auto& match : matches) {
        auto ctx = messages_.getMessageContext(match.id, before, after);
        if (!ctx) {
            return ctx.error();
        }
        auto& window = ctx.value();
        out.insert(out.end(), std::make_move_iterator(window.before.begin()),
                   std::make_move_iterator(window.before.end()));
        out.push_back(std::move(window.message));
        out.insert(out.end(), std::make_move_iterator(window.after.begin()),
                   std::make_move_iterator(window.after.end()));
    }
    return out;
}

} // namespace wamcp::repository
