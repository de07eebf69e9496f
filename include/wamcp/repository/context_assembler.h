// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <wamcp/repository/repository.h>

#include <vector>

namespace wamcp::repository {

/**
 * @brief Expands a match list into chronological conversation windows.
 *
 * For every match, in input order, appends (before-window, match, after-window) as returned
 * by IMessageRepository::getMessageContext. Overlapping windows are kept as-is.
 */
class ContextAssembler {
public:
    explicit ContextAssembler(IMessageRepository& messages) : messages_(messages) {}

    Result<std::vector<Message>> expand(const std::vector<Message>& matches, int before,
                                        int after) const;

private:
    IMessageRepository& messages_;
};

} // namespace wamcp::repository
