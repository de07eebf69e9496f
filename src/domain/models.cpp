// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#include <wamcp/domain/models.h>

namespace wamcp {

bool isGroupJid(std::string_view jid) {
    return jid.ends_with(kGroupJidSuffix);
}

std::string phoneFromJid(std::string_view jid) {
    const auto at = jid.find('@');
    return std::string(at == std::string_view::npos ? jid : jid.substr(0, at));
}

} // namespace wamcp
