// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#include <spdlog/spdlog.h>
#include <wamcp/repository/repository.h>

#include <exception>

namespace wamcp::repository {

Result<ChatSort> parseChatSort(std::string_view value) {
    if (value == "last_active") {
        return ChatSort::LastActive;
    }
    if (value == "name") {
        return ChatSort::Name;
    }
    return Error{ErrorCode::InvalidArgument,
                 "Unknown chat sort '" + std::string(value) + "' (expected last_active or name)"};
}

Result<int64_t> pageOffset(int limit, int page) {
    if (limit < 0 || page < 0) {
        return Error{ErrorCode::InvalidArgument, "limit and page must be non-negative"};
    }
    return static_cast<int64_t>(page) * static_cast<int64_t>(limit);
}

TransactionScope::TransactionScope(std::unique_ptr<IUnitOfWork> uow)
    : uow_(std::move(uow)), uncaughtAtOpen_(std::uncaught_exceptions()) {}

TransactionScope::TransactionScope(TransactionScope&& other) noexcept
    : uow_(std::move(other.uow_)), uncaughtAtOpen_(other.uncaughtAtOpen_),
      committed_(other.committed_) {}

Result<TransactionScope> TransactionScope::open(IDatabaseAdapter& adapter) {
    auto uow = adapter.unitOfWork();
    if (!uow) {
        return Error{ErrorCode::InvalidState, "Adapter returned no unit of work"};
    }
    if (auto r = uow->begin(); !r) {
        return r.error();
    }
    return TransactionScope(std::move(uow));
}

TransactionScope::~TransactionScope() {
    if (!uow_ || committed_) {
        return;
    }
    if (std::uncaught_exceptions() > uncaughtAtOpen_) {
        if (auto r = uow_->rollback(); !r) {
            spdlog::error("[TransactionScope] Rollback during unwind failed: {}",
                          r.error().message);
        }
        return;
    }
    uow_->discard();
}

Result<void> TransactionScope::commit() {
    if (!uow_) {
        return Error{ErrorCode::InvalidState, "Transaction scope has been moved from"};
    }
    if (committed_) {
        return Error{ErrorCode::InvalidState, "Transaction already committed"};
    }
    auto r = uow_->commit();
    if (r) {
        committed_ = true;
    }
    return r;
}

bool TransactionScope::isTransactional() const noexcept {
    return uow_ && uow_->isTransactional();
}

} // namespace wamcp::repository
