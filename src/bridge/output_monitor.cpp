// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#include <spdlog/spdlog.h>
#include <wamcp/bridge/output_monitor.h>

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace wamcp::bridge {

namespace {

constexpr int kPollTimeoutMs = 100;
constexpr std::size_t kReadChunk = 4096;

std::string_view trimView(std::string_view s) {
    const auto isSpace = [](char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
    };
    while (!s.empty() && isSpace(s.front()))
        s.remove_prefix(1);
    while (!s.empty() && isSpace(s.back()))
        s.remove_suffix(1);
    return s;
}

std::string joinRows(const std::vector<std::string>& rows) {
    std::string out;
    for (size_t i = 0; i < rows.size(); ++i) {
        if (i > 0)
            out.push_back('\n');
        out += rows[i];
    }
    return out;
}

} // namespace

void QrCodeSlot::store(std::string block) {
    std::lock_guard<std::mutex> lock(mutex_);
    block_ = std::move(block);
    fresh_ = true;
    ++captures_;
}

std::optional<std::string> QrCodeSlot::consume() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!fresh_ || !block_) {
        return std::nullopt;
    }
    fresh_ = false;
    return block_;
}

std::optional<std::string> QrCodeSlot::peek() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return block_;
}

std::uint64_t QrCodeSlot::captures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return captures_;
}

void QrCodeSlot::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    block_.reset();
    fresh_ = false;
}

OutputMonitor::OutputMonitor(OutputMarkers markers, std::size_t queueCapacity)
    : markers_(std::move(markers)), lines_(queueCapacity) {}

bool OutputMonitor::isQrRow(std::string_view line) const {
    for (const auto& glyph : markers_.qrGlyphs) {
        if (line.find(glyph) != std::string_view::npos) {
            return true;
        }
    }
    return false;
}

void OutputMonitor::processLine(std::string_view raw) {
    const std::string line(trimView(raw));
    spdlog::debug("[Bridge] {}", line);
    lines_.push(line);

    std::optional<std::string> completed;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        recent_.push_back(line);
        if (recent_.size() > kRecentLineCount) {
            recent_.pop_front();
        }

        if (line.find(markers_.success) != std::string::npos) {
            sawSuccess_ = true;
        }

        if (line.find(markers_.qrStart) != std::string::npos) {
            capturing_ = true;
            qrRows_.clear();
            return;
        }
        if (!capturing_) {
            return;
        }

        const bool closesBlock = line.find(markers_.success) != std::string::npos ||
                                 (line.empty() && !qrRows_.empty());
        if (closesBlock) {
            capturing_ = false;
            if (!qrRows_.empty()) {
                completed = joinRows(qrRows_);
            }
            qrRows_.clear();
        } else if (isQrRow(line)) {
            qrRows_.push_back(line);
        }
    }

    if (completed) {
        spdlog::info("[OutputMonitor] Captured QR code for authentication");
        qr_.store(std::move(*completed));
    }
}

void OutputMonitor::pump(int fd, std::stop_token stop) {
    std::string pending;
    char buf[kReadChunk];

    while (!stop.stop_requested()) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        int pr = ::poll(&pfd, 1, kPollTimeoutMs);
        if (pr < 0) {
            if (errno == EINTR)
                continue;
            spdlog::warn("[OutputMonitor] poll failed: {}", std::strerror(errno));
            break;
        }
        if (pr == 0) {
            continue;
        }

        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            spdlog::warn("[OutputMonitor] read failed: {}", std::strerror(errno));
            break;
        }
        if (n == 0) {
            break; // EOF: every writer closed the pipe
        }

        pending.append(buf, static_cast<size_t>(n));
        size_t start = 0;
        for (size_t nl = pending.find('\n', start); nl != std::string::npos;
             nl = pending.find('\n', start)) {
            processLine(std::string_view(pending).substr(start, nl - start));
            start = nl + 1;
        }
        pending.erase(0, start);
    }

    if (!pending.empty()) {
        processLine(pending);
    }
    spdlog::debug("[OutputMonitor] Output stream closed");
}

void OutputMonitor::beginSession() {
    std::lock_guard<std::mutex> lock(stateMutex_);
    capturing_ = false;
    sawSuccess_ = false;
    qrRows_.clear();
    recent_.clear();
}

bool OutputMonitor::sawSuccess() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return sawSuccess_;
}

std::vector<std::string> OutputMonitor::recentLines() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return {recent_.begin(), recent_.end()};
}

} // namespace wamcp::bridge
