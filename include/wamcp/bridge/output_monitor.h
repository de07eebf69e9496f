// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <wamcp/bridge/line_channel.h>

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace wamcp::bridge {

/// Phrases the connector prints around its QR code.
struct OutputMarkers {
    std::string qrStart = "Scan this QR code with your WhatsApp app:";
    std::string success = "Successfully connected and authenticated!";
    std::vector<std::string> qrGlyphs = {"█", "▄", "▀", "▐", "▌"};
};

/**
 * @brief Single-slot holder for the latest captured QR block.
 *
 * store() overwrites; consume() hands out a stored block once and then reports nothing until
 * the next store().
 */
class QrCodeSlot {
public:
    void store(std::string block);
    std::optional<std::string> consume();
    [[nodiscard]] std::optional<std::string> peek() const;
    [[nodiscard]] std::uint64_t captures() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::optional<std::string> block_;
    bool fresh_ = false;
    std::uint64_t captures_ = 0;
};

/**
 * @brief Reader of the connector's combined stdout/stderr.
 *
 * Each trimmed line is published to lines(), logged at debug level and fed to the QR
 * capture state machine: the start marker opens a block, rows containing block glyphs are
 * collected, and the success phrase or a blank line after the first row closes it.
 */
class OutputMonitor {
public:
    static constexpr std::size_t kDefaultQueueCapacity = 1024;
    static constexpr std::size_t kRecentLineCount = 20;

    explicit OutputMonitor(OutputMarkers markers = {},
                           std::size_t queueCapacity = kDefaultQueueCapacity);

    /// Feed one raw line (without its terminator).
    void processLine(std::string_view raw);

    /**
     * @brief Blocking read loop over a pipe descriptor.
     *
     * Returns at end of stream, on a read error or once stop is requested; the descriptor
     * is polled every 100 ms so a stop request is honored promptly. Does not close fd.
     */
    void pump(int fd, std::stop_token stop);

    /// Reset per-process state before a new connector process starts.
    void beginSession();

    LineChannel& lines() { return lines_; }
    QrCodeSlot& qrCode() { return qr_; }

    /// True once the success phrase was seen in the current session.
    [[nodiscard]] bool sawSuccess() const;

    /// Most recent lines, oldest first, independent of queue consumption.
    [[nodiscard]] std::vector<std::string> recentLines() const;

private:
    bool isQrRow(std::string_view line) const;

    OutputMarkers markers_;
    LineChannel lines_;
    QrCodeSlot qr_;

    mutable std::mutex stateMutex_;
    bool capturing_ = false;
    bool sawSuccess_ = false;
    std::vector<std::string> qrRows_;
    std::deque<std::string> recent_;
};

} // namespace wamcp::bridge
