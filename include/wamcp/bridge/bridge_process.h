// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <wamcp/bridge/output_monitor.h>

#include <sys/types.h>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wamcp::bridge {

/**
 * @brief Lifecycle of the managed connector process.
 */
enum class SupervisorState : uint8_t {
    NotStarted,  ///< No spawn attempted yet
    Starting,    ///< Spawned, inside the startup window
    Running,     ///< Survived the startup window
    StartFailed, ///< Missing executable, spawn failure, fatal message or early exit
    Stopped      ///< Stopped explicitly or exited after startup
};

const char* toString(SupervisorState state);

/**
 * @brief Configuration for the connector process.
 *
 * @code
 * BridgeProcessConfig config;
 * config.executable = "../whatsapp-bridge/whatsapp-bridge";
 * config.startupWindow = std::chrono::seconds{5};
 * @endcode
 */
struct BridgeProcessConfig {
    std::filesystem::path executable;
    std::vector<std::string> args;
    std::optional<std::filesystem::path> workdir; ///< Defaults to the executable's directory
    std::chrono::milliseconds startupWindow{5000};
    std::chrono::milliseconds startupPollInterval{100};
    std::chrono::milliseconds stopTimeout{10000};
    std::vector<std::string> fatalMessages{"Required session table 'devices' does not exist",
                                           "Bridge initialization failed"};
    /// Also treat an unmanaged process with the same executable name as running.
    bool detectExternalProcess = true;
};

struct StartOutcome {
    bool success = false;
    std::string message;
};

/**
 * @brief Seam over process supervision for the readiness orchestrator.
 */
class IBridgeSupervisor {
public:
    virtual ~IBridgeSupervisor() = default;

    virtual StartOutcome start() = 0;
    virtual void stop() noexcept = 0;
    virtual bool isRunning() = 0;
};

/**
 * @brief Owns at most one connector process.
 *
 * start() spawns the executable as the leader of a new session and process group, with
 * stdout and stderr merged into a pipe that an OutputMonitor drains on its own thread. It then
 * watches the startup window for a fatal message or an early exit; surviving the window
 * counts as success, which only means the process did not crash immediately.
 *
 * stop() signals the whole group with SIGTERM, waits stopTimeout, escalates to SIGKILL and
 * always forgets the handle. It is idempotent and runs from the destructor.
 *
 * isRunning() is true when the owned child is alive or, with detectExternalProcess, when a
 * process whose executable has the same file name exists. The second check survives a
 * supervisor restart but reports false positives for unrelated programs sharing that name.
 */
class BridgeProcess final : public IBridgeSupervisor {
public:
    BridgeProcess(BridgeProcessConfig config, std::shared_ptr<OutputMonitor> monitor);
    ~BridgeProcess() override;

    BridgeProcess(const BridgeProcess&) = delete;
    BridgeProcess& operator=(const BridgeProcess&) = delete;

    StartOutcome start() override;
    void stop() noexcept override;
    bool isRunning() override;

    [[nodiscard]] SupervisorState state() const;
    [[nodiscard]] std::optional<pid_t> pid() const;
    [[nodiscard]] std::optional<int> lastExitCode() const;
    [[nodiscard]] const BridgeProcessConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Scan /proc for a process whose executable file name equals `name`.
 *
 * Uses /proc/<pid>/exe, falling back to argv[0] from /proc/<pid>/cmdline when the link is
 * unreadable. The process `exclude` is skipped.
 */
std::optional<pid_t> findProcessByExecutableName(const std::string& name, pid_t exclude);

} // namespace wamcp::bridge
