// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#include <spdlog/spdlog.h>
#include <wamcp/bridge/bridge_process.h>
#include <wamcp/core/types.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <mutex>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace wamcp::bridge {

namespace fs = std::filesystem;

const char* toString(SupervisorState state) {
    switch (state) {
        case SupervisorState::NotStarted:
            return "not_started";
        case SupervisorState::Starting:
            return "starting";
        case SupervisorState::Running:
            return "running";
        case SupervisorState::StartFailed:
            return "start_failed";
        case SupervisorState::Stopped:
            return "stopped";
    }
    return "unknown";
}

std::optional<pid_t> findProcessByExecutableName(const std::string& name, pid_t exclude) {
    if (name.empty()) {
        return std::nullopt;
    }
    std::error_code ec;
    for (fs::directory_iterator it("/proc", ec), end; !ec && it != end; it.increment(ec)) {
        const auto entry = it->path().filename().string();
        if (entry.empty() || !std::all_of(entry.begin(), entry.end(), ::isdigit)) {
            continue;
        }
        const pid_t pid = static_cast<pid_t>(std::stol(entry));
        if (pid == exclude) {
            continue;
        }

        std::error_code linkEc;
        auto exe = fs::read_symlink(it->path() / "exe", linkEc);
        if (!linkEc) {
            if (exe.filename() == name) {
                return pid;
            }
            continue;
        }

        std::ifstream cmdline(it->path() / "cmdline", std::ios::binary);
        std::string argv0;
        if (cmdline && std::getline(cmdline, argv0, '\0') && !argv0.empty() &&
            fs::path(argv0).filename() == name) {
            return pid;
        }
    }
    return std::nullopt;
}

class BridgeProcess::Impl {
public:
    Impl(BridgeProcessConfig config, std::shared_ptr<OutputMonitor> monitor)
        : config_(std::move(config)), monitor_(std::move(monitor)) {}

    StartOutcome start();
    void stop() noexcept;
    bool isRunning();

    SupervisorState state() const { return state_.load(std::memory_order_acquire); }

    std::optional<pid_t> pid() const {
        std::lock_guard<std::mutex> lock(pidMutex_);
        return pid_;
    }

    std::optional<int> lastExitCode() const {
        std::lock_guard<std::mutex> lock(pidMutex_);
        return exitCode_;
    }

    const BridgeProcessConfig& config() const { return config_; }

private:
    StartOutcome fail(std::string message) {
        state_.store(SupervisorState::StartFailed, std::memory_order_release);
        spdlog::error("[BridgeProcess] {}", message);
        return {false, std::move(message)};
    }

    Result<pid_t> spawn(int& readFd);
    void stopLocked() noexcept;
    // Returns true once the owned child has been reaped. Caller holds pidMutex_.
    bool reapLocked();
    bool waitForExit(pid_t pid, std::chrono::milliseconds timeout);
    void stopReader();
    void awaitReaderEof(std::chrono::milliseconds grace);
    std::optional<std::string> drainForFatal();
    bool ownedAlive();

    BridgeProcessConfig config_;
    std::shared_ptr<OutputMonitor> monitor_;

    std::mutex lifecycleMutex_; // serializes start/stop
    mutable std::mutex pidMutex_;
    std::optional<pid_t> pid_;
    std::optional<int> exitCode_;
    std::atomic<SupervisorState> state_{SupervisorState::NotStarted};
    std::atomic<bool> readerDone_{false};
    std::jthread reader_;
};

bool BridgeProcess::Impl::reapLocked() {
    if (!pid_) {
        return true;
    }
    int status = 0;
    pid_t result = ::waitpid(*pid_, &status, WNOHANG);
    if (result == 0) {
        return false;
    }
    if (result > 0) {
        if (WIFEXITED(status)) {
            exitCode_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exitCode_ = 128 + WTERMSIG(status);
        }
    }
    // result < 0 (ECHILD): someone else reaped it; either way the child is gone
    pid_.reset();
    return true;
}

bool BridgeProcess::Impl::ownedAlive() {
    std::lock_guard<std::mutex> lock(pidMutex_);
    if (!pid_) {
        return false;
    }
    if (reapLocked()) {
        spdlog::warn("[BridgeProcess] Connector exited (code {})",
                     exitCode_ ? std::to_string(*exitCode_) : std::string("unknown"));
        if (state() == SupervisorState::Running) {
            state_.store(SupervisorState::Stopped, std::memory_order_release);
        }
        return false;
    }
    return true;
}

bool BridgeProcess::Impl::waitForExit(pid_t pid, std::chrono::milliseconds timeout) {
    auto start = std::chrono::steady_clock::now();
    do {
        int status = 0;
        pid_t result = ::waitpid(pid, &status, WNOHANG);
        if (result == pid || (result < 0 && errno == ECHILD)) {
            std::lock_guard<std::mutex> lock(pidMutex_);
            if (result == pid) {
                if (WIFEXITED(status)) {
                    exitCode_ = WEXITSTATUS(status);
                } else if (WIFSIGNALED(status)) {
                    exitCode_ = 128 + WTERMSIG(status);
                }
            }
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    } while (std::chrono::steady_clock::now() - start < timeout);
    return false;
}

Result<pid_t> BridgeProcess::Impl::spawn(int& readFd) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) < 0) {
        return Error{ErrorCode::ProcessError,
                     "Failed to create output pipe: " + std::string(std::strerror(errno))};
    }

    const std::string exe = config_.executable.string();
    const fs::path workdir = config_.workdir ? *config_.workdir : config_.executable.parent_path();

    // Everything the child needs is prepared before fork
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(exe.c_str()));
    for (const auto& arg : config_.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    const std::string workdirStr = workdir.string();

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        return Error{ErrorCode::ProcessError, "fork() failed: " + std::string(std::strerror(err))};
    }

    if (pid == 0) {
        // Child: new session makes it the leader of a fresh process group
        ::setsid();
        ::dup2(fds[1], STDOUT_FILENO);
        ::dup2(fds[1], STDERR_FILENO);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        if (!workdirStr.empty() && ::chdir(workdirStr.c_str()) < 0) {
            _exit(127);
        }
        ::execv(argv[0], argv.data());
        _exit(127);
    }

    ::close(fds[1]);
    readFd = fds[0];
    return pid;
}

void BridgeProcess::Impl::stopReader() {
    if (reader_.joinable()) {
        reader_.request_stop();
        reader_.join();
    }
}

// A dead child may still have unread output in the pipe; let the reader reach EOF unless a
// grandchild keeps the write end open.
void BridgeProcess::Impl::awaitReaderEof(std::chrono::milliseconds grace) {
    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (!readerDone_.load(std::memory_order_acquire) &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
    stopReader();
}

std::optional<std::string> BridgeProcess::Impl::drainForFatal() {
    std::string line;
    while (monitor_->lines().try_pop(line)) {
        for (const auto& fatal : config_.fatalMessages) {
            if (line.find(fatal) != std::string::npos) {
                return line;
            }
        }
    }
    return std::nullopt;
}

StartOutcome BridgeProcess::Impl::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);

    if (ownedAlive()) {
        return {true, "Bridge is already running"};
    }
    if (config_.detectExternalProcess) {
        if (auto other = findProcessByExecutableName(config_.executable.filename().string(),
                                                     ::getpid())) {
            spdlog::info("[BridgeProcess] Found unmanaged connector process (pid={})", *other);
            return {true, "Bridge is already running"};
        }
    }

    state_.store(SupervisorState::Starting, std::memory_order_release);

    std::error_code ec;
    if (!fs::is_regular_file(config_.executable, ec)) {
        return fail("Bridge executable not found at " + config_.executable.string());
    }
    if (::access(config_.executable.c_str(), X_OK) != 0) {
        fs::permissions(config_.executable,
                        fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                        fs::perm_options::add, ec);
        if (ec || ::access(config_.executable.c_str(), X_OK) != 0) {
            return fail("Bridge executable is not runnable: " + config_.executable.string() +
                        (ec ? " (" + ec.message() + ")" : std::string{}));
        }
    }

    // Previous session's reader must be gone before the channel is reused
    stopReader();
    monitor_->beginSession();
    (void)monitor_->lines().drain();

    int readFd = -1;
    auto spawned = spawn(readFd);
    if (!spawned) {
        return fail("Failed to start bridge: " + spawned.error().message);
    }
    const pid_t pid = spawned.value();
    {
        std::lock_guard<std::mutex> lock(pidMutex_);
        pid_ = pid;
        exitCode_.reset();
    }
    spdlog::info("[BridgeProcess] Spawned {} (pid={})", config_.executable.string(), pid);

    readerDone_.store(false, std::memory_order_release);
    reader_ = std::jthread([this, monitor = monitor_, readFd](std::stop_token stop) {
        monitor->pump(readFd, stop);
        ::close(readFd);
        readerDone_.store(true, std::memory_order_release);
    });

    const auto deadline = std::chrono::steady_clock::now() + config_.startupWindow;
    while (std::chrono::steady_clock::now() < deadline) {
        if (auto fatal = drainForFatal()) {
            stopLocked();
            return fail("Bridge failed to start: " + *fatal);
        }

        bool exited = false;
        std::optional<int> code;
        {
            std::lock_guard<std::mutex> lock(pidMutex_);
            exited = reapLocked();
            code = exitCode_;
        }
        if (exited) {
            awaitReaderEof(std::chrono::milliseconds{500});
            if (auto fatal = drainForFatal()) {
                return fail("Bridge failed to start: " + *fatal);
            }
            std::string message = "Bridge process exited during startup. Exit code: " +
                                  (code ? std::to_string(*code) : std::string("unknown"));
            auto recent = monitor_->recentLines();
            if (!recent.empty()) {
                message += ". Last output: " + recent.back();
            }
            return fail(std::move(message));
        }

        std::this_thread::sleep_for(config_.startupPollInterval);
    }

    state_.store(SupervisorState::Running, std::memory_order_release);
    spdlog::info("[BridgeProcess] Connector running (pid={})", pid);
    return {true, "Bridge started successfully (pid " + std::to_string(pid) + ")"};
}

void BridgeProcess::Impl::stopLocked() noexcept {
    std::optional<pid_t> pid;
    {
        std::lock_guard<std::mutex> lock(pidMutex_);
        pid = pid_;
    }

    if (pid) {
        spdlog::info("[BridgeProcess] Stopping connector (pid={})", *pid);
        if (::killpg(*pid, SIGTERM) < 0 && errno != ESRCH) {
            spdlog::warn("[BridgeProcess] SIGTERM to process group {} failed: {}", *pid,
                         std::strerror(errno));
        }
        if (!waitForExit(*pid, config_.stopTimeout)) {
            spdlog::warn("[BridgeProcess] Connector did not exit within {} ms, sending SIGKILL",
                         config_.stopTimeout.count());
            ::killpg(*pid, SIGKILL);
            if (!waitForExit(*pid, std::chrono::seconds{1})) {
                spdlog::error("[BridgeProcess] Connector (pid={}) could not be reaped", *pid);
            }
        }
        {
            std::lock_guard<std::mutex> lock(pidMutex_);
            pid_.reset();
        }
        state_.store(SupervisorState::Stopped, std::memory_order_release);
    }

    stopReader();
}

void BridgeProcess::Impl::stop() noexcept {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    stopLocked();
}

bool BridgeProcess::Impl::isRunning() {
    if (ownedAlive()) {
        return true;
    }
    if (!config_.detectExternalProcess) {
        return false;
    }
    if (auto other =
            findProcessByExecutableName(config_.executable.filename().string(), ::getpid())) {
        spdlog::debug("[BridgeProcess] Unmanaged connector process detected (pid={})", *other);
        return true;
    }
    return false;
}

BridgeProcess::BridgeProcess(BridgeProcessConfig config, std::shared_ptr<OutputMonitor> monitor)
    : impl_(std::make_unique<Impl>(std::move(config),
                                   monitor ? std::move(monitor)
                                           : std::make_shared<OutputMonitor>())) {}

BridgeProcess::~BridgeProcess() {
    stop();
}

StartOutcome BridgeProcess::start() {
    return impl_->start();
}

void BridgeProcess::stop() noexcept {
    impl_->stop();
}

bool BridgeProcess::isRunning() {
    return impl_->isRunning();
}

SupervisorState BridgeProcess::state() const {
    return impl_->state();
}

std::optional<pid_t> BridgeProcess::pid() const {
    return impl_->pid();
}

std::optional<int> BridgeProcess::lastExitCode() const {
    return impl_->lastExitCode();
}

const BridgeProcessConfig& BridgeProcess::config() const {
    return impl_->config();
}

} // namespace wamcp::bridge
