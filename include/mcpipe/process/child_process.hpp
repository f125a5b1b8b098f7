#pragma once

// Platform check - ChildProcess requires POSIX APIs
#if !defined(__unix__) && !defined(__APPLE__) && !defined(__linux__)
#error "ChildProcess is only available on POSIX-compatible systems (Linux, macOS, BSD)"
#endif

#include "mcpipe/transport.hpp"

#include <tl/expected.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <sys/types.h>  // For pid_t

namespace mcpipe {

// ═══════════════════════════════════════════════════════════════════════════
// Child Process Configuration
// ═══════════════════════════════════════════════════════════════════════════

/// What happens to the child's stderr
enum class StderrHandling {
    Discard,     // Redirect to /dev/null (default)
    Passthrough, // Inherit the parent's stderr
    Capture      // Read line by line and hand to stderr_callback (or the logger)
};

/// Receives one captured stderr line, without the trailing newline
using StderrCallback = std::function<void(std::string_view)>;

struct ChildProcessConfig {
    std::string command;                     // Resolved through PATH by execvp
    std::vector<std::string> args;
    StderrHandling stderr_handling{StderrHandling::Discard};
    StderrCallback stderr_callback;          // Capture only; runs on the stderr reader thread

    /// Grace period between SIGTERM and SIGKILL
    std::chrono::milliseconds shutdown_timeout{500};

    // Skips the metacharacter check on command and arguments.
    // Only for trusted callers (tests, paths built by the program itself).
    bool skip_command_validation{false};
};

// ═══════════════════════════════════════════════════════════════════════════
// Child Process
// ═══════════════════════════════════════════════════════════════════════════
// Owns one spawned process and the parent ends of its stdin/stdout pipes.
//
// The stdout descriptor stays open until destruction so a reader blocked on
// it never races with descriptor reuse; terminate() closes stdin and reaps the
// process, after which the reader sees EOF. Callers must stop writing before
// terminate() (FrameCodec::shutdown does that).

class ChildProcess {
public:
    /// Fork and exec `config.command`. A missing or non-executable binary is
    /// reported here as a Spawn error, not as a later EOF.
    [[nodiscard]] static TransportResult<std::unique_ptr<ChildProcess>> spawn(ChildProcessConfig config);

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&&) = delete;
    ChildProcess& operator=(ChildProcess&&) = delete;

    /// Close stdin, SIGTERM, wait up to shutdown_timeout, SIGKILL, reap.
    /// Safe to call more than once and from several threads.
    void terminate();

    /// Parent end of the child's stdin; -1 once terminate() ran
    [[nodiscard]] int stdin_fd() const noexcept { return stdin_fd_.load(); }

    /// Parent end of the child's stdout; valid for the object's lifetime
    [[nodiscard]] int stdout_fd() const noexcept { return stdout_fd_; }

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

    [[nodiscard]] const std::string& command() const noexcept { return config_.command; }

    /// Non-blocking; reaps the child if it has exited
    [[nodiscard]] bool is_alive();

    /// Exit status once reaped: exit code, or the negated signal number
    [[nodiscard]] std::optional<int> exit_code() const;

private:
    ChildProcess(ChildProcessConfig config, pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd);

    void stderr_reader_loop();
    void record_status_locked(int status);
    bool wait_for_exit_locked(std::chrono::milliseconds timeout);

    ChildProcessConfig config_;
    pid_t pid_{-1};
    std::atomic<int> stdin_fd_{-1};
    int stdout_fd_{-1};
    int stderr_fd_{-1};

    mutable std::mutex mutex_;
    bool reaped_{false};
    bool terminated_{false};
    std::optional<int> exit_code_;

    std::thread stderr_thread_;
    std::atomic<bool> stderr_stop_{false};
};

/// Rejects empty commands and shell metacharacters in command or arguments
[[nodiscard]] bool is_safe_command(const std::string& command, const std::vector<std::string>& args);

}  // namespace mcpipe
