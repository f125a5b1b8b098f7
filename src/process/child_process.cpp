#include "mcpipe/process/child_process.hpp"
#include "mcpipe/log/logger.hpp"

#include <sys/wait.h>
#include <poll.h>
#include <unistd.h>
#include <signal.h>
#include <fcntl.h>

#include <cerrno>
#include <cstring>

namespace mcpipe {

namespace {

constexpr auto kReapPollInterval = std::chrono::milliseconds(10);
constexpr int kStderrPollMs = 100;
constexpr std::size_t kStderrLineLimit = 64 * 1024;

TransportError make_error(TransportError::Category cat, const std::string& msg, std::optional<int> err = std::nullopt) {
    return TransportError{cat, msg, err};
}

void close_fd(int& fd) {
    if (fd != -1) {
        ::close(fd);
        fd = -1;
    }
}

void close_pair(int fds[2]) {
    close_fd(fds[0]);
    close_fd(fds[1]);
}

}  // namespace

bool is_safe_command(const std::string& command, const std::vector<std::string>& args) {
    if (command.empty()) {
        return false;
    }

    const std::string dangerous_chars = ";|&$`\\\"'<>(){}[]!#~";
    for (char c : command) {
        if (dangerous_chars.find(c) != std::string::npos) {
            return false;
        }
    }
    for (const auto& arg : args) {
        for (char c : arg) {
            if (dangerous_chars.find(c) != std::string::npos) {
                return false;
            }
        }
    }
    return true;
}

// ─────────────────────────────────────────────────────────────────────────────
// Spawn
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<std::unique_ptr<ChildProcess>> ChildProcess::spawn(ChildProcessConfig config) {
    if (!config.skip_command_validation && !is_safe_command(config.command, config.args)) {
        return tl::unexpected(make_error(
            TransportError::Category::Spawn,
            "Command validation failed: empty command or shell metacharacters in '" + config.command + "'"
        ));
    }

    // argv is built before fork(): the child may only call async-signal-safe
    // functions, so no allocation happens after the fork.
    std::vector<std::string> argv_storage;
    argv_storage.reserve(config.args.size() + 1);
    argv_storage.push_back(config.command);
    for (const auto& arg : config.args) {
        argv_storage.push_back(arg);
    }
    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& str : argv_storage) {
        argv.push_back(str.data());
    }
    argv.push_back(nullptr);

    // All pipes are close-on-exec so siblings spawned later never inherit our
    // ends; dup2 in the child clears the flag on 0/1/2.
    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};  // exec failure channel

    const bool capture = config.stderr_handling == StderrHandling::Capture;
    if (pipe2(stdin_pipe, O_CLOEXEC) == -1 ||
        pipe2(stdout_pipe, O_CLOEXEC) == -1 ||
        (capture && pipe2(stderr_pipe, O_CLOEXEC) == -1) ||
        pipe2(status_pipe, O_CLOEXEC) == -1) {
        const int err = errno;
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(status_pipe);
        return tl::unexpected(make_error(
            TransportError::Category::Spawn,
            "Failed to create pipes: " + std::string(strerror(err)), err
        ));
    }

    int devnull = -1;
    if (config.stderr_handling == StderrHandling::Discard) {
        devnull = ::open("/dev/null", O_WRONLY | O_CLOEXEC);
    }

    const pid_t pid = fork();
    if (pid == -1) {
        const int err = errno;
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(status_pipe);
        close_fd(devnull);
        return tl::unexpected(make_error(
            TransportError::Category::Spawn,
            "Failed to fork: " + std::string(strerror(err)), err
        ));
    }

    if (pid == 0) {
        // Child - async-signal-safe calls only
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        if (capture) {
            dup2(stderr_pipe[1], STDERR_FILENO);
        } else if (devnull != -1) {
            dup2(devnull, STDERR_FILENO);
        }

        // Default signal dispositions for the new program
        signal(SIGPIPE, SIG_DFL);

        execvp(argv[0], argv.data());

        int err = errno;
        ssize_t ignored = write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent
    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(status_pipe[1]);
    close_fd(devnull);

    // EOF on the status pipe means exec succeeded (the write end closed on exec)
    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n == -1 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {}
        close_fd(stdin_pipe[1]);
        close_fd(stdout_pipe[0]);
        close_fd(stderr_pipe[0]);
        return tl::unexpected(make_error(
            TransportError::Category::Spawn,
            "Failed to execute '" + config.command + "': " + std::string(strerror(exec_errno)),
            exec_errno
        ));
    }

    const std::string command = config.command;
    std::unique_ptr<ChildProcess> child(new ChildProcess(
        std::move(config), pid, stdin_pipe[1], stdout_pipe[0], stderr_pipe[0]));

    MCPIPE_LOG_INFO("Started process: " + command + " (pid " + std::to_string(pid) + ")");

    return child;
}

ChildProcess::ChildProcess(ChildProcessConfig config, pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd)
    : config_(std::move(config))
    , pid_(pid)
    , stdin_fd_(stdin_fd)
    , stdout_fd_(stdout_fd)
    , stderr_fd_(stderr_fd)
{
    if (stderr_fd_ != -1) {
        stderr_thread_ = std::thread([this] { stderr_reader_loop(); });
    }
}

ChildProcess::~ChildProcess() {
    terminate();
    close_fd(stdout_fd_);
}

// ─────────────────────────────────────────────────────────────────────────────
// Termination
// ─────────────────────────────────────────────────────────────────────────────

void ChildProcess::terminate() {
    {
        std::lock_guard lock(mutex_);
        if (terminated_) {
            return;
        }
        terminated_ = true;

        // Closing stdin gives a well-behaved server the chance to exit on EOF
        int in = stdin_fd_.exchange(-1);
        close_fd(in);

        if (!reaped_) {
            kill(pid_, SIGTERM);
            if (!wait_for_exit_locked(config_.shutdown_timeout)) {
                MCPIPE_LOG_WARN("Process " + std::to_string(pid_) + " ignored SIGTERM, sending SIGKILL");
                kill(pid_, SIGKILL);
                int status = 0;
                while (waitpid(pid_, &status, 0) == -1 && errno == EINTR) {}
                record_status_locked(status);
            }
        }
    }

    stderr_stop_ = true;
    if (stderr_thread_.joinable()) {
        stderr_thread_.join();
    }
    close_fd(stderr_fd_);

    MCPIPE_LOG_INFO("Stopped process: " + config_.command);
}

bool ChildProcess::wait_for_exit_locked(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        int status = 0;
        const pid_t result = waitpid(pid_, &status, WNOHANG);
        if (result == pid_) {
            record_status_locked(status);
            return true;
        }
        if (result == -1 && errno != EINTR) {
            // Already reaped elsewhere; nothing left to wait for
            reaped_ = true;
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(kReapPollInterval);
    }
}

void ChildProcess::record_status_locked(int status) {
    reaped_ = true;
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = -WTERMSIG(status);  // Negative indicates signal
    }
}

bool ChildProcess::is_alive() {
    std::lock_guard lock(mutex_);
    if (reaped_) {
        return false;
    }
    int status = 0;
    const pid_t result = waitpid(pid_, &status, WNOHANG);
    if (result == pid_) {
        record_status_locked(status);
        return false;
    }
    return result == 0;
}

std::optional<int> ChildProcess::exit_code() const {
    std::lock_guard lock(mutex_);
    return exit_code_;
}

// ─────────────────────────────────────────────────────────────────────────────
// Stderr capture
// ─────────────────────────────────────────────────────────────────────────────

void ChildProcess::stderr_reader_loop() {
    std::string line;
    char buffer[1024];

    auto emit = [this](const std::string& text) {
        if (config_.stderr_callback) {
            try {
                config_.stderr_callback(text);
            } catch (const std::exception& e) {
                MCPIPE_LOG_WARN(std::string("stderr callback threw: ") + e.what());
            }
        } else {
            MCPIPE_LOG_DEBUG("[" + config_.command + " stderr] " + text);
        }
    };

    // Polls with a timeout so terminate() can stop the thread even when a
    // grandchild keeps the pipe open.
    while (!stderr_stop_) {
        struct pollfd pfd{};
        pfd.fd = stderr_fd_;
        pfd.events = POLLIN;
        const int ready = poll(&pfd, 1, kStderrPollMs);
        if (ready == 0) {
            continue;
        }
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }

        const ssize_t n = ::read(stderr_fd_, buffer, sizeof(buffer));
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            break;
        }

        for (ssize_t i = 0; i < n; ++i) {
            if (buffer[i] == '\n') {
                emit(line);
                line.clear();
            } else if (line.size() < kStderrLineLimit) {
                line.push_back(buffer[i]);
            }
        }
    }

    if (!line.empty()) {
        emit(line);
    }
}

}  // namespace mcpipe
