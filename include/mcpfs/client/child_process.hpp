#pragma once

#include <mcpfs/core/result.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace mcpfs {

// ---------------------------------------------------------------------------
// ChildProcess: a spawned subprocess with its three standard streams piped
// to the parent.
//
// Move-only. The destructor closes the pipes, kills a still-running child
// with SIGKILL and reaps it, so no zombie outlives the handle.
// ---------------------------------------------------------------------------
class ChildProcess {
public:
    // Fork and exec argv[0] (PATH lookup). A missing executable is reported
    // here as a Config error, not as a child that exits with 127.
    static Result<ChildProcess, Error> Spawn(const std::vector<std::string>& argv);

    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ~ChildProcess();

    [[nodiscard]] pid_t Pid() const noexcept { return pid_; }

    // Parent ends of the pipes; -1 once closed.
    [[nodiscard]] int StdinFd() const noexcept { return stdin_fd_; }
    [[nodiscard]] int StdoutFd() const noexcept { return stdout_fd_; }
    [[nodiscard]] int StderrFd() const noexcept { return stderr_fd_; }

    // Signals EOF to the child.
    void CloseStdin();

    // Send `signal` if the child has not been reaped yet.
    void Signal(int signal);

    // Wait up to `timeout` for exit. Returns the exit code (128 + signal
    // number when killed), or nullopt if still running.
    std::optional<int> WaitFor(std::chrono::milliseconds timeout);

    [[nodiscard]] bool IsRunning();

    [[nodiscard]] std::optional<int> ExitCode();

private:
    ChildProcess(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd);

    bool Reap(bool block);  // requires mutex_
    void Release();

    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    std::optional<int> exit_code_;
    std::unique_ptr<std::mutex> mutex_;
};

} // namespace mcpfs
