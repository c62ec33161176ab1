#include <mcpfs/client/child_process.hpp>

#include <mcpfs/core/log.hpp>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace mcpfs {

namespace {

constexpr const char* kSpawnOp = "ChildProcess::Spawn";

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Writes to a dead child must surface as EPIPE, not kill the parent.
void IgnoreSigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

int DecodeWaitStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // anonymous namespace

Result<ChildProcess, Error> ChildProcess::Spawn(const std::vector<std::string>& argv) {
    using R = Result<ChildProcess, Error>;
    if (argv.empty() || argv[0].empty()) {
        return R::Err(Error::Make(ErrorCategory::Config, kSpawnOp, "",
                                  "Server command must not be empty"));
    }
    IgnoreSigpipe();

    int in_pipe[2]{-1, -1};
    int out_pipe[2]{-1, -1};
    int err_pipe[2]{-1, -1};
    int exec_pipe[2]{-1, -1};  // reports exec failure errno, closed on exec
    auto close_all = [&] {
        for (int* p : {in_pipe, out_pipe, err_pipe, exec_pipe}) {
            CloseFd(p[0]);
            CloseFd(p[1]);
        }
    };

    if (::pipe2(in_pipe, O_CLOEXEC) != 0 || ::pipe2(out_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(err_pipe, O_CLOEXEC) != 0 || ::pipe2(exec_pipe, O_CLOEXEC) != 0) {
        auto msg = std::string("pipe() failed: ") + std::strerror(errno);
        close_all();
        return R::Err(Error::Make(ErrorCategory::Io, kSpawnOp, argv[0], msg));
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) {
        cargv.push_back(const_cast<char*>(a.c_str()));
    }
    cargv.push_back(nullptr);

    auto pid = ::fork();
    if (pid < 0) {
        auto msg = std::string("fork() failed: ") + std::strerror(errno);
        close_all();
        return R::Err(Error::Make(ErrorCategory::Io, kSpawnOp, argv[0], msg));
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on.
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::signal(SIGPIPE, SIG_DFL);
        ::execvp(cargv[0], cargv.data());
        int err = errno;
        auto written = ::write(exec_pipe[1], &err, sizeof(err));
        (void)written;
        ::_exit(127);
    }

    CloseFd(in_pipe[0]);
    CloseFd(out_pipe[1]);
    CloseFd(err_pipe[1]);
    CloseFd(exec_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    CloseFd(exec_pipe[0]);

    if (n > 0) {
        ::waitpid(pid, nullptr, 0);
        close_all();
        return R::Err(Error::Make(ErrorCategory::Config, kSpawnOp, argv[0],
                                  "Cannot execute '" + argv[0] + "': " +
                                      std::strerror(child_errno)));
    }

    LogDebug("child", "Spawned '" + argv[0] + "' as pid " + std::to_string(pid));
    return R::Ok(ChildProcess(pid, in_pipe[1], out_pipe[0], err_pipe[0]));
}

ChildProcess::ChildProcess(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd)
    : pid_(pid), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd),
      mutex_(std::make_unique<std::mutex>()) {}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(other.pid_), stdin_fd_(other.stdin_fd_), stdout_fd_(other.stdout_fd_),
      stderr_fd_(other.stderr_fd_), exit_code_(other.exit_code_),
      mutex_(std::move(other.mutex_)) {
    other.pid_ = -1;
    other.stdin_fd_ = other.stdout_fd_ = other.stderr_fd_ = -1;
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        Release();
        pid_ = other.pid_;
        stdin_fd_ = other.stdin_fd_;
        stdout_fd_ = other.stdout_fd_;
        stderr_fd_ = other.stderr_fd_;
        exit_code_ = other.exit_code_;
        mutex_ = std::move(other.mutex_);
        other.pid_ = -1;
        other.stdin_fd_ = other.stdout_fd_ = other.stderr_fd_ = -1;
    }
    return *this;
}

ChildProcess::~ChildProcess() {
    Release();
}

void ChildProcess::Release() {
    CloseFd(stdin_fd_);
    CloseFd(stdout_fd_);
    CloseFd(stderr_fd_);
    if (pid_ > 0 && mutex_) {
        std::lock_guard<std::mutex> lock(*mutex_);
        if (!exit_code_.has_value()) {
            ::kill(pid_, SIGKILL);
            Reap(true);
        }
    }
    pid_ = -1;
}

void ChildProcess::CloseStdin() {
    CloseFd(stdin_fd_);
}

void ChildProcess::Signal(int signal) {
    if (pid_ <= 0 || !mutex_) return;
    std::lock_guard<std::mutex> lock(*mutex_);
    if (!exit_code_.has_value()) {
        ::kill(pid_, signal);
    }
}

bool ChildProcess::Reap(bool block) {
    if (exit_code_.has_value() || pid_ <= 0) return true;
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (r < 0 && errno == EINTR);
    if (r == pid_) {
        exit_code_ = DecodeWaitStatus(status);
        return true;
    }
    if (r < 0) {
        // ECHILD: reaped elsewhere; nothing left to wait for.
        exit_code_ = -1;
        return true;
    }
    return false;
}

std::optional<int> ChildProcess::WaitFor(std::chrono::milliseconds timeout) {
    if (pid_ <= 0 || !mutex_) return exit_code_;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        {
            std::lock_guard<std::mutex> lock(*mutex_);
            if (Reap(false)) return exit_code_;
        }
        if (std::chrono::steady_clock::now() >= deadline) return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

bool ChildProcess::IsRunning() {
    if (pid_ <= 0 || !mutex_) return false;
    std::lock_guard<std::mutex> lock(*mutex_);
    return !Reap(false);
}

std::optional<int> ChildProcess::ExitCode() {
    if (!mutex_) return exit_code_;
    std::lock_guard<std::mutex> lock(*mutex_);
    Reap(false);
    return exit_code_;
}

} // namespace mcpfs
