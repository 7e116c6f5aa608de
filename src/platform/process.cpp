#include "process.hpp"
#include "platform.hpp"

#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <fstream>
#include <map>
#include <fmt/format.h>

extern char** environ;

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    close_fds();
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
    pid_ = other.pid_;
    reaped_ = other.reaped_;
    stdout_fd_ = other.stdout_fd_;
    stderr_fd_ = other.stderr_fd_;
    other.pid_ = -1;
    other.stdout_fd_ = -1;
    other.stderr_fd_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        close_fds();
        pid_ = other.pid_;
        reaped_ = other.reaped_;
        stdout_fd_ = other.stdout_fd_;
        stderr_fd_ = other.stderr_fd_;
        other.pid_ = -1;
        other.stdout_fd_ = -1;
        other.stderr_fd_ = -1;
    }
    return *this;
}

void ProcessHandle::close_fds() {
    if (stdout_fd_ >= 0) { close(stdout_fd_); stdout_fd_ = -1; }
    if (stderr_fd_ >= 0) { close(stderr_fd_); stderr_fd_ = -1; }
}

static int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

WaitState ProcessHandle::try_wait(int& exit_code) {
    if (pid_ <= 0 || reaped_) return WaitState::Lost;

    int status = 0;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == 0) return WaitState::Running;
    if (ret == pid_) {
        reaped_ = true;
        exit_code = decode_status(status);
        return WaitState::Exited;
    }
    return WaitState::Lost;
}

bool ProcessHandle::kill() {
    if (pid_ <= 0 || reaped_) return false;
    return ::kill(pid_, SIGKILL) == 0;
}

bool ProcessHandle::reap(int timeout_ms) {
    if (pid_ <= 0) return false;
    if (reaped_) return true;

    int elapsed = 0;
    while (elapsed <= timeout_ms) {
        int status = 0;
        pid_t ret = waitpid(pid_, &status, WNOHANG);
        if (ret == pid_ || (ret < 0 && errno == ECHILD)) {
            reaped_ = true;
            return true;
        }
        sleep_ms(10);
        elapsed += 10;
    }
    return false;
}

// ── spawn ────────────────────────────────────────────────────

static void close_pipe(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
}

Result<ProcessHandle> spawn(const std::string& program,
                            const std::vector<std::string>& args,
                            const SpawnOptions& options) {
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};  // CLOEXEC: carries errno if exec fails

    if ((options.capture_stdout && pipe2(out_pipe, O_CLOEXEC) != 0) ||
        (options.capture_stderr && pipe2(err_pipe, O_CLOEXEC) != 0) ||
        pipe2(exec_pipe, O_CLOEXEC) != 0) {
        std::string err = strerror(errno);
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        close_pipe(exec_pipe);
        return Result<ProcessHandle>::Err("pipe failed: " + err);
    }

    // Build argv before forking; the child only calls async-signal-safe functions.
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    // Inherited environment with the overrides applied.
    std::map<std::string, std::string> env_map;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq == std::string::npos) continue;
        env_map[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    for (const auto& kv : options.environment) {
        env_map[kv.first] = kv.second;
    }
    std::vector<std::string> env_strings;
    env_strings.reserve(env_map.size());
    for (const auto& kv : env_map) {
        env_strings.push_back(kv.first + "=" + kv.second);
    }
    std::vector<const char*> envp;
    for (const auto& e : env_strings) envp.push_back(e.c_str());
    envp.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        std::string err = strerror(errno);
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        close_pipe(exec_pipe);
        return Result<ProcessHandle>::Err("fork failed: " + err);
    }

    if (pid == 0) {
        // Child process
        // The pipe ends are CLOEXEC; the dup2 copies are not.
        if (options.capture_stdout) dup2(out_pipe[1], STDOUT_FILENO);
        if (options.capture_stderr) dup2(err_pipe[1], STDERR_FILENO);

        execve(program.c_str(), const_cast<char* const*>(argv.data()),
               const_cast<char* const*>(envp.data()));

        int err = errno;
        ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);  // exec failed
    }

    // Parent
    close(exec_pipe[1]);
    if (options.capture_stdout) close(out_pipe[1]);
    if (options.capture_stderr) close(err_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(exec_pipe[0]);

    if (n > 0) {
        // exec failed in the child
        waitpid(pid, nullptr, 0);
        if (options.capture_stdout) close(out_pipe[0]);
        if (options.capture_stderr) close(err_pipe[0]);
        return Result<ProcessHandle>::Err(fmt::format("cannot execute '{}': {}", program,
                                                      strerror(child_errno)));
    }

    ProcessHandle handle;
    handle.pid_ = pid;
    handle.stdout_fd_ = options.capture_stdout ? out_pipe[0] : -1;
    handle.stderr_fd_ = options.capture_stderr ? err_pipe[0] : -1;
    return Result<ProcessHandle>::Ok(std::move(handle));
}

bool pid_alive(int pid) {
    if (pid <= 0) return false;
    if (::kill(pid, 0) != 0 && errno == ESRCH) return false;

    // A zombie still answers kill(0); check its state in /proc.
    std::ifstream stat(fmt::format("/proc/{}/stat", pid));
    if (!stat) return true;
    std::string line;
    std::getline(stat, line);
    auto close_paren = line.rfind(')');
    if (close_paren != std::string::npos && close_paren + 2 < line.size()) {
        char state = line[close_paren + 2];
        return state != 'Z' && state != 'X';
    }
    return true;
}

} // namespace platform
