#pragma once

#include <map>
#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

struct SpawnOptions {
    bool capture_stdout = false;    // pipe stdout back to the parent
    bool capture_stderr = false;    // pipe stderr back to the parent
    std::map<std::string, std::string> environment;  // added to the inherited environment
};

// Result of a non-blocking wait on a child.
enum class WaitState {
    Running,
    Exited,
    Lost,       // the child can no longer be waited on (reaped elsewhere)
};

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // Non-blocking reap. On Exited, exit_code holds the exit status
    // (128 + signal for a signalled child).
    WaitState try_wait(int& exit_code);

    // Forced termination (SIGKILL by pid). Returns false if the signal
    // could not be delivered.
    bool kill();

    // Wait up to timeout_ms for the child to be reaped after kill().
    bool reap(int timeout_ms);

    int pid() const { return pid_; }
    bool reaped() const { return reaped_; }

    // Read ends of the captured pipes (-1 when not captured). The handle
    // keeps ownership; they are closed on destruction.
    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }

private:
    int pid_ = -1;
    bool reaped_ = false;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;

    void close_fds();

    friend Result<ProcessHandle> spawn(const std::string& program,
                                       const std::vector<std::string>& args,
                                       const SpawnOptions& options);
};

// Spawn a child process. Fails (without a handle) when fork fails or the
// program cannot be executed.
Result<ProcessHandle> spawn(const std::string& program,
                            const std::vector<std::string>& args,
                            const SpawnOptions& options = {});

// True if pid names a live process that is not a zombie.
bool pid_alive(int pid);

} // namespace platform
