#include "process_supervisor.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <filesystem>
#include <new>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

ProcessSupervisor::ProcessSupervisor(int poll_interval_ms, StatusCallback diagnostics)
    : poll_interval_ms_(poll_interval_ms > 0 ? poll_interval_ms : PROCESS_POLL_INTERVAL_MS),
      diagnostics_(std::move(diagnostics)) {
}

void ProcessSupervisor::report(const std::string& msg) {
    stagehand_log(msg);
    if (diagnostics_) diagnostics_(msg);
}

void ProcessSupervisor::report_error(const std::string& msg) {
    stagehand_log_error(msg);
    if (diagnostics_) diagnostics_(msg);
}

// ── Output pump ────────────────────────────────────────────

// Deliver complete lines from fd until EOF. Once exited is set, an idle
// poll also ends the pump: a grandchild may still hold the pipe open.
static void pump_lines(int fd, const OutputCallback& cb, const std::atomic<bool>& exited) {
    std::string pending;
    char buf[PROCESS_READ_BUF_SIZE];

    auto deliver = [&](std::string line) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        try {
            cb(line);
        } catch (const std::bad_alloc&) {
            throw;
        } catch (const std::exception& e) {
            stagehand_log_error(fmt::format("Output callback failed: {}", e.what()));
        }
    };

    for (;;) {
        struct pollfd pfd = {fd, POLLIN, 0};
        int rc = poll(&pfd, 1, OUTPUT_READ_POLL_MS);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) {
            if (exited.load()) break;
            continue;
        }

        ssize_t n = read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            break;
        }
        if (n == 0) break;

        pending.append(buf, static_cast<size_t>(n));
        size_t nl;
        while ((nl = pending.find('\n')) != std::string::npos) {
            deliver(pending.substr(0, nl));
            pending.erase(0, nl + 1);
        }
    }

    if (!pending.empty()) {
        deliver(pending);
    }
}

// ── Execute ────────────────────────────────────────────────

ProcessOutcome ProcessSupervisor::execute(const std::string& executable,
                                          const std::vector<std::string>& args,
                                          const std::map<std::string, std::string>& environment,
                                          OutputCallback on_stdout,
                                          OutputCallback on_stderr,
                                          const CancellationToken& cancel) {
    if (is_blank(executable)) {
        throw std::invalid_argument("Executable path must not be empty");
    }
    if (!fs::exists(executable)) {
        throw std::invalid_argument(fmt::format("The executable file '{}' does not exist", executable));
    }

    ProcessOutcome outcome;
    state_ = SupervisorState::NotStarted;
    std::string command = format_command_line(executable, args);

    if (cancel.is_cancelled()) {
        report(fmt::format("Cancellation is requested, not starting {}", command));
        outcome.cancelled = true;
        return outcome;
    }

    report(fmt::format("Executing: {}", command));

    platform::SpawnOptions options;
    options.capture_stdout = static_cast<bool>(on_stdout);
    options.capture_stderr = static_cast<bool>(on_stderr);
    options.environment = environment;

    platform::ProcessHandle handle;
    try {
        auto spawned = platform::spawn(executable, args, options);
        if (spawned.is_err()) {
            report_error(fmt::format("Could not start {}: {}", command, spawned.error));
            state_ = SupervisorState::Faulted;
            return outcome;
        }
        handle = std::move(spawned.value);
    } catch (const std::bad_alloc&) {
        throw;
    } catch (const std::exception& e) {
        report_error(fmt::format("Could not start {}: {}", command, e.what()));
        state_ = SupervisorState::Faulted;
        return outcome;
    }

    outcome.started = true;
    state_ = SupervisorState::Running;
    int pid = handle.pid();

    std::atomic<bool> exited{false};
    std::thread out_reader;
    std::thread err_reader;
    try {
        if (handle.stdout_fd() >= 0) {
            out_reader = std::thread(pump_lines, handle.stdout_fd(), std::cref(on_stdout), std::cref(exited));
        }
        if (handle.stderr_fd() >= 0) {
            err_reader = std::thread(pump_lines, handle.stderr_fd(), std::cref(on_stderr), std::cref(exited));
        }
    } catch (const std::system_error& e) {
        report_error(fmt::format("Could not start output readers for {}: {}", command, e.what()));
        if (!handle.kill() || !handle.reap(PROCESS_REAP_TIMEOUT_MS)) {
            report_error(fmt::format("Could not stop process with ID {} '{}'", pid, command));
        }
        exited = true;
        if (out_reader.joinable()) out_reader.join();
        state_ = SupervisorState::Faulted;
        return outcome;
    }

    bool completed = false;
    bool lost = false;
    bool cancel_observed = false;
    int exit_code = -1;
    for (;;) {
        platform::WaitState w = handle.try_wait(exit_code);
        if (w == platform::WaitState::Exited) {
            completed = true;
            break;
        }
        if (w == platform::WaitState::Lost) {
            lost = true;
            break;
        }
        if (cancel.is_cancelled()) {
            cancel_observed = true;
            break;
        }
        platform::sleep_ms(poll_interval_ms_);
    }

    if (cancel_observed) {
        state_ = SupervisorState::KillRequested;
        report(fmt::format("Cancellation is requested, trying to kill process {}", command));
        if (handle.kill()) {
            report_error(fmt::format("Killed process with ID {} '{}' because cancellation was requested",
                                     pid, command));
        } else {
            report_error(fmt::format("Could not kill process with ID {} '{}'", pid, command));
        }
        if (handle.reap(PROCESS_REAP_TIMEOUT_MS)) {
            state_ = SupervisorState::Killed;
        }
    }

    exited = true;
    if (out_reader.joinable()) out_reader.join();
    if (err_reader.joinable()) err_reader.join();

    // A request that lands after the child exited is a no-op.
    outcome.cancelled = cancel_observed;

    if (lost) {
        report_error(fmt::format("Lost track of process with ID {} '{}' before it completed", pid, command));
        state_ = SupervisorState::Faulted;
        return outcome;
    }

    // A reaped pid may already belong to another process, so only an
    // unreaped child is checked for liveness.
    if (!handle.reaped() && platform::pid_alive(pid)) {
        report_error(fmt::format("The process with ID {} '{}' is still running", pid, command));
        return outcome;
    }

    if (completed) {
        outcome.exit_code = exit_code;
        state_ = SupervisorState::Completed;
        report(fmt::format("Process '{}' exited with code {}", command, exit_code));
    }
    return outcome;
}
