#pragma once

#include <atomic>
#include <map>
#include <string>
#include <vector>
#include <core/cancellation.hpp>
#include <core/constants.hpp>
#include <core/types.hpp>

// Outcome of one supervised run. A cancelled run is never a success,
// whatever exit code the OS reported.
struct ProcessOutcome {
    int exit_code = -1;         // -1 when unknown
    bool started = false;
    bool cancelled = false;

    bool success() const { return started && !cancelled && exit_code == 0; }
};

enum class SupervisorState {
    NotStarted,
    Running,
    Completed,
    KillRequested,
    Killed,
    Faulted,
};

// Runs an external tool to completion, streaming its output line by line
// and force-killing it when cancellation is requested. Completion is
// polled every poll_interval_ms, which bounds the cancellation latency.
class ProcessSupervisor {
public:
    explicit ProcessSupervisor(int poll_interval_ms = PROCESS_POLL_INTERVAL_MS,
                               StatusCallback diagnostics = nullptr);

    // Throws std::invalid_argument if executable is blank or does not
    // exist. Output is redirected only for the streams that have a
    // callback; otherwise the child inherits the caller's terminal.
    // Callbacks run on reader threads, one per stream. Spawn and runtime
    // errors come back as a failed outcome.
    ProcessOutcome execute(const std::string& executable,
                           const std::vector<std::string>& args,
                           const std::map<std::string, std::string>& environment = {},
                           OutputCallback on_stdout = nullptr,
                           OutputCallback on_stderr = nullptr,
                           const CancellationToken& cancel = {});

    SupervisorState state() const { return state_.load(); }

private:
    int poll_interval_ms_;
    StatusCallback diagnostics_;
    std::atomic<SupervisorState> state_{SupervisorState::NotStarted};

    void report(const std::string& msg);
    void report_error(const std::string& msg);
};
