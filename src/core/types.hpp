#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>
#include "constants.hpp"

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Configuration structures

// Connection parameters for the remote publish target. Credentials are
// opaque to the engine; they are only handed to the SSH layer.
struct TargetConfig {
    std::string host;
    int port = SSH_DEFAULT_PORT;
    std::string user;
    std::string password;
    std::optional<std::string> ssh_key_path;
    bool secure = false;                         // require a known_hosts match
    int timeout = SSH_CONNECT_TIMEOUT_SECS;
    std::string base_path = "/";                 // remote root of the site
};

struct PublishConfig {
    int batch_size = DEFAULT_BATCH_SIZE;
    int max_attempts = DEFAULT_MAX_ATTEMPTS;
    bool prune_directories = false;              // delete remote dirs with no local counterpart
};

struct ToolConfig {
    std::string path;                            // deployment tool executable
    std::vector<std::string> args;
    std::map<std::string, std::string> environment;
    int poll_interval_ms = PROCESS_POLL_INTERVAL_MS;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;

// Line-oriented output callback for supervised processes
using OutputCallback = std::function<void(const std::string&)>;
