#pragma once

#include <string>
#include <core/types.hpp>
#include <platform/socket_util.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

// One authenticated SSH transport session. The session runs in blocking
// mode: every consumer (the SFTP subsystem) issues one request at a time.
class SessionManager {
public:
    explicit SessionManager(const TargetConfig& target);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    Result<void> establish(StatusCallback callback = nullptr);
    void close();
    bool is_active() const;

    LIBSSH2_SESSION* get_raw_session() { return session_; }

private:
    TargetConfig target_;
    LIBSSH2_SESSION* session_;
    socket_t sock_;
    bool active_;
    std::string target_str_;

    Result<void> verify_host_key();
    Result<void> ssh_userauth(StatusCallback callback);
    void teardown(const char* reason);
};
