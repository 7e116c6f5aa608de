#include "session.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <cstring>
#include <filesystem>
#include <mutex>

// Password handed to the keyboard-interactive callback via the session
// abstract pointer.
struct KbdAuthData {
    std::string password;
    StatusCallback callback;
};

// libssh2 keyboard-interactive callback: answer every prompt with the password.
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
}

// libssh2_init is process-wide; run it once.
static int init_libssh2() {
    static std::once_flag once;
    static int rc = 0;
    std::call_once(once, [] { rc = libssh2_init(0); });
    return rc;
}

SessionManager::SessionManager(const TargetConfig& target)
    : target_(target), session_(nullptr), sock_(STAGEHAND_INVALID_SOCKET), active_(false) {
}

SessionManager::~SessionManager() {
    close();
}

Result<void> SessionManager::establish(StatusCallback callback) {
    if (callback) {
        callback("Connecting to " + target_.host + "...");
    }

    if (init_libssh2() != 0) {
        return Result<void>::Err("Failed to initialize libssh2");
    }

    auto sock = platform::connect_tcp(target_.host, target_.port, target_.timeout * 1000);
    if (sock.is_err()) {
        return Result<void>::Err(sock.error);
    }
    sock_ = sock.value;

    if (callback) callback("TCP connected, starting SSH handshake...");

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        teardown("Session init failed");
        return Result<void>::Err("Failed to create SSH session");
    }

    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, static_cast<long>(target_.timeout) * 1000);

    if (libssh2_session_handshake(session_, sock_) != 0) {
        teardown("Handshake failed");
        return Result<void>::Err("SSH handshake failed with " + target_.host);
    }

    platform::enable_keepalive(sock_);
    libssh2_keepalive_config(session_, 1, 30);

    if (target_.secure) {
        auto host_check = verify_host_key();
        if (host_check.is_err()) {
            teardown("Host key rejected");
            return host_check;
        }
    }

    if (callback) callback("SSH handshake complete, authenticating...");

    auto auth_result = ssh_userauth(callback);
    if (auth_result.is_err()) {
        teardown("Authentication failed");
        return auth_result;
    }

    active_ = true;
    target_str_ = target_.user + "@" + target_.host;
    stagehand_log(fmt::format("SessionManager: connected to {}:{}", target_str_, target_.port));

    if (callback) {
        callback("Connected to " + target_.host);
    }

    return Result<void>::Ok();
}

// Strict host verification: the server key must be listed in
// ~/.ssh/known_hosts and must match.
Result<void> SessionManager::verify_host_key() {
    size_t key_len = 0;
    int key_type = 0;
    const char* key = libssh2_session_hostkey(session_, &key_len, &key_type);
    if (!key) {
        return Result<void>::Err("Server did not present a host key");
    }

    LIBSSH2_KNOWNHOSTS* hosts = libssh2_knownhost_init(session_);
    if (!hosts) {
        return Result<void>::Err("Failed to initialize known_hosts check");
    }

    std::string known_hosts = (platform::home_dir() / ".ssh" / "known_hosts").string();
    if (libssh2_knownhost_readfile(hosts, known_hosts.c_str(),
                                   LIBSSH2_KNOWNHOST_FILE_OPENSSH) < 0) {
        libssh2_knownhost_free(hosts);
        return Result<void>::Err("Cannot read " + known_hosts);
    }

    struct libssh2_knownhost* found = nullptr;
    int check = libssh2_knownhost_checkp(hosts, target_.host.c_str(), target_.port,
                                         key, key_len,
                                         LIBSSH2_KNOWNHOST_TYPE_PLAIN |
                                         LIBSSH2_KNOWNHOST_KEYENC_RAW,
                                         &found);
    libssh2_knownhost_free(hosts);

    switch (check) {
    case LIBSSH2_KNOWNHOST_CHECK_MATCH:
        return Result<void>::Ok();
    case LIBSSH2_KNOWNHOST_CHECK_MISMATCH:
        return Result<void>::Err("Host key for " + target_.host + " does not match known_hosts");
    case LIBSSH2_KNOWNHOST_CHECK_NOTFOUND:
        return Result<void>::Err("Host " + target_.host + " is not in known_hosts");
    default:
        return Result<void>::Err("Host key check failed for " + target_.host);
    }
}

Result<void> SessionManager::ssh_userauth(StatusCallback callback) {
    char* auth_list = libssh2_userauth_list(session_, target_.user.c_str(),
                                            static_cast<unsigned int>(target_.user.length()));
    std::string methods = auth_list ? auth_list : "";
    if (callback && !methods.empty()) {
        callback("Auth methods: " + methods);
    }

    if (target_.ssh_key_path && methods.find("publickey") != std::string::npos) {
        if (callback) callback("Using public key auth...");
        const char* passphrase = target_.password.empty() ? nullptr : target_.password.c_str();
        int ret = libssh2_userauth_publickey_fromfile(session_, target_.user.c_str(), nullptr,
                                                      target_.ssh_key_path->c_str(), passphrase);
        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return Result<void>::Ok();
        }
        if (callback) callback("Public key rejected, trying password...");
    }

    if (methods.empty() || methods.find("password") != std::string::npos) {
        if (callback) callback("Using password auth...");
        int ret = libssh2_userauth_password(session_, target_.user.c_str(), target_.password.c_str());
        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return Result<void>::Ok();
        }
    }

    if (methods.find("keyboard-interactive") != std::string::npos) {
        if (callback) callback("Using keyboard-interactive auth...");

        KbdAuthData kbd_data;
        kbd_data.password = target_.password;
        kbd_data.callback = callback;
        *libssh2_session_abstract(session_) = &kbd_data;

        int ret = libssh2_userauth_keyboard_interactive(session_, target_.user.c_str(), kbd_callback);
        *libssh2_session_abstract(session_) = nullptr;
        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return Result<void>::Ok();
        }
    }

    return Result<void>::Err("Authentication failed for " + target_.user + "@" + target_.host);
}

void SessionManager::teardown(const char* reason) {
    if (session_) {
        libssh2_session_disconnect(session_, reason);
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != STAGEHAND_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = STAGEHAND_INVALID_SOCKET;
    }
}

void SessionManager::close() {
    active_ = false;
    teardown("Normal disconnection");
}

bool SessionManager::is_active() const {
    return active_;
}
