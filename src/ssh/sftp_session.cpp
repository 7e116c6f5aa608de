#include "sftp_session.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <fmt/format.h>
#include <fstream>
#include <system_error>

SftpSession::SftpSession(std::unique_ptr<SessionManager> session)
    : session_(std::move(session)), sftp_(nullptr) {
}

SftpSession::~SftpSession() {
    close();
}

std::unique_ptr<SftpSession> SftpSession::connect(const TargetConfig& target,
                                                  StatusCallback callback) {
    auto manager = std::make_unique<SessionManager>(target);
    auto established = manager->establish(callback);
    if (established.is_err()) {
        throw TransportError(fmt::format("Could not connect to {}: {}", target.host, established.error));
    }

    std::unique_ptr<SftpSession> session(new SftpSession(std::move(manager)));
    session->sftp_ = libssh2_sftp_init(session->session_->get_raw_session());
    if (!session->sftp_) {
        throw TransportError(fmt::format("Could not open SFTP subsystem on {}", target.host));
    }

    if (callback) callback("SFTP session ready");
    return session;
}

void SftpSession::close() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_ && session_->is_active()) {
        session_->close();
    }
}

std::string SftpSession::last_error() const {
    if (!sftp_) return "no SFTP session";
    return fmt::format("SFTP status {}", libssh2_sftp_last_error(sftp_));
}

// ── Queries ────────────────────────────────────────────────

bool SftpSession::stat_kind(const std::string& path, bool& is_dir) {
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    int rc = libssh2_sftp_stat(sftp_, path.c_str(), &attrs);
    if (rc != 0) {
        if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL &&
            libssh2_sftp_last_error(sftp_) == LIBSSH2_FX_NO_SUCH_FILE) {
            return false;
        }
        throw TransportError(fmt::format("stat '{}' failed: {}", path, last_error()));
    }
    is_dir = (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) &&
             LIBSSH2_SFTP_S_ISDIR(attrs.permissions);
    return true;
}

bool SftpSession::directory_exists(const RemotePath& dir) {
    bool is_dir = false;
    return stat_kind(dir.path(), is_dir) && is_dir;
}

bool SftpSession::file_exists(const RemotePath& file) {
    bool is_dir = false;
    return stat_kind(file.path(), is_dir) && !is_dir;
}

void SftpSession::list_into(const RemotePath& dir, bool recursive, std::vector<RemotePath>& out) {
    LIBSSH2_SFTP_HANDLE* handle = libssh2_sftp_opendir(sftp_, dir.path().c_str());
    if (!handle) {
        throw TransportError(fmt::format("opendir '{}' failed: {}", dir.path(), last_error()));
    }

    std::vector<RemotePath> subdirs;
    char name[SFTP_PATH_BUF_SIZE];
    for (;;) {
        LIBSSH2_SFTP_ATTRIBUTES attrs;
        int n = libssh2_sftp_readdir(handle, name, sizeof(name), &attrs);
        if (n == 0) break;
        if (n < 0) {
            libssh2_sftp_closedir(handle);
            throw TransportError(fmt::format("readdir '{}' failed: {}", dir.path(), last_error()));
        }

        std::string entry(name, static_cast<size_t>(n));
        if (entry == "." || entry == "..") continue;

        bool is_dir = (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) &&
                      LIBSSH2_SFTP_S_ISDIR(attrs.permissions);
        RemotePath child = dir.append(RemotePath(entry, is_dir ? RemoteEntryKind::Directory
                                                               : RemoteEntryKind::File));
        out.push_back(child);
        if (is_dir) subdirs.push_back(child);
    }
    libssh2_sftp_closedir(handle);

    if (recursive) {
        for (const auto& sub : subdirs) {
            list_into(sub, true, out);
        }
    }
}

std::vector<RemotePath> SftpSession::list(const RemotePath& dir, bool recursive) {
    std::vector<RemotePath> out;
    list_into(dir, recursive, out);
    return out;
}

// ── Structural operations ──────────────────────────────────

void SftpSession::create_directory(const RemotePath& dir) {
    if (dir.is_root()) return;

    // mkdir -p: walk the segments, creating what is missing
    std::string current;
    const std::string& path = dir.path();
    size_t start = 1;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) end = path.size();
        current = path.substr(0, end);
        start = end + 1;

        bool is_dir = false;
        if (stat_kind(current, is_dir)) {
            if (!is_dir) {
                throw TransportError(fmt::format("'{}' exists and is not a directory", current));
            }
            continue;
        }
        int rc = libssh2_sftp_mkdir(sftp_, current.c_str(),
                                    LIBSSH2_SFTP_S_IRWXU | LIBSSH2_SFTP_S_IRGRP |
                                    LIBSSH2_SFTP_S_IXGRP | LIBSSH2_SFTP_S_IROTH |
                                    LIBSSH2_SFTP_S_IXOTH);
        if (rc != 0) {
            throw TransportError(fmt::format("mkdir '{}' failed: {}", current, last_error()));
        }
    }
}

void SftpSession::delete_file(const RemotePath& file) {
    if (libssh2_sftp_unlink(sftp_, file.path().c_str()) != 0) {
        throw TransportError(fmt::format("unlink '{}' failed: {}", file.path(), last_error()));
    }
}

void SftpSession::delete_directory(const RemotePath& dir, bool recursive) {
    if (recursive) {
        std::vector<RemotePath> children;
        list_into(dir, false, children);
        for (const auto& child : children) {
            if (child.is_directory()) {
                delete_directory(child, true);
            } else {
                delete_file(child);
            }
        }
    }
    if (libssh2_sftp_rmdir(sftp_, dir.path().c_str()) != 0) {
        throw TransportError(fmt::format("rmdir '{}' failed: {}", dir.path(), last_error()));
    }
}

// ── Transfers ──────────────────────────────────────────────

void SftpSession::upload_file(const fs::path& local, const RemotePath& remote,
                              bool overwrite, bool verify) {
    std::error_code ec;
    auto local_size = fs::file_size(local, ec);
    if (ec) {
        throw TransportError(fmt::format("Cannot read local file '{}': {}", local.string(), ec.message()));
    }

    if (!overwrite && file_exists(remote)) {
        stagehand_log(fmt::format("sftp: skip existing {}", remote.path()));
        return;
    }

    std::ifstream in(local, std::ios::binary);
    if (!in) {
        throw TransportError(fmt::format("Cannot open local file '{}'", local.string()));
    }

    LIBSSH2_SFTP_HANDLE* fh = libssh2_sftp_open(sftp_, remote.path().c_str(),
        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
        LIBSSH2_SFTP_S_IRUSR | LIBSSH2_SFTP_S_IWUSR |
        LIBSSH2_SFTP_S_IRGRP | LIBSSH2_SFTP_S_IROTH);
    if (!fh) {
        throw TransportError(fmt::format("Cannot open '{}' for writing: {}", remote.path(), last_error()));
    }

    char buf[SFTP_TRANSFER_BUF_SIZE];
    while (in) {
        in.read(buf, sizeof(buf));
        std::streamsize got = in.gcount();
        std::streamsize sent = 0;
        while (sent < got) {
            ssize_t w = libssh2_sftp_write(fh, buf + sent, static_cast<size_t>(got - sent));
            if (w < 0) {
                libssh2_sftp_close(fh);
                throw TransportError(fmt::format("Write to '{}' failed: {}", remote.path(), last_error()));
            }
            sent += w;
        }
    }
    libssh2_sftp_close(fh);

    if (verify) {
        LIBSSH2_SFTP_ATTRIBUTES attrs;
        bool size_ok = libssh2_sftp_stat(sftp_, remote.path().c_str(), &attrs) == 0 &&
                       (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) &&
                       attrs.filesize == local_size;
        if (!size_ok) {
            libssh2_sftp_unlink(sftp_, remote.path().c_str());
            throw TransportError(fmt::format("Verification of '{}' failed, remote copy removed",
                                             remote.path()));
        }
    }
}

int SftpSession::upload_files(const std::vector<fs::path>& locals, const RemotePath& remote_dir,
                              bool overwrite, bool verify) {
    if (!directory_exists(remote_dir)) {
        create_directory(remote_dir);
    }

    int uploaded = 0;
    for (const auto& local : locals) {
        RemotePath target = remote_dir.append(RemotePath(local.filename().string(), RemoteEntryKind::File));
        try {
            upload_file(local, target, overwrite, verify);
            uploaded++;
        } catch (const TransportError& e) {
            stagehand_log_error(fmt::format("sftp: upload of {} failed: {}", local.string(), e.what()));
        }
    }
    return uploaded;
}
