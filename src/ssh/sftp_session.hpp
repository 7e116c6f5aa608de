#pragma once

#include <memory>
#include <string>
#include <core/types.hpp>
#include "remote_session.hpp"
#include "session.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SFTP LIBSSH2_SFTP;

// RemoteSession over the SFTP subsystem of one SSH session.
class SftpSession : public RemoteSession {
public:
    ~SftpSession() override;

    SftpSession(const SftpSession&) = delete;
    SftpSession& operator=(const SftpSession&) = delete;

    // Connect, authenticate and open the SFTP subsystem.
    // Throws TransportError when the session cannot be established.
    static std::unique_ptr<SftpSession> connect(const TargetConfig& target,
                                                StatusCallback callback = nullptr);

    bool directory_exists(const RemotePath& dir) override;
    bool file_exists(const RemotePath& file) override;
    std::vector<RemotePath> list(const RemotePath& dir, bool recursive) override;
    void create_directory(const RemotePath& dir) override;
    void delete_file(const RemotePath& file) override;
    void delete_directory(const RemotePath& dir, bool recursive) override;
    void upload_file(const fs::path& local, const RemotePath& remote,
                     bool overwrite, bool verify) override;
    int upload_files(const std::vector<fs::path>& locals, const RemotePath& remote_dir,
                     bool overwrite, bool verify) override;

    void close();

private:
    explicit SftpSession(std::unique_ptr<SessionManager> session);

    std::unique_ptr<SessionManager> session_;
    LIBSSH2_SFTP* sftp_;

    // Last SFTP status code as text, for diagnostics.
    std::string last_error() const;
    bool stat_kind(const std::string& path, bool& is_dir);
    void list_into(const RemotePath& dir, bool recursive, std::vector<RemotePath>& out);
};
