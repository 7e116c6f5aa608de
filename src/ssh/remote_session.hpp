#pragma once

#include <filesystem>
#include <vector>
#include <core/remote_path.hpp>

namespace fs = std::filesystem;

// Stateful file-transfer session with the publish target. Implementations
// throw TransportError when an operation fails. A session is not safe for
// concurrent use: one session serves one publish at a time.
class RemoteSession {
public:
    virtual ~RemoteSession() = default;

    virtual bool directory_exists(const RemotePath& dir) = 0;
    virtual bool file_exists(const RemotePath& file) = 0;

    // Entries below dir (dir itself excluded). Recursive listings are flat.
    virtual std::vector<RemotePath> list(const RemotePath& dir, bool recursive) = 0;

    // Creates missing parents as well.
    virtual void create_directory(const RemotePath& dir) = 0;
    virtual void delete_file(const RemotePath& file) = 0;
    virtual void delete_directory(const RemotePath& dir, bool recursive) = 0;

    virtual void upload_file(const fs::path& local, const RemotePath& remote,
                             bool overwrite, bool verify) = 0;

    // Bulk upload into remote_dir (created if missing), keeping file names.
    // Returns the number of files that were uploaded (and verified).
    // Individual file failures lower the count instead of throwing.
    virtual int upload_files(const std::vector<fs::path>& locals, const RemotePath& remote_dir,
                             bool overwrite, bool verify) = 0;
};
