#pragma once

#include <string>

enum class RemoteEntryKind {
    File,
    Directory,
};

// Immutable path on the remote target. The path is normalized on
// construction: '/' separators only, a single leading '/', no repeated or
// trailing separators (root is "/"). A ".." segment is rejected with
// std::invalid_argument. Remote filesystems are treated as
// case-insensitive, so equality and ordering use the lower-cased key.
class RemotePath {
public:
    RemotePath(const std::string& path, RemoteEntryKind kind);

    static RemotePath root();

    const std::string& path() const { return path_; }
    const std::string& key() const { return key_; }
    RemoteEntryKind kind() const { return kind_; }
    bool is_file() const { return kind_ == RemoteEntryKind::File; }
    bool is_directory() const { return kind_ == RemoteEntryKind::Directory; }
    bool is_root() const { return path_ == "/"; }

    // Concatenate child below this path. The result takes the child's kind.
    RemotePath append(const RemotePath& child) const;

    // True iff other lies strictly below this path on a separator boundary:
    // "/app" contains "/app/x" but not "/application" nor "/app" itself.
    bool contains(const RemotePath& other) const;

    // Path below base without a leading separator. Returns the path itself
    // (minus the leading '/') when base does not contain it.
    std::string relative_to(const RemotePath& base) const;

    // App-data convention: any segment equals directory_name (case-insensitive).
    bool is_app_data(const std::string& directory_name) const;

    // Last path segment ("" for root).
    std::string name() const;

    bool operator==(const RemotePath& other) const {
        return kind_ == other.kind_ && key_ == other.key_;
    }
    bool operator!=(const RemotePath& other) const { return !(*this == other); }
    bool operator<(const RemotePath& other) const {
        if (key_ != other.key_) return key_ < other.key_;
        return kind_ < other.kind_;
    }

private:
    std::string path_;
    std::string key_;
    RemoteEntryKind kind_;
};

// Normalize a remote path string (see RemotePath). Throws
// std::invalid_argument for a blank path.
std::string normalize_remote_path(const std::string& path);
