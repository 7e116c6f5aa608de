#pragma once

#include <ssh/remote_session.hpp>
#include <core/errors.hpp>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// In-memory remote target. Entries are keyed by their case-folded path
// like a real case-insensitive server. Every mutating call is appended to
// operations ("mkdir /a", "rm /a/x", "rmdir /a", "put /a/x") so tests can
// check ordering, and upload failures can be injected per call.
class FakeRemoteSession : public RemoteSession {
public:
    FakeRemoteSession() {
        dirs_.emplace("/", RemotePath::root());
    }

    // ── Test setup and inspection ──────────────────────────

    void add_file(const std::string& path, const std::string& content = "") {
        RemotePath file(path, RemoteEntryKind::File);
        make_parents(file);
        files_.erase(file.key());
        files_.emplace(file.key(), Entry{file, content});
    }

    void add_directory(const std::string& path) {
        RemotePath dir(path, RemoteEntryKind::Directory);
        make_parents(dir);
        dirs_.emplace(dir.key(), dir);
    }

    bool has_file(const std::string& path) const {
        return files_.count(RemotePath(path, RemoteEntryKind::File).key()) > 0;
    }

    bool has_directory(const std::string& path) const {
        return dirs_.count(RemotePath(path, RemoteEntryKind::Directory).key()) > 0;
    }

    std::string content(const std::string& path) const {
        auto it = files_.find(RemotePath(path, RemoteEntryKind::File).key());
        return it == files_.end() ? "" : it->second.content;
    }

    size_t file_count() const { return files_.size(); }

    // Next N upload_files calls throw a TransportError.
    int failing_upload_calls = 0;
    // Next N upload_files calls skip the batch's last file and report it.
    int short_upload_calls = 0;
    // list() throws.
    bool fail_listing = false;
    // directory_exists() throws a plain std::runtime_error.
    bool fail_directory_check = false;
    // Called after every upload_files call (successful or not).
    std::function<void(int call)> after_upload;

    int upload_calls = 0;
    std::vector<size_t> batch_sizes;
    std::vector<std::string> operations;

    // ── RemoteSession ──────────────────────────────────────

    bool directory_exists(const RemotePath& dir) override {
        if (fail_directory_check) {
            throw std::runtime_error("permission check failed");
        }
        return dirs_.count(dir.key()) > 0;
    }

    bool file_exists(const RemotePath& file) override {
        return files_.count(file.key()) > 0;
    }

    std::vector<RemotePath> list(const RemotePath& dir, bool recursive) override {
        if (fail_listing) {
            throw TransportError("listing refused");
        }
        if (!dirs_.count(dir.key())) {
            throw TransportError("no such directory " + dir.path());
        }
        std::vector<RemotePath> out;
        auto wanted = [&](const RemotePath& p) {
            if (!dir.contains(p)) return false;
            return recursive || p.relative_to(dir).find('/') == std::string::npos;
        };
        for (const auto& kv : dirs_) {
            if (wanted(kv.second)) out.push_back(kv.second);
        }
        for (const auto& kv : files_) {
            if (wanted(kv.second.path)) out.push_back(kv.second.path);
        }
        return out;
    }

    void create_directory(const RemotePath& dir) override {
        if (files_.count(dir.key())) {
            throw TransportError(dir.path() + " is a file");
        }
        if (dirs_.count(dir.key())) return;
        make_parents(dir);
        operations.push_back("mkdir " + dir.path());
    }

    void delete_file(const RemotePath& file) override {
        if (!files_.erase(file.key())) {
            throw TransportError("no such file " + file.path());
        }
        operations.push_back("rm " + file.path());
    }

    void delete_directory(const RemotePath& dir, bool recursive) override {
        if (!dirs_.count(dir.key()) || dir.is_root()) {
            throw TransportError("cannot remove " + dir.path());
        }
        bool has_children = false;
        for (const auto& kv : files_) has_children |= dir.contains(kv.second.path);
        for (const auto& kv : dirs_) has_children |= dir.contains(kv.second);
        if (has_children && !recursive) {
            throw TransportError("directory not empty " + dir.path());
        }
        for (auto it = files_.begin(); it != files_.end();) {
            it = dir.contains(it->second.path) ? files_.erase(it) : std::next(it);
        }
        for (auto it = dirs_.begin(); it != dirs_.end();) {
            it = dir.contains(it->second) ? dirs_.erase(it) : std::next(it);
        }
        dirs_.erase(dir.key());
        operations.push_back("rmdir " + dir.path());
    }

    void upload_file(const fs::path& local, const RemotePath& remote,
                     bool overwrite, bool /*verify*/) override {
        std::ifstream in(local, std::ios::binary);
        if (!in) {
            throw TransportError("cannot read " + local.string());
        }
        if (!overwrite && files_.count(remote.key())) {
            return;
        }
        std::stringstream ss;
        ss << in.rdbuf();
        make_parents(remote);
        files_.erase(remote.key());
        files_.emplace(remote.key(), Entry{remote, ss.str()});
        operations.push_back("put " + remote.path());
    }

    int upload_files(const std::vector<fs::path>& locals, const RemotePath& remote_dir,
                     bool overwrite, bool verify) override {
        int call = ++upload_calls;
        batch_sizes.push_back(locals.size());

        if (failing_upload_calls > 0) {
            failing_upload_calls--;
            if (after_upload) after_upload(call);
            throw TransportError("connection reset during upload");
        }

        size_t n = locals.size();
        if (short_upload_calls > 0 && n > 0) {
            short_upload_calls--;
            n--;
        }

        create_directory(remote_dir);
        int uploaded = 0;
        for (size_t i = 0; i < n; i++) {
            RemotePath target = remote_dir.append(
                RemotePath(locals[i].filename().string(), RemoteEntryKind::File));
            upload_file(locals[i], target, overwrite, verify);
            uploaded++;
        }
        if (after_upload) after_upload(call);
        return uploaded;
    }

private:
    struct Entry {
        RemotePath path;
        std::string content;
    };

    std::map<std::string, RemotePath> dirs_;
    std::map<std::string, Entry> files_;

    void make_parents(const RemotePath& p) {
        const std::string& s = p.path();
        size_t pos = 1;
        while ((pos = s.find('/', pos)) != std::string::npos) {
            RemotePath parent(s.substr(0, pos), RemoteEntryKind::Directory);
            dirs_.emplace(parent.key(), parent);
            pos++;
        }
        if (p.is_directory() && !p.is_root()) {
            dirs_.emplace(p.key(), p);
        }
    }
};
