#include "sync_manager.hpp"
#include "batch_uploader.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <new>
#include <stdexcept>

SyncSettings SyncSettings::from(const TargetConfig& target, const PublishConfig& publish) {
    SyncSettings s;
    s.base_path = RemotePath(target.base_path.empty() ? "/" : target.base_path,
                             RemoteEntryKind::Directory);
    s.batch_size = publish.batch_size;
    s.max_attempts = publish.max_attempts;
    s.prune_directories = publish.prune_directories;
    return s;
}

SyncManager::SyncManager(RemoteSession& session, SyncSettings settings, StatusCallback cb)
    : session_(session), settings_(std::move(settings)), cb_(std::move(cb)) {
    if (!settings_.base_path.is_directory()) {
        throw std::invalid_argument(fmt::format("Base path '{}' is not a directory",
                                                settings_.base_path.path()));
    }
}

// ── Checked operations ─────────────────────────────────────

template <typename Fn>
auto SyncManager::checked(const std::string& operation, const RemotePath& path, Fn&& op)
    -> decltype(op()) {
    try {
        return op();
    } catch (const std::bad_alloc&) {
        throw;
    } catch (const std::exception& e) {
        throw TransportError(fmt::format("{} '{}' failed: {}", operation, path.path(), e.what()));
    }
}

static void require_directory(const RemotePath& path, const char* operation) {
    if (!path.is_directory()) {
        throw std::invalid_argument(fmt::format("{}: '{}' is not a directory", operation, path.path()));
    }
}

static void require_file(const RemotePath& path, const char* operation) {
    if (!path.is_file()) {
        throw std::invalid_argument(fmt::format("{}: '{}' is not a file", operation, path.path()));
    }
}

bool SyncManager::directory_exists(const RemotePath& dir) {
    require_directory(dir, "directory_exists");
    return checked("Checking directory", dir, [&] { return session_.directory_exists(dir); });
}

bool SyncManager::file_exists(const RemotePath& file) {
    require_file(file, "file_exists");
    return checked("Checking file", file, [&] { return session_.file_exists(file); });
}

void SyncManager::create_directory(const RemotePath& dir) {
    require_directory(dir, "create_directory");
    checked("Creating directory", dir, [&] { session_.create_directory(dir); });
}

void SyncManager::delete_file(const RemotePath& file) {
    require_file(file, "delete_file");
    checked("Deleting file", file, [&] { session_.delete_file(file); });
}

void SyncManager::delete_directory(const RemotePath& dir) {
    require_directory(dir, "delete_directory");
    checked("Deleting directory", dir, [&] { session_.delete_directory(dir, true); });
}

void SyncManager::upload_file(const RemotePath& remote_file, const fs::path& local_file) {
    require_file(remote_file, "upload_file");
    if (local_file.empty() || !fs::is_regular_file(local_file)) {
        throw std::invalid_argument(fmt::format("upload_file: local file '{}' does not exist",
                                                local_file.string()));
    }
    checked("Uploading file", remote_file,
            [&] { session_.upload_file(local_file, remote_file, true, true); });
}

std::vector<RemotePath> SyncManager::list_directory(const RemotePath& dir, bool recursive) {
    require_directory(dir, "list_directory");
    return checked("Listing directory", dir, [&] { return session_.list(dir, recursive); });
}

// ── Deletion ───────────────────────────────────────────────

void SyncManager::delete_files(const RuleConfiguration& rules, const std::vector<RemotePath>& files,
                               ChangeSummary& summary, const CancellationToken& cancel) {
    const auto& base = settings_.base_path;
    for (const auto& file : files) {
        if (rules.keeps(file)) {
            summary.ignored_files.push_back(file.relative_to(base));
            continue;
        }
        cancel.throw_if_cancelled("deleting " + file.path());
        delete_file(file);
        summary.deleted_files.push_back(file.relative_to(base));
        stagehand_log(fmt::format("Deleted file {}", file.path()));
    }
}

void SyncManager::delete_directories(const RuleConfiguration& rules, std::vector<RemotePath> dirs,
                                     std::vector<RemotePath>& excluded, ChangeSummary& summary,
                                     const CancellationToken& cancel) {
    const auto& base = settings_.base_path;

    // Descending key order puts every directory after its descendants.
    std::sort(dirs.begin(), dirs.end(),
              [](const RemotePath& a, const RemotePath& b) { return b < a; });

    for (const auto& dir : dirs) {
        bool under_excluded = std::any_of(excluded.begin(), excluded.end(),
            [&](const RemotePath& ex) { return ex.is_directory() && ex.contains(dir); });
        if (under_excluded) {
            continue;
        }

        if (rules.keeps(dir)) {
            summary.ignored_directories.push_back(dir.relative_to(base));
            excluded.push_back(dir);
            continue;
        }

        bool holds_excluded = std::any_of(excluded.begin(), excluded.end(),
            [&](const RemotePath& ex) { return dir.contains(ex); });
        if (holds_excluded) {
            stagehand_log(fmt::format("Keeping directory {}: it holds ignored entries", dir.path()));
            continue;
        }

        cancel.throw_if_cancelled("deleting " + dir.path());
        delete_directory(dir);
        summary.deleted_directories.push_back(dir.relative_to(base));
        stagehand_log(fmt::format("Deleted directory {}", dir.path()));
    }
}

// ── Upload ─────────────────────────────────────────────────

ChangeSummary SyncManager::upload_directory(const RuleConfiguration& rules, const fs::path& source_dir,
                                            const fs::path& base_dir, const RemotePath& base_path,
                                            const CancellationToken& cancel) {
    if (!fs::is_directory(source_dir)) {
        throw std::invalid_argument(fmt::format("Source directory '{}' does not exist",
                                                source_dir.string()));
    }
    require_directory(base_path, "upload_directory");

    ChangeSummary summary;
    RemotePath remote_dir = mirror_remote_path(source_dir, base_dir, base_path,
                                               RemoteEntryKind::Directory);
    std::set<RemotePath> skip;
    cancel.throw_if_cancelled("checking " + remote_dir.path());
    if (!directory_exists(remote_dir)) {
        create_directory(remote_dir);
        if (!remote_dir.is_root() && remote_dir != base_path) {
            summary.created_directories.push_back(remote_dir.relative_to(base_path));
        }
    } else {
        for (const auto& item : list_directory(remote_dir, true)) {
            if (item.is_file() && rules.keeps(item)) {
                skip.insert(item);
                summary.ignored_files.push_back(item.relative_to(base_path));
            }
        }
    }

    BatchUploader uploader(session_, settings_.batch_size, settings_.max_attempts, cb_);
    uploader.upload_tree(source_dir, base_dir, base_path, summary, cancel, skip);
    return summary;
}

// ── Publish ────────────────────────────────────────────────

ChangeSummary SyncManager::publish(const RuleConfiguration& rules, const fs::path& source_dir,
                                   const CancellationToken& cancel) {
    if (source_dir.empty() || !fs::is_directory(source_dir)) {
        throw std::invalid_argument(fmt::format("Source directory '{}' does not exist",
                                                source_dir.string()));
    }
    BatchUploader uploader(session_, settings_.batch_size, settings_.max_attempts, cb_);

    const auto& base = settings_.base_path;
    auto start = std::chrono::steady_clock::now();
    auto elapsed = [&] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
    };

    ChangeSummary summary;
    ChangeSummary uploaded;

    stagehand_log(fmt::format("Publishing {} to {}", source_dir.string(), base.path()));
    if (cb_) cb_(fmt::format("Publishing to {}", base.path()));

    try {
        cancel.throw_if_cancelled("checking " + base.path());
        if (!directory_exists(base)) {
            create_directory(base);
            stagehand_log(fmt::format("Created base path {}", base.path()));
        }

        cancel.throw_if_cancelled("listing " + base.path());
        auto remote_items = list_directory(base, true);

        // Local tree mirrored onto the remote side. Linked directories are
        // followed, as the upload pass does.
        std::set<RemotePath> source_files;
        std::set<RemotePath> source_dirs;
        try {
            for (const auto& entry : fs::recursive_directory_iterator(
                     source_dir, fs::directory_options::follow_directory_symlink)) {
                if (entry.is_directory()) {
                    source_dirs.insert(mirror_remote_path(entry.path(), source_dir, base,
                                                          RemoteEntryKind::Directory));
                } else if (entry.is_regular_file()) {
                    source_files.insert(mirror_remote_path(entry.path(), source_dir, base,
                                                           RemoteEntryKind::File));
                }
            }
        } catch (const fs::filesystem_error& e) {
            throw LocalSourceError(fmt::format("Could not read local directory '{}': {}",
                                               source_dir.string(), e.what()));
        }

        std::vector<RemotePath> to_keep;
        std::vector<RemotePath> to_remove;
        std::vector<RemotePath> updated;
        std::vector<RemotePath> obsolete_dirs;
        for (const auto& item : remote_items) {
            if (item.is_directory()) {
                if (!source_dirs.count(item)) obsolete_dirs.push_back(item);
                continue;
            }
            if (rules.keeps(item)) {
                to_keep.push_back(item);
            } else if (!source_files.count(item)) {
                to_remove.push_back(item);
            } else {
                updated.push_back(item);
            }
        }

        stagehand_log(fmt::format("Remote has {} files: {} to keep, {} to remove, {} to update",
                                  to_keep.size() + to_remove.size() + updated.size(),
                                  to_keep.size(), to_remove.size(), updated.size()));

        delete_files(rules, to_remove, summary, cancel);

        for (const auto& f : to_keep) {
            summary.ignored_files.push_back(f.relative_to(base));
        }
        for (const auto& f : updated) {
            summary.updated_files.push_back(f.relative_to(base));
        }

        if (settings_.prune_directories && !obsolete_dirs.empty()) {
            std::vector<RemotePath> excluded(to_keep.begin(), to_keep.end());
            delete_directories(rules, obsolete_dirs, excluded, summary, cancel);
        }

        std::set<RemotePath> skip(to_keep.begin(), to_keep.end());
        uploader.upload_tree(source_dir, source_dir, base, uploaded, cancel, skip);
        summary.merge(uploaded);
    } catch (SyncError& e) {
        summary.merge(uploaded);
        summary.total_time = elapsed();
        summary.exit_code = 1;
        e.set_partial_summary(summary);
        stagehand_log_error(fmt::format("Publish to {} failed: {}", base.path(), e.what()));
        throw;
    }

    summary.total_time = elapsed();
    stagehand_log(fmt::format("Publish to {} finished in {} ms", base.path(),
                              summary.total_time.count()));
    if (cb_) cb_("Publish complete");
    return summary;
}
