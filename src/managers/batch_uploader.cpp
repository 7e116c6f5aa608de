#include "batch_uploader.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <new>
#include <stdexcept>

// Absolute, lexically normal form without a trailing separator. Symlinks
// are left unresolved so a linked directory mirrors under its own name.
static fs::path lexical_dir(const fs::path& p) {
    fs::path n = fs::absolute(p).lexically_normal();
    if (!n.has_filename() && n != n.root_path()) {
        n = n.parent_path();
    }
    return n;
}

RemotePath mirror_remote_path(const fs::path& local_path, const fs::path& base_dir,
                              const RemotePath& base_path, RemoteEntryKind kind) {
    fs::path rel_path = lexical_dir(local_path).lexically_relative(lexical_dir(base_dir));
    std::string rel = rel_path.generic_string();
    if (rel == ".") {
        return RemotePath(base_path.path(), kind);
    }
    if (rel.empty() || rel_path.begin()->string() == "..") {
        throw std::invalid_argument(fmt::format("Local path '{}' is not inside '{}'",
                                                local_path.string(), base_dir.string()));
    }
    return base_path.append(RemotePath(rel, kind));
}

BatchUploader::BatchUploader(RemoteSession& session, int batch_size, int max_attempts,
                             StatusCallback cb)
    : session_(session), batch_size_(batch_size), max_attempts_(max_attempts), cb_(std::move(cb)) {
    if (batch_size_ < 1) {
        throw std::invalid_argument(fmt::format("Batch size must be at least 1, got {}", batch_size_));
    }
    if (max_attempts_ < 1) {
        throw std::invalid_argument(fmt::format("Max attempts must be at least 1, got {}", max_attempts_));
    }
}

// ── Batches ────────────────────────────────────────────────

bool BatchUploader::upload_batch_with_retry(const std::vector<fs::path>& files,
                                            const RemotePath& remote_dir,
                                            int batch_number) {
    for (int attempt = 1; attempt <= max_attempts_; attempt++) {
        try {
            int uploaded = session_.upload_files(files, remote_dir, true, true);
            if (uploaded == static_cast<int>(files.size())) {
                return true;
            }
            stagehand_log_error(fmt::format(
                "The expected number of uploaded files was {} but result was {}, "
                "batch {} attempt {} of {}",
                files.size(), uploaded, batch_number, attempt, max_attempts_));
        } catch (const std::bad_alloc&) {
            throw;
        } catch (const std::exception& e) {
            stagehand_log_error(fmt::format("Transfer error in batch {} attempt {} of {}: {}",
                                            batch_number, attempt, max_attempts_, e.what()));
        }
    }
    return false;
}

void BatchUploader::upload_batches(const std::vector<fs::path>& files, const RemotePath& remote_dir,
                                   const CancellationToken& cancel, const BatchCallback& on_batch) {
    if (!remote_dir.is_directory()) {
        throw std::invalid_argument(fmt::format("Upload target '{}' is not a directory", remote_dir.path()));
    }

    size_t total = files.size();
    size_t batches = (total + batch_size_ - 1) / batch_size_;

    stagehand_log(fmt::format("Uploading {} files to {}", total, remote_dir.path()));

    for (size_t i = 0; i < batches; i++) {
        int batch_number = static_cast<int>(i) + 1;
        cancel.throw_if_cancelled(fmt::format("batch {} of {}", batch_number, batches));

        auto first = files.begin() + static_cast<std::ptrdiff_t>(i * batch_size_);
        auto last = files.begin() + static_cast<std::ptrdiff_t>(std::min(total, (i + 1) * batch_size_));
        std::vector<fs::path> batch(first, last);

        if (!upload_batch_with_retry(batch, remote_dir, batch_number)) {
            throw BatchUploadError(fmt::format("The batch {} to '{}' failed after {} attempts",
                                               batch_number, remote_dir.path(), max_attempts_),
                                   batch_number);
        }
        if (on_batch) on_batch(batch);

        std::string msg = fmt::format("Uploaded batch {} of {} using batch size {}",
                                      batch_number, batches, batch_size_);
        stagehand_log(msg);
        if (cb_) cb_(msg);
    }
}

// ── Tree walk ──────────────────────────────────────────────

void BatchUploader::upload_tree(const fs::path& source_dir, const fs::path& base_dir,
                                const RemotePath& base_path, ChangeSummary& summary,
                                const CancellationToken& cancel,
                                const std::set<RemotePath>& skip) {
    RemotePath remote_dir = mirror_remote_path(source_dir, base_dir, base_path,
                                               RemoteEntryKind::Directory);

    std::vector<fs::path> files;
    std::vector<fs::path> subdirs;
    try {
        for (const auto& entry : fs::directory_iterator(source_dir)) {
            if (entry.is_directory()) {
                subdirs.push_back(entry.path());
            } else if (entry.is_regular_file()) {
                files.push_back(entry.path());
            }
        }
    } catch (const fs::filesystem_error& e) {
        throw LocalSourceError(fmt::format("Could not read local directory '{}': {}",
                                           source_dir.string(), e.what()));
    }
    std::sort(files.begin(), files.end());
    std::sort(subdirs.begin(), subdirs.end());

    std::vector<fs::path> to_upload;
    for (const auto& f : files) {
        RemotePath remote_file = mirror_remote_path(f, base_dir, base_path, RemoteEntryKind::File);
        if (!skip.count(remote_file)) {
            to_upload.push_back(f);
        }
    }

    if (!to_upload.empty()) {
        upload_batches(to_upload, remote_dir, cancel, [&](const std::vector<fs::path>& batch) {
            ChangeSummary done;
            for (const auto& f : batch) {
                done.created_files.push_back(
                    mirror_remote_path(f, base_dir, base_path, RemoteEntryKind::File)
                        .relative_to(base_path));
            }
            summary.merge(done);
        });
    }

    for (const auto& sub : subdirs) {
        RemotePath remote_sub = mirror_remote_path(sub, base_dir, base_path, RemoteEntryKind::Directory);

        cancel.throw_if_cancelled("checking " + remote_sub.path());
        bool exists = false;
        try {
            exists = session_.directory_exists(remote_sub);
            if (!exists) {
                session_.create_directory(remote_sub);
            }
        } catch (const std::bad_alloc&) {
            throw;
        } catch (const std::exception& e) {
            throw TransportError(fmt::format("Could not prepare directory '{}': {}",
                                             remote_sub.path(), e.what()));
        }
        if (!exists) {
            ChangeSummary created;
            created.created_directories.push_back(remote_sub.relative_to(base_path));
            summary.merge(created);
        }

        upload_tree(sub, base_dir, base_path, summary, cancel, skip);
    }
}

ChangeSummary BatchUploader::upload_files(const fs::path& source_dir, const fs::path& base_dir,
                                          const RemotePath& base_path, const CancellationToken& cancel,
                                          const std::set<RemotePath>& skip) {
    ChangeSummary summary;
    upload_tree(source_dir, base_dir, base_path, summary, cancel, skip);
    return summary;
}
