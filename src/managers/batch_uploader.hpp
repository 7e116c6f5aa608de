#pragma once

#include <filesystem>
#include <functional>
#include <set>
#include <vector>
#include <core/cancellation.hpp>
#include <core/change_summary.hpp>
#include <core/remote_path.hpp>
#include <core/types.hpp>
#include <ssh/remote_session.hpp>

namespace fs = std::filesystem;

// Uploads a local tree directory by directory. Within one directory the
// files go up in consecutive fixed-size batches; a batch is the unit of
// retry. Sub-directories are handled after their parent's batches, depth
// first, so retry boundaries never span two directories.
class BatchUploader {
public:
    using BatchCallback = std::function<void(const std::vector<fs::path>& batch)>;

    // Throws std::invalid_argument unless batch_size and max_attempts are >= 1.
    BatchUploader(RemoteSession& session, int batch_size, int max_attempts,
                  StatusCallback cb = nullptr);

    // Upload files into remote_dir. A batch attempt succeeds only when the
    // transport reports exactly the batch's file count; transport errors
    // and short counts are logged and retried. Throws BatchUploadError
    // once a batch has used all attempts; later batches are not tried.
    // on_batch is called with each batch as soon as it has succeeded.
    void upload_batches(const std::vector<fs::path>& files, const RemotePath& remote_dir,
                        const CancellationToken& cancel, const BatchCallback& on_batch = nullptr);

    // Upload source_dir (a directory inside base_dir) to the mirrored
    // location below base_path. The remote directory for source_dir must
    // already exist; missing sub-directories are created and recorded.
    // Files whose remote path is in skip are left alone. Files are recorded
    // as created batch by batch, as each batch succeeds. An unreadable local
    // directory throws LocalSourceError.
    ChangeSummary upload_files(const fs::path& source_dir, const fs::path& base_dir,
                               const RemotePath& base_path, const CancellationToken& cancel,
                               const std::set<RemotePath>& skip = {});

    // As upload_files, merging into summary as each batch completes, so
    // that after a failure summary holds everything finished so far.
    void upload_tree(const fs::path& source_dir, const fs::path& base_dir,
                     const RemotePath& base_path, ChangeSummary& summary,
                     const CancellationToken& cancel,
                     const std::set<RemotePath>& skip = {});

    int batch_size() const { return batch_size_; }
    int max_attempts() const { return max_attempts_; }

private:
    RemoteSession& session_;
    int batch_size_;
    int max_attempts_;
    StatusCallback cb_;

    bool upload_batch_with_retry(const std::vector<fs::path>& files, const RemotePath& remote_dir,
                                 int batch_number);
};

// Remote location mirroring local_path (inside base_dir) below base_path.
// The relative part is computed lexically, without resolving symlinks.
// Throws std::invalid_argument if local_path is not inside base_dir.
RemotePath mirror_remote_path(const fs::path& local_path, const fs::path& base_dir,
                              const RemotePath& base_path, RemoteEntryKind kind);
