#pragma once

#include <filesystem>
#include <functional>
#include <set>
#include <string>
#include <vector>
#include <core/cancellation.hpp>
#include <core/change_summary.hpp>
#include <core/remote_path.hpp>
#include <core/rule_configuration.hpp>
#include <core/types.hpp>
#include <ssh/remote_session.hpp>

namespace fs = std::filesystem;

// Engine settings. Defaults match an unconfigured publish.
struct SyncSettings {
    RemotePath base_path = RemotePath::root();   // remote root of the publish
    int batch_size = DEFAULT_BATCH_SIZE;         // files per transport call
    int max_attempts = DEFAULT_MAX_ATTEMPTS;     // attempts per batch
    bool prune_directories = false;              // delete remote dirs with no local counterpart

    static SyncSettings from(const TargetConfig& target, const PublishConfig& publish);
};

// Reconciles a remote directory tree with a local source tree and reports
// what changed. One SyncManager (and its session) serves one publish at
// a time.
class SyncManager {
public:
    SyncManager(RemoteSession& session, SyncSettings settings, StatusCallback cb = nullptr);

    // Make the tree under the base path mirror source_dir: stale remote
    // files are deleted first, then the whole source tree is uploaded with
    // overwrite. Entries kept by rules are never touched and are reported
    // as ignored. Throws std::invalid_argument for a missing source
    // directory, and a SyncError subclass carrying the partial summary
    // when the publish fails part way.
    ChangeSummary publish(const RuleConfiguration& rules, const fs::path& source_dir,
                          const CancellationToken& cancel = {});

    // Upload source_dir (inside base_dir) below base_path, creating the
    // mirrored remote directory when it does not exist.
    ChangeSummary upload_directory(const RuleConfiguration& rules, const fs::path& source_dir,
                                   const fs::path& base_dir, const RemotePath& base_path,
                                   const CancellationToken& cancel = {});

    // ── Checked single-entry operations ────────────────────
    // The path kind is validated before any I/O (std::invalid_argument);
    // transport failures are rethrown as TransportError naming the path.

    bool directory_exists(const RemotePath& dir);
    bool file_exists(const RemotePath& file);
    void create_directory(const RemotePath& dir);
    void delete_file(const RemotePath& file);
    void delete_directory(const RemotePath& dir);
    void upload_file(const RemotePath& remote_file, const fs::path& local_file);
    std::vector<RemotePath> list_directory(const RemotePath& dir, bool recursive = true);

    const SyncSettings& settings() const { return settings_; }

private:
    RemoteSession& session_;
    SyncSettings settings_;
    StatusCallback cb_;

    void delete_files(const RuleConfiguration& rules, const std::vector<RemotePath>& files,
                      ChangeSummary& summary, const CancellationToken& cancel);

    // Deepest first. excluded accumulates entries that must survive, so
    // nothing nested under (or holding) one of them is deleted.
    void delete_directories(const RuleConfiguration& rules, std::vector<RemotePath> dirs,
                            std::vector<RemotePath>& excluded, ChangeSummary& summary,
                            const CancellationToken& cancel);

    // Run op, turning any transport failure into a TransportError that
    // names the operation and path.
    template <typename Fn>
    auto checked(const std::string& operation, const RemotePath& path, Fn&& op)
        -> decltype(op());
};
