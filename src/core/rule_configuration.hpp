#pragma once

#include <set>
#include <string>
#include "constants.hpp"
#include "remote_path.hpp"

// Per-publish rules deciding which remote entries the engine must leave
// alone. Supplied by the caller, never mutated by the engine.
struct RuleConfiguration {
    std::set<std::string> excludes;                     // case-insensitive path prefixes
    bool app_data_skip_enabled = false;
    std::string app_data_directory = DEFAULT_APP_DATA_DIR;

    // Path starts with any exclude prefix. Plain string prefix, no globbing.
    bool is_excluded(const RemotePath& path) const;

    // App-data convention applies (only when enabled).
    bool is_app_data(const RemotePath& path) const;

    // Kept entries survive deletion and are left out of delete/upload accounting.
    bool keeps(const RemotePath& path) const {
        return is_app_data(path) || is_excluded(path);
    }
};
