#pragma once

#include <chrono>
#include <string>
#include <vector>

// Accumulated record of every create/update/delete/ignore decision made
// during one publish. Entries are paths relative to the publish base path.
struct ChangeSummary {
    std::vector<std::string> created_files;
    std::vector<std::string> updated_files;
    std::vector<std::string> deleted_files;
    std::vector<std::string> created_directories;
    std::vector<std::string> deleted_directories;
    std::vector<std::string> ignored_files;
    std::vector<std::string> ignored_directories;

    std::chrono::milliseconds total_time{0};
    int exit_code = 0;

    // Append every list of other, then drop from created_files anything
    // present in updated_files (case-insensitive). A file first recorded
    // as created by a nested upload and as updated by the caller ends up
    // reported once, as updated.
    void merge(const ChangeSummary& other);

    bool empty() const;

    // Operator-facing report: file lists, counts and total seconds.
    std::string to_display_string() const;
};
