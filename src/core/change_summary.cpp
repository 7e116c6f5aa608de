#include "change_summary.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <set>

static void append_all(std::vector<std::string>& into, const std::vector<std::string>& from) {
    into.insert(into.end(), from.begin(), from.end());
}

void ChangeSummary::merge(const ChangeSummary& other) {
    append_all(deleted_files, other.deleted_files);
    append_all(deleted_directories, other.deleted_directories);
    append_all(created_directories, other.created_directories);
    append_all(updated_files, other.updated_files);
    append_all(created_files, other.created_files);
    append_all(ignored_files, other.ignored_files);
    append_all(ignored_directories, other.ignored_directories);

    std::set<std::string> updated;
    for (const auto& f : updated_files) updated.insert(to_lower(f));

    std::vector<std::string> created;
    created.reserve(created_files.size());
    for (const auto& f : created_files) {
        if (updated.find(to_lower(f)) == updated.end()) {
            created.push_back(f);
        }
    }
    created_files = std::move(created);
}

bool ChangeSummary::empty() const {
    return created_files.empty() && updated_files.empty() && deleted_files.empty() &&
           created_directories.empty() && deleted_directories.empty() &&
           ignored_files.empty() && ignored_directories.empty();
}

static void append_list(std::string& out, const char* title,
                        const std::vector<std::string>& items) {
    if (items.empty()) return;
    out += fmt::format("{}:\n", title);
    for (const auto& item : items) {
        out += fmt::format("* {}\n", item);
    }
}

std::string ChangeSummary::to_display_string() const {
    std::string out;

    append_list(out, "Created files", created_files);
    append_list(out, "Updated files", updated_files);
    append_list(out, "Deleted files", deleted_files);
    append_list(out, "Deleted directories", deleted_directories);

    out += fmt::format("Ignored files: {}\n", ignored_files.size());
    out += fmt::format("Ignored directories: {}\n", ignored_directories.size());
    out += fmt::format("Created files: {}\n", created_files.size());
    out += fmt::format("Updated files: {}\n", updated_files.size());
    out += fmt::format("Deleted files: {}\n", deleted_files.size());
    out += fmt::format("Total time: {:.1f} seconds\n",
                       std::chrono::duration<double>(total_time).count());
    return out;
}
