#include "remote_path.hpp"
#include "utils.hpp"
#include <stdexcept>

std::string normalize_remote_path(const std::string& path) {
    if (is_blank(path)) {
        throw std::invalid_argument("Remote path cannot be empty or whitespace");
    }

    std::string out = "/";
    for (char c : path) {
        if (c == '\\') c = '/';
        if (c == '/' && out.back() == '/') continue;
        out += c;
    }
    if (out.size() > 1 && out.back() == '/') {
        out.pop_back();
    }

    // A ".." segment would let an entry escape the base path it is mapped under.
    size_t start = 1;
    while (start < out.size()) {
        size_t end = out.find('/', start);
        if (end == std::string::npos) end = out.size();
        if (out.compare(start, end - start, "..") == 0) {
            throw std::invalid_argument("Remote path '" + path + "' must not contain '..' segments");
        }
        start = end + 1;
    }
    return out;
}

RemotePath::RemotePath(const std::string& path, RemoteEntryKind kind)
    : path_(normalize_remote_path(path)), key_(to_lower(path_)), kind_(kind) {
}

RemotePath RemotePath::root() {
    return RemotePath("/", RemoteEntryKind::Directory);
}

RemotePath RemotePath::append(const RemotePath& child) const {
    if (child.is_root()) {
        return RemotePath(path_, child.kind_);
    }
    // child.path_ always starts with '/', normalization collapses the join
    return RemotePath(path_ + child.path_, child.kind_);
}

bool RemotePath::contains(const RemotePath& other) const {
    if (other.key_.size() <= key_.size()) return false;
    if (is_root()) return true;
    return other.key_.compare(0, key_.size(), key_) == 0 &&
           other.key_[key_.size()] == '/';
}

std::string RemotePath::relative_to(const RemotePath& base) const {
    if (base.contains(*this)) {
        size_t skip = base.is_root() ? 1 : base.path_.size() + 1;
        return path_.substr(skip);
    }
    return path_.substr(1);
}

bool RemotePath::is_app_data(const std::string& directory_name) const {
    if (directory_name.empty()) return false;

    size_t start = 1;
    while (start < path_.size()) {
        size_t end = path_.find('/', start);
        if (end == std::string::npos) end = path_.size();
        if (iequals(path_.substr(start, end - start), directory_name)) {
            return true;
        }
        start = end + 1;
    }
    return false;
}

std::string RemotePath::name() const {
    return path_.substr(path_.rfind('/') + 1);
}
