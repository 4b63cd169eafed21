#include "path_sandbox.hpp"
#include "../tool.hpp"
#include "../util.hpp"
#include <algorithm>

namespace fs = std::filesystem;

namespace toolgate {

std::string check_relative_path(const std::string& requested) {
    std::string normalized = replace_all(trim(requested), "\\", "/");
    if (normalized.find("..") != std::string::npos || starts_with(normalized, "/")) {
        throw ToolError(ToolErrorKind::PathNotAllowed,
                        "Path must be relative and cannot contain '..'");
    }
    return normalized;
}

bool is_within_root(const fs::path& root, const fs::path& path) {
    auto root_it = root.begin();
    auto path_it = path.begin();
    for (; root_it != root.end(); ++root_it, ++path_it) {
        // A trailing separator shows up as an empty final component.
        if (root_it->empty() && std::next(root_it) == root.end()) return true;
        if (path_it == path.end() || *root_it != *path_it) return false;
    }
    return true;
}

static fs::path canonical_root(const fs::path& root) {
    std::error_code ec;
    fs::path canon = fs::canonical(root, ec);
    if (ec) {
        throw ToolError(ToolErrorKind::PathNotAllowed, "root invalid: " + ec.message());
    }
    return canon;
}

fs::path validate_path_for_read(const fs::path& root, const std::string& requested) {
    fs::path canon_root = canonical_root(root);
    std::string relative = check_relative_path(requested);

    std::error_code ec;
    fs::path canon = fs::canonical(canon_root / relative, ec);
    if (ec) {
        throw ToolError(ToolErrorKind::PathNotAllowed,
                        "path invalid or not found: " + ec.message());
    }
    if (!is_within_root(canon_root, canon)) {
        throw ToolError(ToolErrorKind::PathNotAllowed,
                        "Resolved path is outside the allowed root");
    }
    return canon;
}

fs::path validate_path_for_write(const fs::path& root, const std::string& requested) {
    fs::path canon_root = canonical_root(root);
    std::string relative = check_relative_path(requested);
    fs::path full = canon_root / relative;

    std::error_code ec;
    if (fs::exists(full, ec)) {
        fs::path canon = fs::canonical(full, ec);
        if (ec) {
            throw ToolError(ToolErrorKind::PathNotAllowed, "path invalid: " + ec.message());
        }
        if (!is_within_root(canon_root, canon)) {
            throw ToolError(ToolErrorKind::PathNotAllowed,
                            "Resolved path is outside the allowed root");
        }
        return canon;
    }
    if (fs::is_symlink(fs::symlink_status(full, ec))) {
        // Dangling link: writing through it would land wherever it points.
        throw ToolError(ToolErrorKind::PathNotAllowed, "path is a dangling symlink");
    }

    fs::path parent = full.parent_path();
    if (!parent.empty() && fs::exists(parent, ec)) {
        fs::path parent_canon = fs::canonical(parent, ec);
        if (ec) {
            throw ToolError(ToolErrorKind::PathNotAllowed,
                            "parent path invalid: " + ec.message());
        }
        if (!is_within_root(canon_root, parent_canon)) {
            throw ToolError(ToolErrorKind::PathNotAllowed,
                            "Path is outside the allowed root");
        }
        return parent_canon / full.filename();
    }
    return full;
}

} // namespace toolgate
