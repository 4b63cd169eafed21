#pragma once
#include <filesystem>
#include <string>

namespace toolgate {

// Textual check on the raw caller string, before any filesystem access:
// backslashes become '/', the result must not contain ".." nor start with '/'.
// Returns the normalized relative path; throws ToolError(PathNotAllowed).
std::string check_relative_path(const std::string& requested);

// Resolve `requested` under `root` for reading. The target must exist and its
// canonical form (symlinks resolved) must stay under the canonical root.
std::filesystem::path validate_path_for_read(const std::filesystem::path& root,
                                             const std::string& requested);

// Resolve `requested` under `root` for writing. An existing target is checked
// as for reading; otherwise the existing parent must be under the root. When
// the parent does not exist either, the joined path is accepted as-is (it is
// already textually traversal-free).
std::filesystem::path validate_path_for_write(const std::filesystem::path& root,
                                              const std::string& requested);

// True when `path` equals `root` or lies beneath it, compared per component.
bool is_within_root(const std::filesystem::path& root, const std::filesystem::path& path);

} // namespace toolgate
