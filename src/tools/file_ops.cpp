#include "file_ops.hpp"
#include "path_sandbox.hpp"
#include "../tool.hpp"
#include "../util.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace toolgate {

// Line split matching the usual text conventions: '\n' terminates a line,
// a trailing '\r' is dropped, and a final newline does not add an empty line.
static std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < content.size()) {
        size_t end = content.find('\n', start);
        if (end == std::string::npos) end = content.size();
        std::string line = content.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
        start = end + 1;
    }
    return lines;
}

static std::string join_lines(const std::vector<std::string>& lines, size_t from, size_t to) {
    std::string out;
    for (size_t i = from; i < to; ++i) {
        if (i > from) out += '\n';
        out += lines[i];
    }
    return out;
}

std::string read_file(const fs::path& root, const std::string& path,
                      std::optional<uint32_t> head, std::optional<uint32_t> tail) {
    fs::path full = validate_path_for_read(root, path);
    std::error_code ec;
    if (!fs::is_regular_file(full, ec)) {
        throw ToolError(ToolErrorKind::InvalidArg, "Path is not a file");
    }
    uintmax_t size = fs::file_size(full, ec);
    if (ec) throw ToolError(ToolErrorKind::Io, ec.message());
    if (size > kMaxFileSizeBytes) {
        throw ToolError(ToolErrorKind::InvalidArg,
                        "File too large (max " + std::to_string(kMaxFileSizeBytes) + " bytes)");
    }

    std::ifstream file(full, std::ios::binary);
    if (!file.is_open()) {
        throw ToolError(ToolErrorKind::Io, "Failed to open file: " + full.string());
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    std::string content = ss.str();
    if (!is_valid_utf8(content)) {
        throw ToolError(ToolErrorKind::Io, "stream did not contain valid UTF-8");
    }

    if (!head && !tail) {
        auto lines = split_lines(content);
        if (lines.size() > kMaxReadLines) {
            return join_lines(lines, 0, kMaxReadLines) +
                   "\n... (truncated, max " + std::to_string(kMaxReadLines) + " lines)";
        }
        return content;
    }

    auto lines = split_lines(content);
    size_t total = lines.size();
    if (head) {
        size_t n = std::min<size_t>(*head, kMaxReadLines);
        return join_lines(lines, 0, std::min(n, total));
    }
    size_t n = std::min<size_t>(*tail, kMaxReadLines);
    size_t start = total > n ? total - n : 0;
    return join_lines(lines, start, total);
}

std::string write_file(const fs::path& root, const std::string& path,
                       const std::string& content) {
    fs::path full = validate_path_for_write(root, path);
    std::error_code ec;
    if (fs::is_directory(full, ec)) {
        throw ToolError(ToolErrorKind::InvalidArg, "Path is a directory");
    }
    if (full.has_parent_path()) {
        fs::create_directories(full.parent_path(), ec);
        if (ec) {
            throw ToolError(ToolErrorKind::Io, "Failed to create directories: " + ec.message());
        }
    }

    std::ofstream file(full, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw ToolError(ToolErrorKind::Io, "Failed to open file for writing: " + full.string());
    }
    file << content;
    file.close();
    if (file.fail()) {
        throw ToolError(ToolErrorKind::Io, "Failed to write to file: " + full.string());
    }

    return "Wrote " + std::to_string(content.size()) + " bytes to " + full.string();
}

static void list_dir_inner(const fs::path& dir, uint32_t current, uint32_t max_depth,
                           std::vector<std::string>& out) {
    if (current >= max_depth) return;

    std::error_code ec;
    std::vector<fs::directory_entry> entries;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        entries.push_back(*it);
    }
    if (ec) throw ToolError(ToolErrorKind::Io, dir.string() + ": " + ec.message());

    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename().string() < b.path().filename().string();
              });

    std::string prefix(static_cast<size_t>(current) * 2, ' ');
    for (const auto& entry : entries) {
        bool is_dir = entry.is_directory(ec);
        out.push_back(prefix + entry.path().filename().string() + (is_dir ? "/" : ""));
        // Linked directories are shown but not descended into.
        if (is_dir && !entry.is_symlink(ec) && current + 1 < max_depth) {
            list_dir_inner(entry.path(), current + 1, max_depth, out);
        }
    }
}

std::string list_dir(const fs::path& root, const std::string& path,
                     std::optional<uint32_t> depth) {
    fs::path full = validate_path_for_read(root, path);
    std::error_code ec;
    if (!fs::is_directory(full, ec)) {
        throw ToolError(ToolErrorKind::InvalidArg, "Path is not a directory");
    }
    uint32_t max_depth = std::min(depth.value_or(kDefaultListDepth), kMaxListDepth);

    std::vector<std::string> lines;
    list_dir_inner(full, 0, max_depth, lines);

    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += '\n';
        out += lines[i];
    }
    return out;
}

} // namespace toolgate
