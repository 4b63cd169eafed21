#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace toolgate {

constexpr uintmax_t kMaxFileSizeBytes = 512 * 1024;
constexpr size_t kMaxReadLines = 2000;
constexpr uint32_t kDefaultListDepth = 1;
constexpr uint32_t kMaxListDepth = 3;

// Read a UTF-8 text file under root. Files over kMaxFileSizeBytes are
// rejected. Without head/tail, files longer than kMaxReadLines are cut with
// a truncation marker; head and tail are each clamped to kMaxReadLines.
std::string read_file(const std::filesystem::path& root, const std::string& path,
                      std::optional<uint32_t> head = std::nullopt,
                      std::optional<uint32_t> tail = std::nullopt);

// Write (overwrite) a text file under root, creating parent directories.
std::string write_file(const std::filesystem::path& root, const std::string& path,
                       const std::string& content);

// Indented listing, two spaces per level, '/' after directories, entries
// sorted by name. depth defaults to 1 and is clamped to kMaxListDepth.
std::string list_dir(const std::filesystem::path& root, const std::string& path,
                     std::optional<uint32_t> depth = std::nullopt);

} // namespace toolgate
