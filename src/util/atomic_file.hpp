#pragma once
#include <optional>
#include <string>

namespace hive::util {

// Write content to a hidden temp file beside `path`, fsync it, then rename it
// over `path`. Readers see either the old file or the complete new one.
bool write_file_atomic(const std::string& path, const std::string& content);

// Read a whole file. Returns nullopt if it cannot be opened.
std::optional<std::string> read_file(const std::string& path);

} // namespace hive::util
