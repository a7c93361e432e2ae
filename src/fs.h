#pragma once

#include <string>
#include <optional>

namespace btcore {

// File existence check
bool file_exists(const char* path);

// Write `content` to `path`, replacing any existing file
bool create_file(const char* path, const std::string& content);

// Whole file contents, or empty if the file cannot be opened or read
std::optional<std::string> read_file_text(const char* path);

bool delete_file(const char* path);

// C++ convenience wrappers
inline bool file_exists(const std::string& path) { return file_exists(path.c_str()); }
inline bool create_file(const std::string& path, const std::string& content) {
    return create_file(path.c_str(), content);
}
inline std::optional<std::string> read_file_text(const std::string& path) {
    return read_file_text(path.c_str());
}
inline bool delete_file(const std::string& path) { return delete_file(path.c_str()); }

} // namespace btcore
