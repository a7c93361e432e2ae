#include "fs.h"
#include "logger.h"
#include <cstdio>
#include <vector>

#ifdef _WIN32
    #include <io.h>
    #define access _access
    #define F_OK 0
#else
    #include <unistd.h>
#endif

namespace btcore {

bool file_exists(const char* path) {
    if (!path) return false;
    return access(path, F_OK) == 0;
}

bool create_file(const char* path, const std::string& content) {
    if (!path) return false;

    FILE* file = fopen(path, "wb");
    if (!file) {
        LOG_ERROR("FS", "Failed to create file: " << path);
        return false;
    }

    size_t written = fwrite(content.data(), 1, content.size(), file);
    bool closed = fclose(file) == 0;

    if (written != content.size() || !closed) {
        LOG_ERROR("FS", "Failed to write complete content to file: " << path);
        return false;
    }

    return true;
}

std::optional<std::string> read_file_text(const char* path) {
    if (!path) return std::nullopt;

    FILE* file = fopen(path, "rb");
    if (!file) {
        LOG_ERROR("FS", "Failed to open file for reading: " << path);
        return std::nullopt;
    }

    std::string content;
    std::vector<char> buffer(4096);
    size_t bytes_read;
    while ((bytes_read = fread(buffer.data(), 1, buffer.size(), file)) > 0) {
        content.append(buffer.data(), bytes_read);
    }

    bool failed = ferror(file) != 0;
    fclose(file);

    if (failed) {
        LOG_ERROR("FS", "Failed to read file: " << path);
        return std::nullopt;
    }

    return content;
}

bool delete_file(const char* path) {
    if (!path) return false;
    return remove(path) == 0;
}

} // namespace btcore
