#pragma once

#include <cstdint>
#include <filesystem>

namespace ts::fs {

// Mutations applied to endpoint trees. Every call throws std::filesystem::filesystem_error
// (or std::runtime_error) on failure and leaves error isolation to the caller.
class Filesystem {
public:
    static void mkdir(const std::filesystem::path& absPath);

    // Copies content, permissions and modification time. The destination is replaced
    // by rename, so readers see either the old file or the complete new one.
    static void copy(const std::filesystem::path& from, const std::filesystem::path& to);

    static void setModified(const std::filesystem::path& absPath, std::filesystem::file_time_type mtime);

    static void remove(const std::filesystem::path& absPath);

    // Removes an empty directory; returns false (and does nothing) if it has children.
    static bool removeIfEmpty(const std::filesystem::path& absPath);

    // Recursively removes a file or directory, returns the number of entries removed.
    static std::uintmax_t removeAll(const std::filesystem::path& absPath);
};

}
