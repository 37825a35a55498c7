#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace ts::sync::model {

// One file or directory of a scanned tree.
struct Entry {
    std::string rel; // normalized relative path: no leading '/', '/' separators
    std::filesystem::file_time_type mtime{};
    std::optional<std::string> content_hash{}; // filled lazily, files only
};

using EntryMap = std::map<std::string, Entry>;

struct Tree {
    EntryMap files;
    EntryMap directories;
};

// Number of path components, used to order creations and deletions.
inline std::size_t depth(const std::string& rel) {
    std::size_t n = 1;
    for (const char c : rel) if (c == '/') ++n;
    return n;
}

}
