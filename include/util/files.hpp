#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace ts::util {

inline constexpr std::string_view TEMP_PREFIX = ".treesync-";
inline constexpr std::string_view TEMP_SUFFIX = ".tmp";

std::string readFileToString(const std::filesystem::path& path);

// Writes to a sibling temp file and renames it over absPath.
void writeFileAtomic(const std::filesystem::path& absPath, const std::string& content);

// A not-yet-existing path next to target for staging a replacement.
std::filesystem::path tempSiblingOf(const std::filesystem::path& target);

[[nodiscard]] bool isTempName(std::string_view name);

std::string generate_random_suffix(size_t length = 8);

}
