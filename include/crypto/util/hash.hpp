#pragma once

#include <string>
#include <string_view>
#include <filesystem>

namespace ts::crypto::hash {

// Hex BLAKE2b-256 digest of a file's content, streamed in 8 KiB chunks.
std::string blake2b(const std::filesystem::path& filepath);

// Hex BLAKE2b-256 digest of an in-memory string.
std::string blake2bOf(std::string_view data);

}
