#include "util/files.hpp"

#include <fstream>
#include <random>
#include <stdexcept>
#include <system_error>

std::string ts::util::readFileToString(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw std::runtime_error("Failed to open file: " + path.string());

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::string buffer(size, '\0');
    if (!in.read(buffer.data(), size))
        throw std::runtime_error("Failed to read file: " + path.string());
    in.close();

    return buffer;
}

void ts::util::writeFileAtomic(const std::filesystem::path& absPath, const std::string& content) {
    const auto tmp = tempSiblingOf(absPath);

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw std::runtime_error("Failed to write file: " + tmp.string());
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.close();
        if (!out) {
            std::error_code ec;
            std::filesystem::remove(tmp, ec);
            throw std::runtime_error("Failed to write file: " + tmp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, absPath, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        throw std::filesystem::filesystem_error("Failed to replace file", tmp, absPath, ec);
    }
}

std::filesystem::path ts::util::tempSiblingOf(const std::filesystem::path& target) {
    return target.parent_path() / (std::string(TEMP_PREFIX) + generate_random_suffix() + std::string(TEMP_SUFFIX));
}

bool ts::util::isTempName(const std::string_view name) {
    return name.size() > TEMP_PREFIX.size() + TEMP_SUFFIX.size()
        && name.starts_with(TEMP_PREFIX) && name.ends_with(TEMP_SUFFIX);
}

std::string ts::util::generate_random_suffix(const size_t length) {
    static constexpr char charset[] =
        "0123456789"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 rng{std::random_device{}()};
    thread_local std::uniform_int_distribution<> dist(0, sizeof(charset) - 2);

    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) result += charset[dist(rng)];
    return result;
}
