#include "fs/Filesystem.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <stdexcept>
#include <system_error>

using namespace ts::fs;

void Filesystem::mkdir(const std::filesystem::path& absPath) {
    log::Registry::fs()->debug("[Filesystem::mkdir] Creating directory at: {}", absPath.string());

    if (absPath.empty()) throw std::runtime_error("Cannot create directory at empty path");

    std::error_code ec;
    std::filesystem::create_directories(absPath, ec);
    if (ec) throw std::filesystem::filesystem_error("Failed to create directory", absPath, ec);
    if (!std::filesystem::is_directory(absPath))
        throw std::filesystem::filesystem_error("Path exists and is not a directory", absPath,
                                                std::make_error_code(std::errc::not_a_directory));
}

void Filesystem::copy(const std::filesystem::path& from, const std::filesystem::path& to) {
    log::Registry::fs()->debug("[Filesystem::copy] {} -> {}", from.string(), to.string());

    const auto mtime = std::filesystem::last_write_time(from);
    if (to.has_parent_path()) mkdir(to.parent_path());

    const auto tmp = util::tempSiblingOf(to);
    std::error_code ec;

    std::filesystem::copy_file(from, tmp, std::filesystem::copy_options::overwrite_existing, ec);
    if (!ec) std::filesystem::last_write_time(tmp, mtime, ec);
    if (!ec) std::filesystem::rename(tmp, to, ec);

    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        throw std::filesystem::filesystem_error("Failed to copy file", from, to, ec);
    }
}

void Filesystem::setModified(const std::filesystem::path& absPath, const std::filesystem::file_time_type mtime) {
    log::Registry::fs()->debug("[Filesystem::setModified] {}", absPath.string());
    std::filesystem::last_write_time(absPath, mtime);
}

void Filesystem::remove(const std::filesystem::path& absPath) {
    log::Registry::fs()->debug("[Filesystem::remove] {}", absPath.string());

    if (std::filesystem::is_directory(std::filesystem::symlink_status(absPath)))
        throw std::filesystem::filesystem_error("Refusing to remove directory as file", absPath,
                                                std::make_error_code(std::errc::is_a_directory));

    std::error_code ec;
    if (!std::filesystem::remove(absPath, ec) && !ec)
        ec = std::make_error_code(std::errc::no_such_file_or_directory);
    if (ec) throw std::filesystem::filesystem_error("Failed to remove file", absPath, ec);
}

bool Filesystem::removeIfEmpty(const std::filesystem::path& absPath) {
    if (!std::filesystem::is_empty(absPath)) return false;

    log::Registry::fs()->debug("[Filesystem::removeIfEmpty] {}", absPath.string());
    std::filesystem::remove(absPath);
    return true;
}

std::uintmax_t Filesystem::removeAll(const std::filesystem::path& absPath) {
    log::Registry::fs()->debug("[Filesystem::removeAll] {}", absPath.string());
    return std::filesystem::remove_all(absPath);
}
