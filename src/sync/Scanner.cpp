#include "sync/Scanner.hpp"
#include "sync/model/Endpoint.hpp"
#include "sync/errors.hpp"
#include "checkpoint/Sidecar.hpp"
#include "crypto/util/hash.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fnmatch.h>
#include <system_error>
#include <utility>

using namespace ts::sync;
using namespace ts::sync::model;

Scanner::Scanner(std::vector<std::string> exclude, std::vector<std::string> reserved)
    : exclude_(std::move(exclude)), reserved_(std::move(reserved)) {
    reserved_.emplace_back(checkpoint::Sidecar::DEFAULT_NAME);
}

bool Scanner::excluded(const std::string_view name, const bool atRoot) const {
    if (util::isTempName(name)) return true;
    if (atRoot && std::ranges::find(reserved_, name) != reserved_.end()) return true;

    const std::string n(name);
    for (const auto& pattern : exclude_)
        if (::fnmatch(pattern.c_str(), n.c_str(), 0) == 0) return true;

    return false;
}

Tree Scanner::scan(const Endpoint& endpoint, const bool recurse) const {
    namespace stdfs = std::filesystem;

    const auto& root = endpoint.absolutePath;
    Tree tree;
    std::error_code ec;

    stdfs::recursive_directory_iterator it(root, stdfs::directory_options::none, ec);
    if (ec) throw ScanError("Failed to open " + root.string() + ": " + ec.message());

    const stdfs::recursive_directory_iterator end;
    while (it != end) {
        const auto& entry = *it;
        const auto name = entry.path().filename().string();
        const auto status = entry.symlink_status(ec);
        if (ec) throw ScanError("Failed to stat " + entry.path().string() + ": " + ec.message());

        if (excluded(name, it.depth() == 0)) {
            log::Registry::scan()->debug("[Scanner] Excluded {}", entry.path().string());
            if (stdfs::is_directory(status)) it.disable_recursion_pending();
        } else if (stdfs::is_directory(status) || stdfs::is_regular_file(status)) {
            auto rel = entry.path().lexically_relative(root).generic_string();
            const auto mtime = entry.last_write_time(ec);
            if (ec) throw ScanError("Failed to read modification time of " + entry.path().string() + ": " + ec.message());

            if (stdfs::is_directory(status)) {
                if (!recurse) it.disable_recursion_pending();
                tree.directories.emplace(rel, Entry{rel, mtime});
            } else {
                tree.files.emplace(rel, Entry{rel, mtime});
            }
        } else {
            log::Registry::scan()->debug("[Scanner] Skipping unsupported entry type at {}", entry.path().string());
        }

        it.increment(ec);
        if (ec) throw ScanError("Failed to enumerate " + root.string() + ": " + ec.message());
    }

    log::Registry::scan()->debug("[Scanner] {}: {} files, {} directories",
                                 root.string(), tree.files.size(), tree.directories.size());
    return tree;
}

const std::string& Scanner::hash(const Endpoint& endpoint, Entry& entry) {
    if (!entry.content_hash) entry.content_hash = crypto::hash::blake2b(endpoint.resolve(entry.rel));
    return *entry.content_hash;
}
