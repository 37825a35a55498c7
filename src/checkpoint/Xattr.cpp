#include "checkpoint/Xattr.hpp"
#include "checkpoint/errors.hpp"
#include "sync/model/Endpoint.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <array>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <string>
#include <sys/xattr.h>

using namespace ts::checkpoint;
using namespace ts::sync::model;

namespace {

std::string attrName(const std::string& key) { return std::string(Xattr::ATTR_PREFIX) + key; }

std::string errnoMessage(const int err) { return std::strerror(err); }

}

bool Xattr::supported(const std::filesystem::path& dir) {
    const auto name = std::string(ATTR_PREFIX) + "probe";
    if (::setxattr(dir.c_str(), name.c_str(), "1", 1, 0) != 0) {
        log::Registry::checkpoint()->debug("[Xattr] Extended attributes unavailable on {}: {}",
                                           dir.string(), errnoMessage(errno));
        return false;
    }
    ::removexattr(dir.c_str(), name.c_str());
    return true;
}

std::optional<std::int64_t> Xattr::read(const std::filesystem::path& dir, const std::string& key) {
    const auto name = attrName(key);
    std::array<char, 32> buf{};

    const auto n = ::getxattr(dir.c_str(), name.c_str(), buf.data(), buf.size());
    if (n < 0) {
        if (errno == ENODATA) return std::nullopt;
        throw CheckpointError("Failed to read " + name + " on " + dir.string() + ": " + errnoMessage(errno));
    }

    std::int64_t ticks{};
    const auto* end = buf.data() + n;
    const auto [ptr, ec] = std::from_chars(buf.data(), end, ticks);
    if (ec != std::errc{} || ptr != end)
        throw CheckpointError("Malformed tick count in " + name + " on " + dir.string());

    return ticks;
}

void Xattr::write(const std::filesystem::path& dir, const std::string& key, const std::int64_t ticks) {
    const auto name = attrName(key);
    const auto value = std::to_string(ticks);

    if (::setxattr(dir.c_str(), name.c_str(), value.data(), value.size(), 0) != 0)
        throw CheckpointError("Failed to write " + name + " on " + dir.string() + ": " + errnoMessage(errno));
}

std::optional<Checkpoint> Xattr::load(const Endpoint& a, const Endpoint& b, const std::string& key) const {
    const auto va = read(a.absolutePath, key);
    const auto vb = read(b.absolutePath, key);

    if (!va && !vb) return std::nullopt;

    if (!va || !vb) {
        log::Registry::checkpoint()->warn("[Xattr] Checkpoint present on only one endpoint ({}), ignoring it",
                                          (va ? a : b).absolutePath.string());
        return std::nullopt;
    }

    if (*va != *vb) {
        log::Registry::checkpoint()->warn("[Xattr] Checkpoint mismatch between {} ({}) and {} ({}), ignoring it",
                                          a.absolutePath.string(), *va, b.absolutePath.string(), *vb);
        return std::nullopt;
    }

    return Checkpoint{key, util::fromTicks(*va)};
}

void Xattr::save(const Endpoint& a, const Endpoint& b, const std::string& key,
                 const std::chrono::system_clock::time_point timestamp) {
    const auto ticks = util::toTicks(timestamp);
    write(a.absolutePath, key, ticks);
    write(b.absolutePath, key, ticks);
}

std::string Xattr::describe() const { return "xattr"; }
