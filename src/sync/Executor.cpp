#include "sync/Executor.hpp"
#include "sync/Scanner.hpp"
#include "sync/model/Diff.hpp"
#include "sync/model/Endpoint.hpp"
#include "sync/model/Policy.hpp"
#include "fs/Filesystem.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <map>
#include <system_error>
#include <utility>
#include <vector>

using namespace ts::sync;
using namespace ts::sync::model;
using ts::fs::Filesystem;

namespace {

struct Located {
    const Endpoint* at;
    std::string rel;
};

}

Executor::Executor(const Endpoint& source, const Endpoint& target, const Policy& policy, const Scanner& scanner)
    : source_(source), target_(target), policy_(policy), scanner_(scanner) {}

Result Executor::run(Diff& diff) {
    if (policy_.purge) purge();
    if (policy_.recurse) createDirectories(diff.directories);
    if (!policy_.skipFiles) copyMissing(diff.files);
    if (!policy_.skipExisting && !policy_.skipFiles) resolveCommon(diff.files);
    if (!policy_.skipDelete) deleteStale(diff.files, diff.directories);
    restoreDirectoryTimes(diff.directories);
    return std::move(result_);
}

template <typename Fn>
bool Executor::isolate(const std::filesystem::path& item, const Operation op, Fn&& fn) {
    try {
        std::forward<Fn>(fn)();
        return true;
    } catch (const std::exception& e) {
        log::Registry::sync()->error("[Executor] {} failed for {}: {}", to_string(op), item.string(), e.what());
        result_.fail(item.string(), op, e.what());
        return false;
    }
}

void Executor::purge() {
    const auto& root = target_.absolutePath;
    std::vector<std::filesystem::path> children;

    isolate(root, Operation::Purge, [&] {
        for (const auto& child : std::filesystem::directory_iterator(root))
            if (!scanner_.excluded(child.path().filename().string(), true)) children.push_back(child.path());
    });

    for (const auto& child : children)
        isolate(child, Operation::Purge, [&] { result_.stats.purged += Filesystem::removeAll(child); });

    log::Registry::sync()->info("[Executor] Purged {} entries under {}", result_.stats.purged, root.string());
}

void Executor::createDirectories(const DiffSets& dirs) {
    std::vector<Located> todo;

    // Present on the receiving side already (just old there): nothing to create.
    for (const auto& [rel, _] : dirs.missingAtTarget)
        if (!dirs.common.contains(rel)) todo.push_back({&target_, rel});
    for (const auto& [rel, _] : dirs.missingAtSource)
        if (!dirs.common.contains(rel)) todo.push_back({&source_, rel});

    // The source may not lose entries in a one-directional run, so whatever is old there
    // and gone from the target is restored rather than left behind.
    if (!policy_.bidirectional())
        for (const auto& [rel, _] : dirs.staleAtSource) todo.push_back({&target_, rel});

    std::ranges::stable_sort(todo, [](const Located& a, const Located& b) {
        return depth(a.rel) < depth(b.rel);
    });

    for (const auto& [at, rel] : todo) {
        const auto path = at->resolve(rel);
        if (isolate(path, Operation::CreateDirectory, [&] { Filesystem::mkdir(path); })) {
            ++result_.stats.directories_created;
            touched_.emplace(at, rel);
            touchParent(*at, rel);
            log::Registry::sync()->debug("[Executor] Created directory {}", path.string());
        }
    }
}

void Executor::copy(const Endpoint& from, const Endpoint& to, const std::string& rel, const Operation op) {
    const auto src = from.resolve(rel);
    const auto dst = to.resolve(rel);

    if (!isolate(dst, op, [&] { Filesystem::copy(src, dst); })) return;
    touchParent(to, rel);

    if (op == Operation::OverwriteFile) ++result_.stats.files_overwritten;
    else ++result_.stats.files_copied;

    log::Registry::sync()->debug("[Executor] {} {} -> {}", to_string(op), src.string(), dst.string());
}

void Executor::copyMissing(const DiffSets& files) {
    // Missing entries that exist on both sides are conflict candidates, left to resolveCommon().
    for (const auto& [rel, _] : files.missingAtTarget)
        if (!files.common.contains(rel)) copy(source_, target_, rel, Operation::CopyFile);

    for (const auto& [rel, _] : files.missingAtSource)
        if (!files.common.contains(rel)) copy(target_, source_, rel, Operation::CopyFile);

    if (!policy_.bidirectional())
        for (const auto& [rel, _] : files.staleAtSource) copy(source_, target_, rel, Operation::CopyFile);
}

bool Executor::sameContent(Entry& src, Entry& tgt) {
    if (!policy_.checkHash) return src.mtime == tgt.mtime;

    bool hashed = isolate(source_.resolve(src.rel), Operation::HashFile, [&] { Scanner::hash(source_, src); });
    hashed = hashed && isolate(target_.resolve(tgt.rel), Operation::HashFile, [&] { Scanner::hash(target_, tgt); });

    // Unhashable: leave both sides alone, the failure is already recorded.
    if (!hashed) return true;
    return *src.content_hash == *tgt.content_hash;
}

void Executor::resolveCommon(DiffSets& files) {
    for (auto& [rel, pair] : files.common) {
        if (sameContent(pair.source, pair.target)) continue;

        // One-directional runs always push source to target, regardless of recency.
        if (!policy_.bidirectional() || pair.source.mtime >= pair.target.mtime)
            copy(source_, target_, rel, Operation::OverwriteFile);
        else
            copy(target_, source_, rel, Operation::OverwriteFile);
    }
}

void Executor::deleteStale(const DiffSets& files, const DiffSets& dirs) {
    if (!policy_.skipFiles) {
        std::vector<Located> doomed;
        for (const auto& [rel, _] : files.staleAtTarget) doomed.push_back({&target_, rel});
        if (policy_.bidirectional())
            for (const auto& [rel, _] : files.staleAtSource) doomed.push_back({&source_, rel});

        for (const auto& [at, rel] : doomed) {
            const auto path = at->resolve(rel);
            if (isolate(path, Operation::DeleteFile, [&] { Filesystem::remove(path); })) {
                ++result_.stats.files_deleted;
                touchParent(*at, rel);
                log::Registry::sync()->debug("[Executor] Deleted file {}", path.string());
            }
        }
    }

    std::vector<Located> doomedDirs;
    for (const auto& [rel, _] : dirs.staleAtTarget) doomedDirs.push_back({&target_, rel});
    if (policy_.bidirectional())
        for (const auto& [rel, _] : dirs.staleAtSource) doomedDirs.push_back({&source_, rel});

    std::ranges::stable_sort(doomedDirs, [](const Located& a, const Located& b) {
        return depth(a.rel) > depth(b.rel);
    });

    for (const auto& [at, rel] : doomedDirs) {
        const auto path = at->resolve(rel);
        bool removed = false;
        if (!isolate(path, Operation::DeleteDirectory, [&] { removed = Filesystem::removeIfEmpty(path); })) continue;

        if (removed) {
            ++result_.stats.directories_deleted;
            touchParent(*at, rel);
            log::Registry::sync()->debug("[Executor] Deleted directory {}", path.string());
        } else {
            log::Registry::sync()->debug("[Executor] Keeping non-empty directory {}", path.string());
        }
    }
}

void Executor::touchParent(const Endpoint& at, const std::string& rel) {
    auto parent = std::filesystem::path(rel).parent_path().generic_string();
    if (!parent.empty()) touched_.emplace(&at, std::move(parent));
}

// Creating or filling a directory stamps it with the current time. Put back the scanned
// mtime (the newer side's for directories on both) so it does not count as new next run.
void Executor::restoreDirectoryTimes(const DiffSets& dirs) {
    std::map<std::string, std::filesystem::file_time_type> scanned;
    for (const auto& [rel, e] : dirs.missingAtTarget) scanned.emplace(rel, e.mtime);
    for (const auto& [rel, e] : dirs.missingAtSource) scanned.emplace(rel, e.mtime);
    if (!policy_.bidirectional())
        for (const auto& [rel, e] : dirs.staleAtSource) scanned.emplace(rel, e.mtime);
    for (const auto& [rel, pair] : dirs.common)
        scanned.insert_or_assign(rel, std::max(pair.source.mtime, pair.target.mtime));

    for (const auto& [at, rel] : touched_) {
        const auto it = scanned.find(rel);
        if (it == scanned.end()) continue;

        const auto path = at->resolve(rel);
        std::error_code ec;
        if (!std::filesystem::is_directory(path, ec)) continue; // removed later in this run

        isolate(path, Operation::SetModificationTime, [&] { Filesystem::setModified(path, it->second); });
    }
}
