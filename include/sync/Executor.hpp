#pragma once

#include "sync/model/Result.hpp"

#include <filesystem>
#include <set>
#include <string>
#include <utility>

namespace ts::sync {

namespace model {
struct Endpoint;
struct Entry;
struct Policy;
struct Diff;
struct DiffSets;
}

class Scanner;

// Applies a diff in a fixed order: purge, directories, missing files, common files,
// stale deletions, then directory mtimes. Each item operation is fault-isolated
// into Result::errors.
class Executor {
public:
    Executor(const model::Endpoint& source,
             const model::Endpoint& target,
             const model::Policy& policy,
             const Scanner& scanner);

    // Consumes the executor; common entries get their content hashes cached.
    model::Result run(model::Diff& diff);

private:
    const model::Endpoint& source_;
    const model::Endpoint& target_;
    const model::Policy& policy_;
    const Scanner& scanner_;
    model::Result result_;

    // Receiving-side directories whose mtime this run changed.
    std::set<std::pair<const model::Endpoint*, std::string>> touched_;

    void purge();
    void createDirectories(const model::DiffSets& dirs);
    void copyMissing(const model::DiffSets& files);
    void resolveCommon(model::DiffSets& files);
    void deleteStale(const model::DiffSets& files, const model::DiffSets& dirs);
    void restoreDirectoryTimes(const model::DiffSets& dirs);

    void touchParent(const model::Endpoint& at, const std::string& rel);

    void copy(const model::Endpoint& from, const model::Endpoint& to, const std::string& rel, model::Operation op);
    [[nodiscard]] bool sameContent(model::Entry& src, model::Entry& tgt);

    template <typename Fn>
    bool isolate(const std::filesystem::path& item, model::Operation op, Fn&& fn);
};

}
