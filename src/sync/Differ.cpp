#include "sync/Differ.hpp"
#include "sync/model/Checkpoint.hpp"
#include "sync/model/Policy.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

using namespace ts::sync;
using namespace ts::sync::model;

namespace {

struct Partition {
    EntryMap fresh, old;
};

// Without a checkpoint everything is new, so nothing is ever stale.
Partition partition(const EntryMap& entries, const std::optional<std::filesystem::file_time_type>& since) {
    Partition p;
    for (const auto& [rel, e] : entries) {
        if (!since || e.mtime >= *since) p.fresh.emplace(rel, e);
        else p.old.emplace(rel, e);
    }
    return p;
}

// Entries of a whose relative path is not a key of b.
template <typename M>
EntryMap minus(const EntryMap& a, const M& b) {
    EntryMap out;
    for (const auto& [rel, e] : a)
        if (!b.contains(rel)) out.emplace(rel, e);
    return out;
}

}

DiffSets Differ::classify(const EntryMap& source,
                          const EntryMap& target,
                          const std::optional<std::filesystem::file_time_type>& since,
                          const bool bidirectional) {
    const auto src = partition(source, since);
    const auto tgt = partition(target, since);

    DiffSets d;
    d.missingAtTarget = minus(src.fresh, tgt.fresh);
    if (bidirectional) d.missingAtSource = minus(tgt.fresh, src.fresh);

    for (const auto& [rel, e] : source)
        if (const auto it = target.find(rel); it != target.end())
            d.common.emplace(rel, CommonPair{e, it->second});

    d.staleAtTarget = minus(tgt.old, d.common);
    d.staleAtSource = minus(src.old, d.common);
    return d;
}

Diff Differ::diff(const Tree& source,
                  const Tree& target,
                  const std::optional<Checkpoint>& checkpoint,
                  const Policy& policy) {
    // A purge empties the target before anything else runs; diff against that state.
    static const Tree empty{};
    const auto& tgt = policy.purge ? empty : target;

    std::optional<std::filesystem::file_time_type> since;
    if (checkpoint && !policy.purge) since = util::toFileTime(checkpoint->last_sync);

    Diff d;
    d.files = classify(source.files, tgt.files, since, policy.bidirectional());
    d.directories = classify(source.directories, tgt.directories, since, policy.bidirectional());

    log::Registry::sync()->debug(
        "[Differ] files: {} missing at target, {} missing at source, {} common, {} stale at target, {} stale at source",
        d.files.missingAtTarget.size(), d.files.missingAtSource.size(), d.files.common.size(),
        d.files.staleAtTarget.size(), d.files.staleAtSource.size());

    return d;
}
