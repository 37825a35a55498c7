#include <gtest/gtest.h>
#include "sync/Differ.hpp"
#include "sync/PolicyResolver.hpp"
#include "sync/model/Checkpoint.hpp"
#include "sync/model/Policy.hpp"
#include "util/timestamp.hpp"

#include <chrono>
#include <set>

using namespace ts::sync;
using namespace ts::sync::model;

namespace {

using Clock = std::filesystem::file_time_type::clock;

const auto CHECKPOINT = Clock::now();
const auto BEFORE = CHECKPOINT - std::chrono::hours(1);
const auto AFTER = CHECKPOINT + std::chrono::hours(1);

EntryMap entries(std::initializer_list<std::pair<std::string, std::filesystem::file_time_type>> items) {
    EntryMap m;
    for (const auto& [rel, mtime] : items) m.emplace(rel, Entry{rel, mtime});
    return m;
}

template <typename M>
std::set<std::string> keys(const M& m) {
    std::set<std::string> out;
    for (const auto& [k, _] : m) out.insert(k);
    return out;
}

}

TEST(DifferTest, WithoutCheckpointEverythingIsNew) {
    const auto src = entries({{"a", BEFORE}, {"shared", BEFORE}});
    const auto tgt = entries({{"b", BEFORE}, {"shared", AFTER}});

    const auto d = Differ::classify(src, tgt, std::nullopt, true);

    EXPECT_EQ(keys(d.missingAtTarget), std::set<std::string>{"a"});
    EXPECT_EQ(keys(d.missingAtSource), std::set<std::string>{"b"});
    EXPECT_EQ(keys(d.common), std::set<std::string>{"shared"});
    EXPECT_TRUE(d.staleAtTarget.empty());
    EXPECT_TRUE(d.staleAtSource.empty());
}

TEST(DifferTest, OldEntriesOnOneSideAreStale) {
    const auto src = entries({{"new-src", AFTER}, {"old-src", BEFORE}, {"kept", BEFORE}});
    const auto tgt = entries({{"new-tgt", AFTER}, {"old-tgt", BEFORE}, {"kept", BEFORE}});

    const auto d = Differ::classify(src, tgt, CHECKPOINT, true);

    EXPECT_EQ(keys(d.missingAtTarget), std::set<std::string>{"new-src"});
    EXPECT_EQ(keys(d.missingAtSource), std::set<std::string>{"new-tgt"});
    EXPECT_EQ(keys(d.common), std::set<std::string>{"kept"});
    EXPECT_EQ(keys(d.staleAtTarget), std::set<std::string>{"old-tgt"});
    EXPECT_EQ(keys(d.staleAtSource), std::set<std::string>{"old-src"});
}

TEST(DifferTest, OneDirectionalRunHasNothingMissingAtSource) {
    const auto src = entries({});
    const auto tgt = entries({{"fresh", AFTER}});

    const auto d = Differ::classify(src, tgt, CHECKPOINT, false);

    EXPECT_TRUE(d.missingAtSource.empty());
    EXPECT_TRUE(d.staleAtTarget.empty());
}

TEST(DifferTest, FreshEntryOldOnOtherSideIsMissingAndCommon) {
    const auto src = entries({{"x", AFTER}});
    const auto tgt = entries({{"x", BEFORE}});

    const auto d = Differ::classify(src, tgt, CHECKPOINT, true);

    EXPECT_EQ(keys(d.missingAtTarget), std::set<std::string>{"x"});
    EXPECT_EQ(keys(d.common), std::set<std::string>{"x"});
    EXPECT_TRUE(d.staleAtTarget.empty());
}

TEST(DifferTest, MtimeEqualToCheckpointCountsAsNew) {
    const auto tgt = entries({{"edge", CHECKPOINT}});
    const auto d = Differ::classify({}, tgt, CHECKPOINT, true);

    EXPECT_EQ(keys(d.missingAtSource), std::set<std::string>{"edge"});
    EXPECT_TRUE(d.staleAtTarget.empty());
}

TEST(DifferTest, CommonKeepsBothSides) {
    const auto d = Differ::classify(entries({{"f", BEFORE}}), entries({{"f", AFTER}}), std::nullopt, true);

    ASSERT_EQ(d.common.size(), 1u);
    EXPECT_EQ(d.common.at("f").source.mtime, BEFORE);
    EXPECT_EQ(d.common.at("f").target.mtime, AFTER);
}

TEST(DifferTest, FilesAndDirectoriesAreDiffedIndependently) {
    Tree src, tgt;
    src.files = entries({{"docs/readme.txt", BEFORE}});
    src.directories = entries({{"docs", BEFORE}});
    tgt.directories = entries({{"docs", BEFORE}});

    const auto d = Differ::diff(src, tgt, std::nullopt, PolicyResolver::resolve(Preset::Sync));

    EXPECT_EQ(keys(d.files.missingAtTarget), std::set<std::string>{"docs/readme.txt"});
    EXPECT_EQ(keys(d.directories.common), std::set<std::string>{"docs"});
    EXPECT_TRUE(d.directories.missingAtTarget.empty());
}

TEST(DifferTest, PurgeTreatsTargetAsEmptyAndIgnoresCheckpoint) {
    Tree src, tgt;
    src.files = entries({{"old", BEFORE}, {"new", AFTER}});
    tgt.files = entries({{"old", BEFORE}, {"junk", BEFORE}});

    Overrides o;
    o.purge = true;
    const auto policy = PolicyResolver::resolve(Preset::Mirror, o);
    const Checkpoint cp{"key", ts::util::toSys(CHECKPOINT)};

    const auto d = Differ::diff(src, tgt, cp, policy);

    EXPECT_EQ(keys(d.files.missingAtTarget), (std::set<std::string>{"new", "old"}));
    EXPECT_TRUE(d.files.common.empty());
    EXPECT_TRUE(d.files.staleAtTarget.empty());
    EXPECT_TRUE(d.files.staleAtSource.empty());
}

TEST(DifferTest, CheckpointConvertsToFileClock) {
    Tree src, tgt;
    tgt.files = entries({{"gone", BEFORE}});

    const Checkpoint cp{"key", ts::util::toSys(CHECKPOINT)};
    const auto d = Differ::diff(src, tgt, cp, PolicyResolver::resolve(Preset::Mirror));

    EXPECT_EQ(keys(d.files.staleAtTarget), std::set<std::string>{"gone"});
}
