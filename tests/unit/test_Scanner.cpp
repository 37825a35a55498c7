#include "TreeFixture.hpp"
#include "sync/Scanner.hpp"
#include "sync/errors.hpp"
#include "sync/model/Endpoint.hpp"
#include "crypto/util/hash.hpp"

using namespace ts::sync;
using namespace ts::sync::model;

class ScannerTest : public TreeFixture {
protected:
    Endpoint endpoint() const { return {a, true}; }
};

TEST_F(ScannerTest, ReportsRelativeSlashSeparatedPaths) {
    writeFile(a / "top.txt", "t");
    writeFile(a / "docs" / "deep" / "note.md", "n");

    const auto tree = Scanner().scan(endpoint(), true);

    EXPECT_TRUE(tree.files.contains("top.txt"));
    EXPECT_TRUE(tree.files.contains("docs/deep/note.md"));
    EXPECT_TRUE(tree.directories.contains("docs"));
    EXPECT_TRUE(tree.directories.contains("docs/deep"));
    EXPECT_EQ(tree.files.size(), 2u);
    EXPECT_EQ(tree.directories.size(), 2u);
    EXPECT_EQ(tree.files.at("docs/deep/note.md").rel, "docs/deep/note.md");
}

TEST_F(ScannerTest, RecordsModificationTime) {
    const auto mtime = hoursAgo(3);
    writeFile(a / "f.txt", "x", mtime);

    const auto tree = Scanner().scan(endpoint(), true);
    EXPECT_EQ(tree.files.at("f.txt").mtime, mtime);
    EXPECT_FALSE(tree.files.at("f.txt").content_hash.has_value());
}

TEST_F(ScannerTest, NonRecursiveScanStaysAtTopLevel) {
    writeFile(a / "top.txt", "t");
    writeFile(a / "sub" / "inner.txt", "i");

    const auto tree = Scanner().scan(endpoint(), false);

    EXPECT_TRUE(tree.files.contains("top.txt"));
    EXPECT_TRUE(tree.directories.contains("sub"));
    EXPECT_FALSE(tree.files.contains("sub/inner.txt"));
}

TEST_F(ScannerTest, SkipsReservedNamesAndExclusions) {
    writeFile(a / ".treesync.json", "{}");
    writeFile(a / ".treesync-abcdefgh.tmp", "partial");
    writeFile(a / "keep.txt", "k");
    writeFile(a / "scratch.swp", "s");
    writeFile(a / "node_modules" / "pkg" / "index.js", "js");

    const auto tree = Scanner({"*.swp", "node_modules"}).scan(endpoint(), true);

    EXPECT_EQ(tree.files.size(), 1u);
    EXPECT_TRUE(tree.files.contains("keep.txt"));
    EXPECT_TRUE(tree.directories.empty());
}

TEST_F(ScannerTest, ExcludedMatchesNamesOnly) {
    const Scanner scanner({"*.log"});
    EXPECT_TRUE(scanner.excluded("build.log", false));
    EXPECT_TRUE(scanner.excluded(".treesync.json", true));
    EXPECT_TRUE(scanner.excluded(".treesync-abcdefgh.tmp", false));
    EXPECT_FALSE(scanner.excluded("build.log.txt", true));
    EXPECT_FALSE(scanner.excluded(".treesync-.tmp", true));
}

TEST_F(ScannerTest, ReservedNamesHiddenOnlyAtRoot) {
    writeFile(a / ".treesync.json", "{}");
    writeFile(a / "state.json", "root state");
    writeFile(a / "nested" / ".treesync.json", "user data");
    writeFile(a / "nested" / "state.json", "user data");

    const auto tree = Scanner({}, {"state.json"}).scan(endpoint(), true);

    EXPECT_FALSE(tree.files.contains(".treesync.json"));
    EXPECT_FALSE(tree.files.contains("state.json"));
    EXPECT_TRUE(tree.files.contains("nested/.treesync.json"));
    EXPECT_TRUE(tree.files.contains("nested/state.json"));
}

TEST_F(ScannerTest, SkipsSymlinks) {
    writeFile(a / "real.txt", "r");
    fs::create_symlink(a / "real.txt", a / "link.txt");
    fs::create_directory_symlink(b, a / "linked-dir");

    const auto tree = Scanner().scan(endpoint(), true);

    EXPECT_EQ(tree.files.size(), 1u);
    EXPECT_TRUE(tree.files.contains("real.txt"));
    EXPECT_TRUE(tree.directories.empty());
}

TEST_F(ScannerTest, MissingRootIsAScanError) {
    const Endpoint missing{root / "nope", false};
    EXPECT_THROW(Scanner().scan(missing, true), ScanError);
}

TEST_F(ScannerTest, HashIsLazyAndCached) {
    writeFile(a / "h.txt", "hello");
    auto tree = Scanner().scan(endpoint(), true);
    auto& entry = tree.files.at("h.txt");

    const auto expected = ts::crypto::hash::blake2bOf("hello");
    EXPECT_EQ(Scanner::hash(endpoint(), entry), expected);
    ASSERT_TRUE(entry.content_hash.has_value());

    writeFile(a / "h.txt", "changed");
    EXPECT_EQ(Scanner::hash(endpoint(), entry), expected);
}

TEST_F(ScannerTest, ScanDoesNotModifyTree) {
    writeFile(a / "f.txt", "x", hoursAgo(1));
    const auto before = listing(a);
    const auto mtime = fs::last_write_time(a / "f.txt");

    (void)Scanner().scan(endpoint(), true);

    EXPECT_EQ(listing(a), before);
    EXPECT_EQ(fs::last_write_time(a / "f.txt"), mtime);
}
