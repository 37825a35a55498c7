#include "TreeFixture.hpp"
#include "checkpoint/Sidecar.hpp"
#include "checkpoint/Xattr.hpp"
#include "checkpoint/errors.hpp"
#include "sync/model/Endpoint.hpp"
#include "util/timestamp.hpp"

#include <chrono>
#include <nlohmann/json.hpp>

using namespace ts::checkpoint;
using namespace ts::sync::model;
using namespace std::chrono;

class CheckpointTest : public TreeFixture {
protected:
    Endpoint epA() const { return {a, true}; }
    Endpoint epB() const { return {b, true}; }
    fs::path sidecarPath() const { return b / Sidecar::DEFAULT_NAME; }
};

TEST(InstanceKeyTest, FixedLengthHex) {
    const auto key = instanceKey("host", "/data/a", "/data/b");
    EXPECT_EQ(key.size(), 64u);
    EXPECT_EQ(key.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST(InstanceKeyTest, DependsOnHostAndOrder) {
    const auto key = instanceKey("host", "/data/a", "/data/b");
    EXPECT_EQ(key, instanceKey("host", "/data/a", "/data/b"));
    EXPECT_NE(key, instanceKey("other", "/data/a", "/data/b"));
    EXPECT_NE(key, instanceKey("host", "/data/b", "/data/a"));
}

TEST(TicksTest, EpochAndRoundTrip) {
    EXPECT_EQ(ts::util::toTicks(system_clock::time_point{}), ts::util::UNIX_EPOCH_TICKS);

    // 2000-01-01T00:00:00Z
    const system_clock::time_point y2k{seconds{946684800}};
    EXPECT_EQ(ts::util::toTicks(y2k), 630822816000000000);
    EXPECT_EQ(ts::util::fromTicks(630822816000000000), y2k);
}

TEST_F(CheckpointTest, SidecarMissingFileMeansNoCheckpoint) {
    Sidecar store(sidecarPath());
    EXPECT_FALSE(store.load(epA(), epB(), "k").has_value());
}

TEST_F(CheckpointTest, SidecarSaveThenLoad) {
    Sidecar store(sidecarPath());
    const system_clock::time_point when{seconds{1'700'000'000}};

    store.save(epA(), epB(), "k", when);

    const auto cp = store.load(epA(), epB(), "k");
    ASSERT_TRUE(cp.has_value());
    EXPECT_EQ(cp->instance_key, "k");
    EXPECT_EQ(cp->last_sync, when);

    const auto doc = nlohmann::json::parse(readFile(sidecarPath()));
    EXPECT_TRUE(doc.at("k").is_number_integer());
    EXPECT_EQ(doc.at("k").get<std::int64_t>(), ts::util::toTicks(when));
}

TEST_F(CheckpointTest, SidecarPreservesOtherPairs) {
    writeFile(sidecarPath(), R"({"other": 42})");
    Sidecar store(sidecarPath());

    store.save(epA(), epB(), "k", system_clock::now());
    store.save(epA(), epB(), "k", system_clock::now());

    const auto doc = nlohmann::json::parse(readFile(sidecarPath()));
    EXPECT_EQ(doc.size(), 2u);
    EXPECT_EQ(doc.at("other").get<std::int64_t>(), 42);
}

TEST_F(CheckpointTest, SidecarCorruptDocument) {
    writeFile(sidecarPath(), "not json at all");
    Sidecar store(sidecarPath());

    EXPECT_THROW((void)store.load(epA(), epB(), "k"), CheckpointError);

    store.save(epA(), epB(), "k", system_clock::now());
    EXPECT_TRUE(store.load(epA(), epB(), "k").has_value());
}

TEST_F(CheckpointTest, SidecarNonIntegerValue) {
    writeFile(sidecarPath(), R"({"k": "yesterday"})");
    EXPECT_THROW((void)Sidecar(sidecarPath()).load(epA(), epB(), "k"), CheckpointError);
}

TEST_F(CheckpointTest, SidecarLeavesNoTempFiles) {
    Sidecar(sidecarPath()).save(epA(), epB(), "k", system_clock::now());

    for (const auto& e : fs::directory_iterator(b))
        EXPECT_FALSE(ts::util::isTempName(e.path().filename().string())) << e.path();
}

TEST_F(CheckpointTest, XattrRequiresBothEndpointsToAgree) {
    if (!Xattr::supported(a) || !Xattr::supported(b))
        GTEST_SKIP() << "user extended attributes unsupported under " << root;

    Xattr store;
    const system_clock::time_point when{seconds{1'700'000'000}};

    EXPECT_FALSE(store.load(epA(), epB(), "k").has_value());

    store.save(epA(), epB(), "k", when);
    const auto cp = store.load(epA(), epB(), "k");
    ASSERT_TRUE(cp.has_value());
    EXPECT_EQ(cp->last_sync, when);
    EXPECT_EQ(Xattr::read(a, "k"), ts::util::toTicks(when));

    Xattr::write(b, "k", ts::util::toTicks(when) + 1);
    EXPECT_FALSE(store.load(epA(), epB(), "k").has_value());

    Xattr::write(b, "other", 5);
    EXPECT_FALSE(store.load(epA(), epB(), "other").has_value());
}
