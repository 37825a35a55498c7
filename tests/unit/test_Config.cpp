#include "TreeFixture.hpp"
#include "config/Config.hpp"
#include "config/ConfigRegistry.hpp"

#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace ts::config;

class ConfigTest : public TreeFixture {
protected:
    fs::path yaml() const { return root / "config.yaml"; }
};

TEST_F(ConfigTest, MissingFileGivesDefaults) {
    const auto cfg = loadConfig(root / "absent.yaml");

    EXPECT_EQ(cfg.checkpoint.strategy, CheckpointConfig::Strategy::Sidecar);
    EXPECT_TRUE(cfg.checkpoint.sidecar_path.empty());
    EXPECT_TRUE(cfg.checkpoint.advance_on_item_errors);
    EXPECT_TRUE(cfg.scan.exclude.empty());
    EXPECT_EQ(cfg.sync.preset, "Sync");
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.scan, spdlog::level::warn);
}

TEST_F(ConfigTest, ParsesEverySection) {
    writeFile(yaml(), R"(
logging:
  log_dir: /var/log/treesync
  log_levels:
    console_log_level: error
    file_log_level: trace
    subsystem_levels:
      sync: debug
checkpoint:
  strategy: xattr
  sidecar_path: /var/lib/treesync/state.json
  advance_on_item_errors: false
scan:
  exclude: ["*.swp", ".git"]
sync:
  host_identity: build-box
  preset: Mirror
)");

    const auto cfg = loadConfig(yaml());

    EXPECT_EQ(cfg.logging.log_dir, "/var/log/treesync");
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::err);
    EXPECT_EQ(cfg.logging.levels.file_log_level, spdlog::level::trace);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.sync, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.checkpoint, spdlog::level::info);
    EXPECT_EQ(cfg.checkpoint.strategy, CheckpointConfig::Strategy::Xattr);
    EXPECT_EQ(cfg.checkpoint.sidecar_path, "/var/lib/treesync/state.json");
    EXPECT_FALSE(cfg.checkpoint.advance_on_item_errors);
    EXPECT_EQ(cfg.scan.exclude, (std::vector<std::string>{"*.swp", ".git"}));
    EXPECT_EQ(cfg.sync.host_identity, "build-box");
    EXPECT_EQ(cfg.sync.preset, "Mirror");
}

TEST_F(ConfigTest, PartialSectionsKeepDefaults) {
    writeFile(yaml(), "scan:\n  exclude: [\"*.bak\"]\n");

    const auto cfg = loadConfig(yaml());

    EXPECT_EQ(cfg.scan.exclude.size(), 1u);
    EXPECT_EQ(cfg.checkpoint.strategy, CheckpointConfig::Strategy::Sidecar);
    EXPECT_EQ(cfg.sync.preset, "Sync");
}

TEST_F(ConfigTest, UnknownStrategyIsRejected) {
    writeFile(yaml(), "checkpoint:\n  strategy: database\n");
    EXPECT_THROW(loadConfig(yaml()), std::invalid_argument);
}

TEST_F(ConfigTest, StrategyStrings) {
    EXPECT_EQ(strategyFromString(to_string(CheckpointConfig::Strategy::Xattr)), CheckpointConfig::Strategy::Xattr);
    EXPECT_EQ(to_string(CheckpointConfig::Strategy::Sidecar), "sidecar");
}

TEST_F(ConfigTest, RegistryIsInitializedOnce) {
    Config other;
    other.sync.preset = "Missing";
    ConfigRegistry::init(other);

    EXPECT_EQ(ConfigRegistry::get().sync.preset, "Sync");
}

TEST_F(ConfigTest, JsonView) {
    Config cfg;
    cfg.scan.exclude = {"*.tmp"};
    const nlohmann::json j = cfg;

    EXPECT_EQ(j.at("checkpoint").at("strategy"), "sidecar");
    EXPECT_EQ(j.at("scan").at("exclude").size(), 1u);
    EXPECT_EQ(j.at("sync").at("preset"), "Sync");
}
