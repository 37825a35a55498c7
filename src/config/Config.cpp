#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace ts::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    if (!std::filesystem::exists(path)) return cfg;

    YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
    if (auto node = root["checkpoint"]) YAML::convert<CheckpointConfig>::decode(node, cfg.checkpoint);
    if (auto node = root["scan"]) YAML::convert<ScanConfig>::decode(node, cfg.scan);
    if (auto node = root["sync"]) YAML::convert<SyncConfig>::decode(node, cfg.sync);

    return cfg;
}

std::string to_string(const CheckpointConfig::Strategy s) {
    switch (s) {
        case CheckpointConfig::Strategy::Sidecar: return "sidecar";
        case CheckpointConfig::Strategy::Xattr: return "xattr";
        default: throw std::invalid_argument("Unknown checkpoint strategy");
    }
}

CheckpointConfig::Strategy strategyFromString(const std::string& str) {
    if (str == "sidecar") return CheckpointConfig::Strategy::Sidecar;
    if (str == "xattr") return CheckpointConfig::Strategy::Xattr;
    throw std::invalid_argument("Unknown checkpoint strategy: " + str);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"logging", {
            {"log_dir", c.logging.log_dir.string()},
            {"console_log_level", spdlog::level::to_string_view(c.logging.levels.console_log_level).data()},
            {"file_log_level", spdlog::level::to_string_view(c.logging.levels.file_log_level).data()}
        }},
        {"checkpoint", c.checkpoint},
        {"scan", c.scan},
        {"sync", c.sync}
    };
}

void to_json(nlohmann::json& j, const CheckpointConfig& c) {
    j = {
        {"strategy", to_string(c.strategy)},
        {"sidecar_path", c.sidecar_path.string()},
        {"advance_on_item_errors", c.advance_on_item_errors}
    };
}

void to_json(nlohmann::json& j, const ScanConfig& c) {
    j = {{"exclude", c.exclude}};
}

void to_json(nlohmann::json& j, const SyncConfig& c) {
    j = {
        {"host_identity", c.host_identity},
        {"preset", c.preset}
    };
}

} // namespace ts::config
