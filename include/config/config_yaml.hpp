#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace ts::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["treesync"]   = to_std_string(spdlog::level::to_string_view(rhs.treesync));
        node["sync"]       = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["scan"]       = to_std_string(spdlog::level::to_string_view(rhs.scan));
        node["checkpoint"] = to_std_string(spdlog::level::to_string_view(rhs.checkpoint));
        node["fs"]         = to_std_string(spdlog::level::to_string_view(rhs.fs));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.treesync = spdlog::level::from_str(node["treesync"].as<std::string>("info"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.scan = spdlog::level::from_str(node["scan"].as<std::string>("warn"));
        rhs.checkpoint = spdlog::level::from_str(node["checkpoint"].as<std::string>("info"));
        rhs.fs = spdlog::level::from_str(node["fs"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (const auto levels = node["log_levels"]) rhs.levels = levels.as<LogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<CheckpointConfig> {
    static Node encode(const CheckpointConfig& rhs) {
        Node node;
        node["strategy"] = ts::config::to_string(rhs.strategy);
        node["sidecar_path"] = rhs.sidecar_path.string();
        node["advance_on_item_errors"] = rhs.advance_on_item_errors;
        return node;
    }

    static bool decode(const Node& node, CheckpointConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.strategy = strategyFromString(node["strategy"].as<std::string>("sidecar"));
        rhs.sidecar_path = node["sidecar_path"].as<std::string>("");
        rhs.advance_on_item_errors = node["advance_on_item_errors"].as<bool>(true);
        return true;
    }
};

template<>
struct convert<ScanConfig> {
    static Node encode(const ScanConfig& rhs) {
        Node node;
        node["exclude"] = rhs.exclude;
        return node;
    }

    static bool decode(const Node& node, ScanConfig& rhs) {
        if (!node.IsMap()) return false;
        if (const auto exclude = node["exclude"]) rhs.exclude = exclude.as<std::vector<std::string>>();
        return true;
    }
};

template<>
struct convert<SyncConfig> {
    static Node encode(const SyncConfig& rhs) {
        Node node;
        node["host_identity"] = rhs.host_identity;
        node["preset"] = rhs.preset;
        return node;
    }

    static bool decode(const Node& node, SyncConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host_identity = node["host_identity"].as<std::string>("");
        rhs.preset = node["preset"].as<std::string>("Sync");
        return true;
    }
};

}
