#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace ts::config {

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum treesync   = spdlog::level::info;   // Run start/finish, fatal errors
    spdlog::level::level_enum sync       = spdlog::level::info;   // Per-item operations and failures
    spdlog::level::level_enum scan       = spdlog::level::warn;   // Skipped entries, unreadable trees
    spdlog::level::level_enum checkpoint = spdlog::level::info;   // Load/save, integrity mismatches
    spdlog::level::level_enum fs         = spdlog::level::warn;   // Underlying I/O issues
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir{}; // empty => console only
    LogLevelsConfig levels;
};

struct CheckpointConfig {
    enum class Strategy { Sidecar, Xattr };

    Strategy strategy = Strategy::Sidecar;
    std::filesystem::path sidecar_path{}; // empty => <destination>/.treesync.json
    bool advance_on_item_errors = true;
};

struct ScanConfig {
    std::vector<std::string> exclude{};
};

struct SyncConfig {
    std::string host_identity{}; // empty => gethostname()
    std::string preset = "Sync";
};

struct Config {
    LoggingConfig logging;
    CheckpointConfig checkpoint;
    ScanConfig scan;
    SyncConfig sync;
};

Config loadConfig(const std::filesystem::path& path);

std::string to_string(CheckpointConfig::Strategy s);
CheckpointConfig::Strategy strategyFromString(const std::string& str);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const CheckpointConfig& c);
void to_json(nlohmann::json& j, const ScanConfig& c);
void to_json(nlohmann::json& j, const SyncConfig& c);

} // namespace ts::config
