#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "sync/Controller.hpp"
#include "sync/PolicyResolver.hpp"
#include "sync/errors.hpp"

#include <unistd.h>
#include <climits>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace ts::config;
using namespace ts::sync;
using namespace ts::sync::model;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_ITEM_ERRORS = 1;
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_FATAL = 3;

constexpr const auto* DEFAULT_CONFIG = "/etc/treesync/config.yaml";

constexpr const auto* USAGE =
    "usage: treesync <path> <destination> [--preset NAME] [--config FILE] [--json]\n"
    "                [--direction forward|reverse|both] [--purge] [--no-recurse] [--check-hash]\n"
    "                [--skip-delete] [--no-skip-delete] [--skip-existing] [--skip-files]\n"
    "                [--create-path] [--create-destination] [--strategy sidecar|xattr]\n"
    "presets: Sync, Merge, Mirror, Contribute, Missing\n";

struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct Args {
    std::vector<std::string> positional;
    std::optional<std::string> preset, config, strategy;
    Overrides overrides;
    bool json = false;
};

Args parseArgs(const int argc, char** argv) {
    Args args;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        const auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw UsageError("Missing value for " + arg);
            return argv[++i];
        };

        if (arg == "--preset") args.preset = value();
        else if (arg == "--config") args.config = value();
        else if (arg == "--strategy") args.strategy = value();
        else if (arg == "--json") args.json = true;
        else if (arg == "--direction") args.overrides.direction = directionFromString(value());
        else if (arg == "--purge") args.overrides.purge = true;
        else if (arg == "--no-recurse") args.overrides.recurse = false;
        else if (arg == "--check-hash") args.overrides.checkHash = true;
        else if (arg == "--skip-delete") args.overrides.skipDelete = true;
        else if (arg == "--no-skip-delete") args.overrides.skipDelete = false;
        else if (arg == "--skip-existing") args.overrides.skipExisting = true;
        else if (arg == "--skip-files") args.overrides.skipFiles = true;
        else if (arg == "--create-path") args.overrides.createPath = true;
        else if (arg == "--create-destination") args.overrides.createDestination = true;
        else if (arg.starts_with("--")) throw UsageError("Unknown option " + arg);
        else args.positional.push_back(arg);
    }

    if (args.positional.size() != 2) throw UsageError("Expected exactly two paths");
    return args;
}

std::string hostIdentity(const Config& cfg) {
    if (!cfg.sync.host_identity.empty()) return cfg.sync.host_identity;
    char buf[HOST_NAME_MAX + 1]{};
    if (::gethostname(buf, sizeof(buf)) != 0) return "localhost";
    return buf;
}

void printSummary(const Result& result) {
    const auto& s = result.stats;
    fmt::print("directories created: {}\nfiles copied:        {}\nfiles overwritten:   {}\n"
               "files deleted:       {}\ndirectories deleted: {}\npurged:              {}\n",
               s.directories_created, s.files_copied, s.files_overwritten,
               s.files_deleted, s.directories_deleted, s.purged);
    fmt::print("checkpoint:          {}\n", result.checkpoint_saved ? "saved" : "kept");
    for (const auto& e : result.errors)
        fmt::print(stderr, "error: {} {}: {}\n", to_string(e.operation), e.item, e.cause);
}

}

int main(const int argc, char** argv) {
    Args args;
    Policy policy;

    try {
        args = parseArgs(argc, argv);

        ConfigRegistry::init(std::filesystem::path(args.config.value_or(DEFAULT_CONFIG)));
        ts::log::Registry::init();

        const auto& cfg = ConfigRegistry::get();
        policy = PolicyResolver::resolve(presetFromString(args.preset.value_or(cfg.sync.preset)), args.overrides);
    } catch (const UsageError& e) {
        fmt::print(stderr, "{}\n{}", e.what(), USAGE);
        return EXIT_USAGE;
    } catch (const std::invalid_argument& e) {
        fmt::print(stderr, "{}\n{}", e.what(), USAGE);
        return EXIT_USAGE;
    } catch (const std::exception& e) {
        fmt::print(stderr, "Failed to initialize treesync: {}\n", e.what());
        return EXIT_FATAL;
    }

    try {
        const auto& cfg = ConfigRegistry::get();
        auto options = Controller::optionsFromConfig(cfg, hostIdentity(cfg));
        if (args.strategy) options.strategy = strategyFromString(*args.strategy);

        const auto path = std::filesystem::absolute(args.positional[0]);
        const auto destination = std::filesystem::absolute(args.positional[1]);

        const auto result = Controller(std::move(options)).synchronize(path, destination, policy);

        if (args.json) fmt::print("{}\n", nlohmann::json(result).dump(2));
        else printSummary(result);

        return result.ok() ? EXIT_OK : EXIT_ITEM_ERRORS;
    } catch (const std::invalid_argument& e) {
        fmt::print(stderr, "{}\n{}", e.what(), USAGE);
        return EXIT_USAGE;
    } catch (const EndpointError& e) {
        ts::log::Registry::treesync()->error("[main] {}", e.what());
        return EXIT_FATAL;
    } catch (const ScanError& e) {
        ts::log::Registry::treesync()->error("[main] Scan aborted, nothing was changed: {}", e.what());
        return EXIT_FATAL;
    } catch (const std::exception& e) {
        ts::log::Registry::treesync()->critical("[main] Fatal error: {}", e.what());
        return EXIT_FATAL;
    }
}
