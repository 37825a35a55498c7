#pragma once

#include "config/Config.hpp"
#include "sync/model/Checkpoint.hpp"
#include "sync/model/Endpoint.hpp"
#include "sync/model/Result.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ts::checkpoint {
class Store;
}

namespace ts::sync {

namespace model {
struct Policy;
}

// Public entry point: one synchronous pass over a (path, destination) pair.
class Controller {
public:
    // Subtracted from the run start before saving; kernel mtimes lag system_clock.
    static constexpr std::chrono::seconds CHECKPOINT_TOLERANCE{2};

    struct Options {
        std::string host_identity;
        config::CheckpointConfig::Strategy strategy{config::CheckpointConfig::Strategy::Sidecar};
        std::filesystem::path sidecar_path{}; // empty => <destination>/.treesync.json
        bool advance_on_item_errors{true};
        std::vector<std::string> exclude{};
    };

    explicit Controller(Options options);

    static Options optionsFromConfig(const config::Config& cfg, std::string host_identity);

    // Throws EndpointError when an endpoint is missing and may not be created, and
    // ScanError when a tree cannot be enumerated. Item failures land in Result::errors.
    model::Result synchronize(const std::filesystem::path& path,
                              const std::filesystem::path& destination,
                              const model::Policy& policy) const;

    [[nodiscard]] const Options& options() const { return options_; }

private:
    Options options_;

    static model::Endpoint resolveEndpoint(const std::filesystem::path& raw, bool create);

    [[nodiscard]] std::unique_ptr<checkpoint::Store> makeStore(const model::Endpoint& path,
                                                               const model::Endpoint& destination) const;

    // Root-level names the scanner must hide: a custom sidecar kept inside an endpoint.
    [[nodiscard]] std::vector<std::string> reservedNames(const model::Endpoint& path,
                                                         const model::Endpoint& destination) const;

    static std::optional<model::Checkpoint> loadCheckpoint(const checkpoint::Store& store,
                                                           const model::Endpoint& path,
                                                           const model::Endpoint& destination,
                                                           const std::string& key);
};

}
