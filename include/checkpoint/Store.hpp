#pragma once

#include "sync/model/Checkpoint.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace ts::sync::model {
struct Endpoint;
}

namespace ts::checkpoint {

// Fixed-length identity of one synchronized pair, unique across a shared sink.
std::string instanceKey(const std::string& host,
                        const std::filesystem::path& path,
                        const std::filesystem::path& destination);

// Persists the last successful synchronization time of a (path, destination) pair.
// Implementations throw CheckpointError for unreadable or unwritable records.
class Store {
public:
    virtual ~Store() = default;

    [[nodiscard]] virtual std::optional<sync::model::Checkpoint> load(const sync::model::Endpoint& a,
                                                                      const sync::model::Endpoint& b,
                                                                      const std::string& key) const = 0;

    virtual void save(const sync::model::Endpoint& a,
                      const sync::model::Endpoint& b,
                      const std::string& key,
                      std::chrono::system_clock::time_point timestamp) = 0;

    [[nodiscard]] virtual std::string describe() const = 0;
};

}
