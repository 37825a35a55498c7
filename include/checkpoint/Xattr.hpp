#pragma once

#include "checkpoint/Store.hpp"

#include <cstdint>
#include <filesystem>
#include <string_view>

namespace ts::checkpoint {

// Stores the checkpoint as a user extended attribute on both endpoint directories.
// A load only succeeds when both copies exist and agree, so a side restored from
// backup (carrying a stale or no attribute) forces a full comparison.
class Xattr final : public Store {
public:
    static constexpr std::string_view ATTR_PREFIX = "user.treesync.";

    // Probes by writing and removing a marker attribute.
    [[nodiscard]] static bool supported(const std::filesystem::path& dir);

    [[nodiscard]] std::optional<sync::model::Checkpoint> load(const sync::model::Endpoint& a,
                                                              const sync::model::Endpoint& b,
                                                              const std::string& key) const override;

    void save(const sync::model::Endpoint& a,
              const sync::model::Endpoint& b,
              const std::string& key,
              std::chrono::system_clock::time_point timestamp) override;

    [[nodiscard]] std::string describe() const override;

    static std::optional<std::int64_t> read(const std::filesystem::path& dir, const std::string& key);
    static void write(const std::filesystem::path& dir, const std::string& key, std::int64_t ticks);
};

}
