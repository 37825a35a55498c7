#pragma once

#include "checkpoint/Store.hpp"

#include <filesystem>
#include <string_view>

namespace ts::checkpoint {

// JSON document mapping instance keys to tick counts; many pairs may share one file.
class Sidecar final : public Store {
public:
    static constexpr std::string_view DEFAULT_NAME = ".treesync.json";

    explicit Sidecar(std::filesystem::path path);

    [[nodiscard]] std::optional<sync::model::Checkpoint> load(const sync::model::Endpoint& a,
                                                              const sync::model::Endpoint& b,
                                                              const std::string& key) const override;

    void save(const sync::model::Endpoint& a,
              const sync::model::Endpoint& b,
              const std::string& key,
              std::chrono::system_clock::time_point timestamp) override;

    [[nodiscard]] std::string describe() const override;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

}
