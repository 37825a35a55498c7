#pragma once

#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace ts::sync::model {

enum class Direction { Forward, Reverse, Both };

enum class Preset { Sync, Merge, Mirror, Contribute, Missing };

// Fully resolved, immutable for the duration of one run.
struct Policy {
    Direction direction{Direction::Both};
    bool purge{false};
    bool recurse{true};
    bool checkHash{false};
    bool skipDelete{false};
    bool skipExisting{false};
    bool skipFiles{false};
    bool createPath{false};
    bool createDestination{false};

    [[nodiscard]] bool bidirectional() const { return direction == Direction::Both; }

    friend bool operator==(const Policy&, const Policy&) = default;
};

// Explicitly supplied fields; anything left empty is taken from the preset.
struct Overrides {
    std::optional<Direction> direction;
    std::optional<bool> purge;
    std::optional<bool> recurse;
    std::optional<bool> checkHash;
    std::optional<bool> skipDelete;
    std::optional<bool> skipExisting;
    std::optional<bool> skipFiles;
    std::optional<bool> createPath;
    std::optional<bool> createDestination;
};

std::string to_string(Direction d);
std::string to_string(Preset p);

Direction directionFromString(const std::string& str);
Preset presetFromString(const std::string& str);

void to_json(nlohmann::json& j, const Policy& p);

std::string to_string(const Policy& p);

}
