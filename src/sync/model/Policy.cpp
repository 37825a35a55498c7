#include "sync/model/Policy.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace ts::sync::model;

namespace {

std::string lower(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

}

std::string ts::sync::model::to_string(const Direction d) {
    switch (d) {
        case Direction::Forward: return "forward";
        case Direction::Reverse: return "reverse";
        case Direction::Both: return "both";
        default: throw std::invalid_argument("Unknown direction");
    }
}

std::string ts::sync::model::to_string(const Preset p) {
    switch (p) {
        case Preset::Sync: return "Sync";
        case Preset::Merge: return "Merge";
        case Preset::Mirror: return "Mirror";
        case Preset::Contribute: return "Contribute";
        case Preset::Missing: return "Missing";
        default: throw std::invalid_argument("Unknown preset");
    }
}

Direction ts::sync::model::directionFromString(const std::string& str) {
    const auto s = lower(str);
    if (s == "forward") return Direction::Forward;
    if (s == "reverse") return Direction::Reverse;
    if (s == "both") return Direction::Both;
    throw std::invalid_argument("Unknown direction: " + str);
}

Preset ts::sync::model::presetFromString(const std::string& str) {
    const auto s = lower(str);
    if (s == "sync") return Preset::Sync;
    if (s == "merge") return Preset::Merge;
    if (s == "mirror") return Preset::Mirror;
    if (s == "contribute") return Preset::Contribute;
    if (s == "missing") return Preset::Missing;
    throw std::invalid_argument("Unknown preset: " + str);
}

void ts::sync::model::to_json(nlohmann::json& j, const Policy& p) {
    j = nlohmann::json{
        {"direction", to_string(p.direction)},
        {"purge", p.purge},
        {"recurse", p.recurse},
        {"check_hash", p.checkHash},
        {"skip_delete", p.skipDelete},
        {"skip_existing", p.skipExisting},
        {"skip_files", p.skipFiles},
        {"create_path", p.createPath},
        {"create_destination", p.createDestination}
    };
}

std::string ts::sync::model::to_string(const Policy& p) {
    const auto flag = [](const bool b) { return b ? "true" : "false"; };
    return std::string("Sync Policy:\n") +
           "  Direction: " + to_string(p.direction) + "\n"
           "  Purge: " + flag(p.purge) + "\n"
           "  Recurse: " + flag(p.recurse) + "\n"
           "  Check Hash: " + flag(p.checkHash) + "\n"
           "  Skip Delete: " + flag(p.skipDelete) + "\n"
           "  Skip Existing: " + flag(p.skipExisting) + "\n"
           "  Skip Files: " + flag(p.skipFiles) + "\n"
           "  Create Path: " + flag(p.createPath) + "\n"
           "  Create Destination: " + flag(p.createDestination);
}
