#include "checkpoint/Sidecar.hpp"
#include "checkpoint/errors.hpp"
#include "sync/model/Endpoint.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <cstdint>
#include <utility>
#include <nlohmann/json.hpp>

using namespace ts::checkpoint;
using namespace ts::sync::model;

namespace {

nlohmann::json readDocument(const std::filesystem::path& path) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(ts::util::readFileToString(path));
    } catch (const std::exception& e) {
        throw CheckpointError("Unreadable checkpoint document " + path.string() + ": " + e.what());
    }
    if (!doc.is_object()) throw CheckpointError("Checkpoint document is not a JSON object: " + path.string());
    return doc;
}

}

Sidecar::Sidecar(std::filesystem::path path) : path_(std::move(path)) {}

std::optional<Checkpoint> Sidecar::load(const Endpoint&, const Endpoint&, const std::string& key) const {
    if (!std::filesystem::exists(path_)) return std::nullopt;

    const auto doc = readDocument(path_);
    const auto it = doc.find(key);
    if (it == doc.end()) return std::nullopt;
    if (!it->is_number_integer())
        throw CheckpointError("Checkpoint value for " + key + " is not an integer tick count in " + path_.string());

    return Checkpoint{key, util::fromTicks(it->get<std::int64_t>())};
}

void Sidecar::save(const Endpoint&, const Endpoint&, const std::string& key,
                   const std::chrono::system_clock::time_point timestamp) {
    nlohmann::json doc = nlohmann::json::object();

    if (std::filesystem::exists(path_)) {
        try {
            doc = readDocument(path_);
        } catch (const CheckpointError& e) {
            log::Registry::checkpoint()->warn("[Sidecar] Replacing corrupt checkpoint document: {}", e.what());
        }
    }

    doc[key] = util::toTicks(timestamp);

    try {
        if (path_.has_parent_path()) std::filesystem::create_directories(path_.parent_path());
        util::writeFileAtomic(path_, doc.dump(2));
    } catch (const std::exception& e) {
        throw CheckpointError("Failed to write checkpoint document " + path_.string() + ": " + e.what());
    }
}

std::string Sidecar::describe() const { return "sidecar:" + path_.string(); }
