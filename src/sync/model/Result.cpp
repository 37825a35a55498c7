#include "sync/model/Result.hpp"
#include "util/timestamp.hpp"

#include <stdexcept>
#include <utility>
#include <nlohmann/json.hpp>

using namespace ts::sync::model;

void Result::fail(std::string item, const Operation op, std::string cause) {
    errors.push_back({std::move(item), op, std::move(cause)});
}

std::string ts::sync::model::to_string(const Operation op) {
    switch (op) {
        case Operation::Purge: return "purge";
        case Operation::CreateDirectory: return "create_directory";
        case Operation::CopyFile: return "copy_file";
        case Operation::OverwriteFile: return "overwrite_file";
        case Operation::HashFile: return "hash_file";
        case Operation::DeleteFile: return "delete_file";
        case Operation::DeleteDirectory: return "delete_directory";
        case Operation::SetModificationTime: return "set_mtime";
        case Operation::SaveCheckpoint: return "save_checkpoint";
        default: throw std::invalid_argument("Unknown operation");
    }
}

void ts::sync::model::to_json(nlohmann::json& j, const ItemError& e) {
    j = nlohmann::json{
        {"item", e.item},
        {"operation", to_string(e.operation)},
        {"cause", e.cause}
    };
}

void ts::sync::model::to_json(nlohmann::json& j, const Stats& s) {
    j = nlohmann::json{
        {"purged", s.purged},
        {"directories_created", s.directories_created},
        {"files_copied", s.files_copied},
        {"files_overwritten", s.files_overwritten},
        {"files_deleted", s.files_deleted},
        {"directories_deleted", s.directories_deleted}
    };
}

void ts::sync::model::to_json(nlohmann::json& j, const Result& r) {
    j = nlohmann::json{
        {"new_checkpoint_time", ts::util::timestampToString(r.new_checkpoint_time)},
        {"new_checkpoint_ticks", ts::util::toTicks(r.new_checkpoint_time)},
        {"checkpoint_saved", r.checkpoint_saved},
        {"stats", r.stats},
        {"errors", r.errors}
    };
}
