#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace ts::sync::model {

enum class Operation {
    Purge,
    CreateDirectory,
    CopyFile,
    OverwriteFile,
    HashFile,
    DeleteFile,
    DeleteDirectory,
    SetModificationTime,
    SaveCheckpoint
};

struct ItemError {
    std::string item;
    Operation operation{Operation::CopyFile};
    std::string cause;
};

struct Stats {
    uint64_t purged{};
    uint64_t directories_created{};
    uint64_t files_copied{};
    uint64_t files_overwritten{};
    uint64_t files_deleted{};
    uint64_t directories_deleted{};

    // Mutating operations performed; zero for a run with nothing to do.
    [[nodiscard]] uint64_t total() const {
        return purged + directories_created + files_copied + files_overwritten + files_deleted + directories_deleted;
    }
};

struct Result {
    std::chrono::system_clock::time_point new_checkpoint_time{};
    bool checkpoint_saved{false};
    std::vector<ItemError> errors;
    Stats stats;

    [[nodiscard]] bool ok() const { return errors.empty(); }

    void fail(std::string item, Operation op, std::string cause);
};

std::string to_string(Operation op);

void to_json(nlohmann::json& j, const ItemError& e);
void to_json(nlohmann::json& j, const Stats& s);
void to_json(nlohmann::json& j, const Result& r);

}
