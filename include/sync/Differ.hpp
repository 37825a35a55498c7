#pragma once

#include "sync/model/Diff.hpp"
#include "sync/model/Entry.hpp"

#include <chrono>
#include <optional>

namespace ts::sync {

namespace model {
struct Checkpoint;
struct Policy;
}

struct Differ {
    static model::Diff diff(const model::Tree& source,
                            const model::Tree& target,
                            const std::optional<model::Checkpoint>& checkpoint,
                            const model::Policy& policy);

    // Set arithmetic for one entry kind; the checkpoint is already converted to file time.
    static model::DiffSets classify(const model::EntryMap& source,
                                    const model::EntryMap& target,
                                    const std::optional<std::filesystem::file_time_type>& since,
                                    bool bidirectional);
};

}
