#pragma once

#include <stdexcept>

namespace ts::checkpoint {

// Unreadable or inconsistent checkpoint record.
struct CheckpointError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

}
