#pragma once

#include <chrono>
#include <string>

namespace ts::sync::model {

struct Checkpoint {
    std::string instance_key;
    std::chrono::system_clock::time_point last_sync{};
};

}
