#pragma once

#include <filesystem>
#include <string>

namespace ts::sync::model {

struct Endpoint {
    std::filesystem::path absolutePath;
    bool exists{false};

    [[nodiscard]] std::filesystem::path resolve(const std::string& rel) const { return absolutePath / rel; }
};

}
