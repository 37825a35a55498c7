#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

namespace ts::sync {

// A root endpoint is missing and may not be created, or cannot be created.
struct EndpointError : std::runtime_error {
    std::filesystem::path path;

    EndpointError(std::filesystem::path p, const std::string& msg)
        : std::runtime_error(msg + ": " + p.string()), path(std::move(p)) {}
};

// Enumerating an endpoint failed part way; the tree is not trustworthy.
struct ScanError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

}
