#pragma once

#include "sync/model/Entry.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace ts::sync {

namespace model {
struct Endpoint;
}

class Scanner {
public:
    // exclude: fnmatch globs matched against entry names at any depth.
    // reserved: exact names hidden at the endpoint root only, on top of the sidecar name.
    explicit Scanner(std::vector<std::string> exclude = {}, std::vector<std::string> reserved = {});

    // Regular files and directories under the endpoint; never mutates the tree.
    // Throws ScanError if any part of the tree cannot be enumerated.
    [[nodiscard]] model::Tree scan(const model::Endpoint& endpoint, bool recurse) const;

    // Computes and caches entry.content_hash on first use.
    static const std::string& hash(const model::Endpoint& endpoint, model::Entry& entry);

    // In-flight temp copies at any depth, reserved names when atRoot, then the globs.
    [[nodiscard]] bool excluded(std::string_view name, bool atRoot) const;

private:
    std::vector<std::string> exclude_;
    std::vector<std::string> reserved_;
};

}
