#pragma once

#include "sync/model/Entry.hpp"

#include <map>
#include <string>

namespace ts::sync::model {

struct CommonPair {
    Entry source;
    Entry target;
};

// Classified relative-path sets for one kind of entry (files or directories).
// Source and target are roles, already mapped from path/destination by direction.
struct DiffSets {
    EntryMap missingAtTarget;   // new(source) - new(target)
    EntryMap missingAtSource;   // new(target) - new(source), Both only
    std::map<std::string, CommonPair> common;
    EntryMap staleAtTarget;     // old(target) - common
    EntryMap staleAtSource;     // old(source) - common
};

struct Diff {
    DiffSets files;
    DiffSets directories;
};

}
