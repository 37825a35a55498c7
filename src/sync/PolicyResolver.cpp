#include "sync/PolicyResolver.hpp"

#include <stdexcept>

using namespace ts::sync;
using namespace ts::sync::model;

Policy PolicyResolver::defaults(const Preset preset) {
    Policy p;

    switch (preset) {
    case Preset::Sync:
        p.direction = Direction::Both;
        break;
    case Preset::Merge:
        p.direction = Direction::Both;
        p.skipDelete = true;
        break;
    case Preset::Mirror:
        p.direction = Direction::Forward;
        break;
    case Preset::Contribute:
        p.direction = Direction::Forward;
        p.skipDelete = true;
        break;
    case Preset::Missing:
        p.direction = Direction::Forward;
        p.skipDelete = true;
        p.skipExisting = true;
        break;
    default:
        throw std::invalid_argument("Unknown preset");
    }

    return p;
}

Policy PolicyResolver::resolve(const Preset preset, const Overrides& overrides) {
    auto p = defaults(preset);

    p.direction = overrides.direction.value_or(p.direction);
    p.purge = overrides.purge.value_or(p.purge);
    p.recurse = overrides.recurse.value_or(p.recurse);
    p.checkHash = overrides.checkHash.value_or(p.checkHash);
    p.skipDelete = overrides.skipDelete.value_or(p.skipDelete);
    p.skipExisting = overrides.skipExisting.value_or(p.skipExisting);
    p.skipFiles = overrides.skipFiles.value_or(p.skipFiles);
    p.createPath = overrides.createPath.value_or(p.createPath);
    p.createDestination = overrides.createDestination.value_or(p.createDestination);

    return p;
}
