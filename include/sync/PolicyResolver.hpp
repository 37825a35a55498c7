#pragma once

#include "sync/model/Policy.hpp"

namespace ts::sync {

struct PolicyResolver {
    // Preset defaults first, explicit overrides always win.
    static model::Policy resolve(model::Preset preset, const model::Overrides& overrides = {});

    static model::Policy defaults(model::Preset preset);
};

}
