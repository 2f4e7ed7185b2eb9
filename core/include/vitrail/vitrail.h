#pragma once

// Vitrail - main include
// Pulls in the core types shared by every addon

#include <vitrail/param.h>
#include <vitrail/input.h>
#include <vitrail/config.h>

namespace vitrail {

constexpr const char* VERSION = "0.4.0";

} // namespace vitrail
