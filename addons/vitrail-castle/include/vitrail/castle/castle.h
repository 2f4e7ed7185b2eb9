#pragma once

// Vitrail Castle - Procedural ring castle framing the glass windows

#include <vitrail/castle/seeded_random.h>
#include <vitrail/castle/castle_params.h>
#include <vitrail/castle/window_layout.h>
#include <vitrail/castle/castle_generator.h>
