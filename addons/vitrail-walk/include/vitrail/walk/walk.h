#pragma once

// Vitrail Walk - First-person movement with capsule collision

#include <vitrail/walk/geometry.h>
#include <vitrail/walk/mesh_bvh.h>
#include <vitrail/walk/capsule.h>
#include <vitrail/walk/player_controller.h>
