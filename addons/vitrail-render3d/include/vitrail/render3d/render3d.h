#pragma once

// Vitrail Render3D - CPU scene description consumed by the renderer
// Include this for the full scene-building API

#include <vitrail/render3d/bounds.h>
#include <vitrail/render3d/mesh.h>
#include <vitrail/render3d/mesh_builder.h>
#include <vitrail/render3d/material.h>
#include <vitrail/render3d/scene.h>
#include <vitrail/render3d/camera.h>
