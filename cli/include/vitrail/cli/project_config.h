#pragma once

/**
 * @file project_config.h
 * @brief On-disk project settings for the vitrail tool
 *
 * A project file groups the castle parameters, the player settings and one
 * entry per window image slot:
 *
 * @code{.json}
 * {
 *   "castle": { "seed": 42, "windowSlots": 4 },
 *   "player": { "moveSpeed": 2.5 },
 *   "windows": [
 *     { "name": "Rose", "aspectRatio": 1.0, "transparent": true, "transmission": 1.0 }
 *   ]
 * }
 * @endcode
 *
 * Every section and key is optional.
 */

#include <vitrail/castle/castle_params.h>
#include <vitrail/config.h>
#include <vitrail/render3d/material.h>
#include <vitrail/walk/player_controller.h>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace vitrail::cli {

/// One window image slot
struct WindowConfig {
    std::string name;
    float aspectRatio = 1.0f;
    bool transparent = true;
    float transmission = 1.0f;
};

struct ProjectConfig {
    castle::CastleParams castle;
    walk::PlayerSettings player;
    std::vector<WindowConfig> windows;

    /// Four square glass slots, used when no project file lists any
    static std::vector<WindowConfig> defaultWindows();

    ProjectConfig() : windows(defaultWindows()) {}
};

json toJson(const WindowConfig& window);
WindowConfig windowFromJson(const json& obj);

json toJson(const ProjectConfig& config);

/// Apply the sections present in obj; a "windows" array replaces the slot list
void fromJson(const json& obj, ProjectConfig& config);

/**
 * @brief Load a project file
 * @return false if the file exists but cannot be read or parsed; out keeps its values
 */
bool loadConfig(const std::filesystem::path& path, ProjectConfig& out);

bool saveConfig(const std::filesystem::path& path, const ProjectConfig& config);

/// Glass material per window slot, owned by the caller
std::vector<std::unique_ptr<render3d::Material>> makeWindowMaterials(const ProjectConfig& config);

} // namespace vitrail::cli
