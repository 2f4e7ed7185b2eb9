// Vitrail CLI Commands
// Headless front end over the castle generator and the player controller

#include <vitrail/cli/cli.h>
#include <vitrail/castle/castle_generator.h>
#include <vitrail/render3d/camera.h>
#include <vitrail/render3d/scene.h>
#include <vitrail/vitrail.h>
#include <vitrail/walk/player_controller.h>
#include <CLI/CLI.hpp>
#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <iomanip>
#include <iostream>

namespace vitrail::cli {

namespace {

std::vector<render3d::Material*> rawPointers(
        const std::vector<std::unique_ptr<render3d::Material>>& owned) {
    std::vector<render3d::Material*> out;
    out.reserve(owned.size());
    for (const auto& m : owned) {
        out.push_back(m.get());
    }
    return out;
}

// The castle shows as many windows as there are images to fill them
castle::CastleParams effectiveParams(const ProjectConfig& config) {
    castle::CastleParams params = config.castle;
    params.windowSlots = std::min(params.windowSlots.get(), static_cast<int>(config.windows.size()));
    return params;
}

float degrees(float radians) {
    return radians * 180.0f / glm::pi<float>();
}

} // anonymous namespace

int runCastle(const ProjectConfig& config, bool asJson, std::ostream& out) {
    render3d::Scene scene;
    auto materials = makeWindowMaterials(config);

    castle::CastleGenerator generator;
    castle::CastleResult result = generator.generate(scene, rawPointers(materials), effectiveParams(config));

    if (asJson) {
        json windows = json::array();
        for (const auto& spec : generator.windows()) {
            windows.push_back({
                {"index", spec.index},
                {"angle", degrees(spec.angle)},
                {"width", spec.width},
                {"height", spec.height},
                {"position", {spec.worldPosition.x, spec.worldPosition.y, spec.worldPosition.z}},
                {"rotationY", spec.worldRotationY},
            });
        }
        json doc = {
            {"seed", generator.params().seed.get()},
            {"windowCount", result.windowCount},
            {"glassMeshes", result.windowMeshes.size()},
            {"windows", windows},
        };
        out << std::setw(2) << doc << std::endl;
        return 0;
    }

    out << "Castle (seed " << generator.params().seed.get() << "): "
        << result.windowCount << " wall segments, "
        << result.windowMeshes.size() << " glass meshes\n\n";

    out << std::fixed << std::setprecision(3);
    for (const auto& spec : generator.windows()) {
        const auto& p = spec.worldPosition;
        out << "  [" << spec.index << "] angle " << std::setw(7) << degrees(spec.angle)
            << "  size " << spec.width << " x " << spec.height
            << "  at (" << p.x << ", " << p.y << ", " << p.z << ")\n";
    }
    return 0;
}

int runWalk(const ProjectConfig& config, int ticks, float dt, std::ostream& out) {
    render3d::Scene scene;
    auto materials = makeWindowMaterials(config);

    castle::CastleGenerator generator;
    generator.generate(scene, rawPointers(materials), effectiveParams(config));

    render3d::Camera3D camera;
    InputTarget input;
    walk::PlayerController player(camera, input, scene, config.player);

    // Face the castle center from the start position
    camera.lookAt(player.getPosition(), glm::vec3(0.0f, player.getPosition().y, 0.0f));
    player.buildCollisionFromScene();
    player.lock();

    input.dispatchKey({Key::W, KeyAction::Down});
    for (int i = 0; i < ticks; ++i) {
        player.update(dt);
    }
    input.dispatchKey({Key::W, KeyAction::Up});

    glm::vec3 p = player.getPosition();
    out << std::fixed << std::setprecision(3)
        << "Walked " << ticks << " ticks: position (" << p.x << ", " << p.y << ", " << p.z << ")"
        << (player.onGround() ? " on ground" : " airborne")
        << ", " << player.colliders().size() << " colliders\n";

    player.dispose();
    return 0;
}

int writeDefaultConfig(const std::string& path) {
    ProjectConfig config;
    if (!saveConfig(path, config)) {
        return 1;
    }
    std::cout << "[vitrail] Wrote " << path << std::endl;
    return 0;
}

int handleCommand(int argc, char** argv) {
    CLI::App app{"Vitrail - Glass-window castle generator and walkthrough"};
    app.set_version_flag("-v,--version", std::string(VERSION));
    app.set_help_flag("-h,--help", "Show this help");
    app.require_subcommand(1);

    std::string configPath;
    int seed = -1;
    int slots = -1;
    bool carved = false;

    auto addShared = [&](CLI::App* cmd) {
        cmd->add_option("-c,--config", configPath, "Project file (JSON)");
        cmd->add_option("-s,--seed", seed, "Override the castle seed");
        cmd->add_option("-n,--windows", slots, "Override the number of window slots");
        cmd->add_flag("--carved", carved, "Cut window openings out of solid walls");
    };

    // 'castle' subcommand
    bool castleJson = false;
    auto* castleCmd = app.add_subcommand("castle", "Generate a castle and print its layout");
    addShared(castleCmd);
    castleCmd->add_flag("--json", castleJson, "Output as JSON");

    // 'walk' subcommand
    int ticks = 120;
    float dt = 1.0f / 60.0f;
    auto* walkCmd = app.add_subcommand("walk", "Simulate walking into the castle");
    addShared(walkCmd);
    walkCmd->add_option("-t,--ticks", ticks, "Number of fixed steps")->check(CLI::NonNegativeNumber);
    walkCmd->add_option("--dt", dt, "Seconds per step")->check(CLI::PositiveNumber);

    // 'init' subcommand
    std::string initPath = "vitrail.json";
    auto* initCmd = app.add_subcommand("init", "Write a default project file");
    initCmd->add_option("path", initPath, "Output path");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    if (initCmd->parsed()) {
        return writeDefaultConfig(initPath);
    }

    ProjectConfig config;
    if (!configPath.empty() && !loadConfig(configPath, config)) {
        return 1;
    }
    if (seed >= 0) config.castle.seed.setClamped(seed);
    if (slots >= 0) config.castle.windowSlots.setClamped(slots);
    if (carved) config.castle.carvedWalls = true;

    if (castleCmd->parsed()) {
        return runCastle(config, castleJson, std::cout);
    }

    if (walkCmd->parsed()) {
        return runWalk(config, ticks, dt, std::cout);
    }

    return 0;
}

} // namespace vitrail::cli
