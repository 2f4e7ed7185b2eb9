#include <vitrail/cli/project_config.h>
#include <iostream>

namespace vitrail::cli {

std::vector<WindowConfig> ProjectConfig::defaultWindows() {
    std::vector<WindowConfig> windows;
    for (int i = 0; i < 4; ++i) {
        WindowConfig w;
        w.name = "pane " + std::to_string(i + 1);
        windows.push_back(w);
    }
    return windows;
}

json toJson(const WindowConfig& window) {
    return json{
        {"name", window.name},
        {"aspectRatio", window.aspectRatio},
        {"transparent", window.transparent},
        {"transmission", window.transmission},
    };
}

WindowConfig windowFromJson(const json& obj) {
    WindowConfig w;
    if (!obj.is_object()) return w;

    w.name = obj.value("name", w.name);
    w.aspectRatio = obj.value("aspectRatio", w.aspectRatio);
    w.transparent = obj.value("transparent", w.transparent);
    w.transmission = obj.value("transmission", w.transmission);
    return w;
}

json toJson(const ProjectConfig& config) {
    json windows = json::array();
    for (const auto& w : config.windows) {
        windows.push_back(toJson(w));
    }

    return json{
        {"castle", castle::toJson(config.castle)},
        {"player", walk::toJson(config.player)},
        {"windows", windows},
    };
}

void fromJson(const json& obj, ProjectConfig& config) {
    if (!obj.is_object()) return;

    if (auto it = obj.find("castle"); it != obj.end()) {
        castle::fromJson(*it, config.castle);
    }
    if (auto it = obj.find("player"); it != obj.end()) {
        walk::fromJson(*it, config.player);
    }
    if (auto it = obj.find("windows"); it != obj.end() && it->is_array()) {
        config.windows.clear();
        for (const auto& entry : *it) {
            config.windows.push_back(windowFromJson(entry));
        }
    }
}

bool loadConfig(const std::filesystem::path& path, ProjectConfig& out) {
    json doc;
    if (!loadJsonFile(path, doc)) {
        return false;
    }

    ProjectConfig loaded = out;
    try {
        fromJson(doc, loaded);
    } catch (const json::type_error& e) {
        std::cerr << "[config] Bad value in " << path.string() << ": " << e.what() << std::endl;
        return false;
    }

    out = std::move(loaded);
    return true;
}

bool saveConfig(const std::filesystem::path& path, const ProjectConfig& config) {
    return saveJsonFile(path, toJson(config));
}

std::vector<std::unique_ptr<render3d::Material>> makeWindowMaterials(const ProjectConfig& config) {
    std::vector<std::unique_ptr<render3d::Material>> materials;
    materials.reserve(config.windows.size());
    for (const auto& w : config.windows) {
        auto mat = std::make_unique<render3d::Material>(w.name);
        mat->transparent(w.transparent)
            .transmission(w.transmission)
            .aspectRatio(w.aspectRatio);
        materials.push_back(std::move(mat));
    }
    return materials;
}

} // namespace vitrail::cli
