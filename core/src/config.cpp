#include <vitrail/config.h>
#include <fstream>
#include <iomanip>
#include <iostream>

namespace vitrail {

bool loadJsonFile(const std::filesystem::path& path, json& out) {
    if (!std::filesystem::exists(path)) {
        out = json::object();
        return true;  // New file, defaults apply
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[config] Failed to open: " << path.string() << "\n";
        return false;
    }

    try {
        json doc;
        file >> doc;
        if (!doc.is_object()) {
            std::cerr << "[config] Expected a JSON object in " << path.string() << "\n";
            return false;
        }
        out = std::move(doc);
        std::cout << "[config] Loaded: " << path.string() << " ("
                  << out.size() << " keys)\n";
        return true;
    } catch (const json::parse_error& e) {
        std::cerr << "[config] Parse error in " << path.string() << ": " << e.what() << "\n";
        return false;
    }
}

bool saveJsonFile(const std::filesystem::path& path, const json& doc) {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "[config] Failed to write: " << path.string() << "\n";
        return false;
    }

    try {
        file << std::setw(2) << doc << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[config] Write error: " << e.what() << "\n";
        return false;
    }
}

} // namespace vitrail
