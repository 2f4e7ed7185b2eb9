#pragma once

/**
 * @file config.h
 * @brief JSON file helpers shared by the settings structs
 *
 * Each settings struct (castle params, player settings, project config)
 * provides its own toJson()/fromJson(); this header supplies the file I/O
 * and the Param <-> JSON glue they share.
 *
 * Loading is forgiving: a missing file is not an error (defaults stay in
 * place), unknown keys are ignored, and out-of-range numbers are clamped to
 * the parameter's range. A malformed file is reported and leaves the target
 * untouched.
 */

#include <vitrail/param.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>
#include <type_traits>

namespace vitrail {

using json = nlohmann::json;

/**
 * @brief Read a JSON document from disk
 * @param path File to read
 * @param out Receives the parsed document (set to an empty object if the file is missing)
 * @return false on I/O or parse error (logged)
 */
bool loadJsonFile(const std::filesystem::path& path, json& out);

/**
 * @brief Write a JSON document to disk, pretty-printed
 * @return false on I/O error (logged)
 */
bool saveJsonFile(const std::filesystem::path& path, const json& doc);

/// Store a parameter's current value under its name
template<typename T>
void writeParam(json& obj, const Param<T>& param) {
    obj[param.name()] = param.get();
}

/**
 * @brief Read a parameter by its name, clamped to its range
 * @return true if the key was present with a usable type
 */
template<typename T>
bool readParam(const json& obj, Param<T>& param) {
    auto it = obj.find(param.name());
    if (it == obj.end()) return false;

    if constexpr (std::is_same_v<T, bool>) {
        if (!it->is_boolean()) return false;
    } else {
        if (!it->is_number()) return false;
    }

    param.setClamped(it->template get<T>());
    return true;
}

} // namespace vitrail
