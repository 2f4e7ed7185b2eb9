/**
 * @file test_config.cpp
 * @brief Unit tests for JSON file helpers and Param glue
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <vitrail/config.h>
#include <filesystem>
#include <fstream>

using namespace vitrail;
using Catch::Matchers::WithinAbs;

namespace fs = std::filesystem;

namespace {

fs::path tempFile(const char* name) {
    fs::path p = fs::temp_directory_path() / name;
    fs::remove(p);
    return p;
}

} // namespace

TEST_CASE("loadJsonFile handles missing and malformed files", "[core][config]") {
    SECTION("missing file yields an empty object") {
        json doc = json::array();
        REQUIRE(loadJsonFile(tempFile("vitrail_missing.json"), doc));
        REQUIRE(doc.is_object());
        REQUIRE(doc.empty());
    }

    SECTION("parse error is reported") {
        fs::path p = tempFile("vitrail_broken.json");
        std::ofstream(p) << "{ \"seed\": ";
        json doc = {{"keep", 1}};
        REQUIRE_FALSE(loadJsonFile(p, doc));
        REQUIRE(doc["keep"] == 1);
        fs::remove(p);
    }

    SECTION("top level must be an object") {
        fs::path p = tempFile("vitrail_array.json");
        std::ofstream(p) << "[1, 2, 3]";
        json doc;
        REQUIRE_FALSE(loadJsonFile(p, doc));
        fs::remove(p);
    }
}

TEST_CASE("saveJsonFile writes a document loadJsonFile reads back", "[core][config]") {
    fs::path p = tempFile("vitrail_saved.json");
    json doc = {{"seed", 7}, {"name", "castle"}};

    REQUIRE(saveJsonFile(p, doc));

    json loaded;
    REQUIRE(loadJsonFile(p, loaded));
    REQUIRE(loaded == doc);
    fs::remove(p);
}

TEST_CASE("readParam applies values by name", "[core][config]") {
    Param<float> radius{"baseRadius", 1.0f, 0.4f, 2.0f};
    Param<bool> carved{"carvedWalls", false, false, true};

    SECTION("in-range value is applied") {
        REQUIRE(readParam(json{{"baseRadius", 1.5}}, radius));
        REQUIRE_THAT(radius.get(), WithinAbs(1.5f, 0.001f));
    }

    SECTION("out-of-range value is clamped") {
        REQUIRE(readParam(json{{"baseRadius", 10.0}}, radius));
        REQUIRE_THAT(radius.get(), WithinAbs(2.0f, 0.001f));
    }

    SECTION("missing key and wrong type leave the value alone") {
        REQUIRE_FALSE(readParam(json::object(), radius));
        REQUIRE_FALSE(readParam(json{{"baseRadius", "big"}}, radius));
        REQUIRE_FALSE(readParam(json{{"carvedWalls", 1}}, carved));
        REQUIRE_THAT(radius.get(), WithinAbs(1.0f, 0.001f));
        REQUIRE_FALSE(carved.get());
    }

    SECTION("writeParam stores under the parameter name") {
        json obj = json::object();
        writeParam(obj, carved);
        REQUIRE(obj["carvedWalls"] == false);
    }
}
