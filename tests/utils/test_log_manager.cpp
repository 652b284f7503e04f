#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>

#include "utils/LogManager.hpp"

using namespace utils;
namespace fs = std::filesystem;

namespace {

fs::path writeConfig(const std::string& name, const std::string& text) {
    fs::path path = fs::temp_directory_path() / name;
    std::ofstream(path, std::ios::trunc) << text;
    return path;
}

}  // namespace

TEST_CASE("LogManager - reading [logging]", "[utils][logging]") {
    SECTION("Missing file keeps the defaults") {
        auto settings = LogManager::ReadSettings("/nonexistent/hammer/config.toml");
        REQUIRE(settings.directory == "logs");
        REQUIRE(settings.level == plog::info);
        REQUIRE(settings.append);
        REQUIRE(settings.console);
    }

    SECTION("Values are picked up") {
        auto path = writeConfig("hammer_log_settings.toml", R"(
            [logging]
            directory = "var/log/hammer"
            level = "Debug"
            append = false
            console = false
        )");
        auto settings = LogManager::ReadSettings(path.string());
        fs::remove(path);

        REQUIRE(settings.directory == "var/log/hammer");
        REQUIRE(settings.level == plog::debug);
        REQUIRE_FALSE(settings.append);
        REQUIRE_FALSE(settings.console);
    }

    SECTION("Numeric level and unknown names") {
        auto path = writeConfig("hammer_log_numeric.toml", "[logging]\nlevel = 2\n");
        REQUIRE(LogManager::ReadSettings(path.string()).level == plog::error);

        writeConfig("hammer_log_numeric.toml", "[logging]\nlevel = \"chatty\"\n");
        REQUIRE(LogManager::ReadSettings(path.string()).level == plog::info);
        fs::remove(path);
    }

    SECTION("Broken file falls back to defaults") {
        auto path = writeConfig("hammer_log_broken.toml", "[logging\nlevel = \"debug\"\n");
        auto settings = LogManager::ReadSettings(path.string());
        fs::remove(path);
        REQUIRE(settings.level == plog::info);
    }
}

TEST_CASE("LogManager - level names", "[utils][logging]") {
    REQUIRE(LogManager::ParseLevel("warn") == plog::warning);
    REQUIRE(LogManager::ParseLevel("VERBOSE") == plog::verbose);
    REQUIRE(LogManager::ParseLevel("0") == plog::none);
    REQUIRE_FALSE(LogManager::ParseLevel("7").has_value());
    REQUIRE_FALSE(LogManager::ParseLevel("").has_value());
}
