#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>

#include <toml++/toml.h>

#include "config/ConfigManager.hpp"
#include "config/HammerSettings.hpp"

namespace fs = std::filesystem;

namespace {

struct TempConfig {
    fs::path path;

    explicit TempConfig(const std::string& name)
        : path(fs::temp_directory_path() / name) {
        std::error_code ec;
        fs::remove(path, ec);
    }

    ~TempConfig() {
        std::error_code ec;
        fs::remove(path, ec);
    }

    void write(const std::string& text) const {
        std::ofstream out(path, std::ios::trunc);
        out << text;
    }
};

}  // namespace

TEST_CASE("HammerSettings - defaults and overrides", "[config][settings]") {
    HammerSettings settings;

    SECTION("Defaults") {
        REQUIRE(settings.dispatch().shutdown_timeout_ms == 5000);
        REQUIRE(settings.dispatch().ui_flush_interval_ms == 300);
        REQUIRE(settings.dispatch().display_limit_bytes == 10 * 1024);
        REQUIRE(settings.http().connect_timeout_ms == 10000);
        REQUIRE(settings.http().default_timeout_ms == 300000);
        REQUIRE(settings.http().chunk_size_bytes == 16 * 1024);
        REQUIRE(settings.http().streaming_capture_bytes == 10 * 1024 * 1024);
        REQUIRE(settings.http().single_shot_capture_bytes == 100 * 1024 * 1024);
        REQUIRE(settings.http().format_limit_bytes == 1000000);
        REQUIRE(settings.http().user_agent == "APIHammer/1.0");
        REQUIRE(settings.http().verify_tls);
        REQUIRE(settings.batch().max_concurrency == 5);
    }

    SECTION("Values from a document") {
        auto doc = toml::parse(R"(
            [dispatch]
            shutdown_timeout_ms = 1500
            ui_flush_interval_ms = 100

            [http]
            user_agent = "hammer-test"
            verify_tls = false
            default_timeout_ms = 0

            [batch]
            max_concurrency = 12
        )");
        settings.deserialize(doc);

        REQUIRE(settings.dispatch().shutdown_timeout_ms == 1500);
        REQUIRE(settings.dispatch().ui_flush_interval_ms == 100);
        REQUIRE(settings.http().user_agent == "hammer-test");
        REQUIRE_FALSE(settings.http().verify_tls);
        REQUIRE(settings.http().default_timeout_ms == 0);
        REQUIRE(settings.batch().max_concurrency == 12);
        REQUIRE(settings.http().chunk_size_bytes == 16 * 1024);
    }

    SECTION("Out-of-range values keep the defaults") {
        auto doc = toml::parse(R"(
            [batch]
            max_concurrency = 0
            [http]
            chunk_size_bytes = -4
            user_agent = ""
        )");
        settings.deserialize(doc);
        REQUIRE(settings.batch().max_concurrency == 5);
        REQUIRE(settings.http().chunk_size_bytes == 16 * 1024);
        REQUIRE(settings.http().user_agent == "APIHammer/1.0");
    }
}

TEST_CASE("ConfigManager - loading", "[config]") {
    TempConfig file("hammer_test_config.toml");
    ConfigManager config(file.path.string());
    HammerSettings settings;
    settings.registerConfigHandler(config);

    SECTION("Missing file means defaults") {
        REQUIRE(config.load());
        REQUIRE(settings.batch().max_concurrency == 5);
        REQUIRE(config.document().empty());
    }

    SECTION("Sections are routed to their owners") {
        file.write("[batch]\nmax_concurrency = 3\n[http]\nuser_agent = \"hammer-config\"\n");
        REQUIRE(config.load());
        REQUIRE(settings.batch().max_concurrency == 3);
        REQUIRE(settings.http().user_agent == "hammer-config");
        REQUIRE(settings.dispatch().shutdown_timeout_ms == 5000);
        REQUIRE(config.document()["batch"]["max_concurrency"].value<int>() == 3);
    }

    SECTION("Whole-document handler and empty sections") {
        int root_calls = 0;
        bool saw_empty = false;
        REQUIRE(config.registerSection("", [&](const toml::table&) { ++root_calls; }));
        REQUIRE(config.registerSection("extras", [&](const toml::table& t) { saw_empty = t.empty(); }));

        file.write("[batch]\nmax_concurrency = 2\n");
        REQUIRE(config.load());
        REQUIRE(root_calls == 1);
        REQUIRE(saw_empty);
    }

    SECTION("A later load resets sections that disappeared") {
        file.write("[batch]\nmax_concurrency = 3\n");
        REQUIRE(config.load());
        REQUIRE(settings.batch().max_concurrency == 3);

        file.write("[http]\nverify_tls = false\n");
        REQUIRE(config.load());
        REQUIRE(settings.batch().max_concurrency == 5);
        REQUIRE_FALSE(settings.http().verify_tls);
    }

    SECTION("Parse errors are reported and keep previous values") {
        file.write("[batch]\nmax_concurrency = 3\n");
        REQUIRE(config.load());

        file.write("[batch\nmax_concurrency = 4\n");
        REQUIRE_FALSE(config.load());
        REQUIRE(config.lastError().find("config parse error") == 0);
        REQUIRE(settings.batch().max_concurrency == 3);
    }

    SECTION("Duplicate registration is rejected") {
        REQUIRE_FALSE(config.registerSection("batch", [](const toml::table&) {}));
        REQUIRE(config.lastError().find("batch") != std::string::npos);
    }
}
