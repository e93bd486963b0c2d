// SPDX-License-Identifier: Apache-2.0
#include <agentlink/Config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using namespace agentlink;

namespace
{

    auto writeConfig(std::string_view name, std::string_view content) -> std::filesystem::path
    {
        auto const path = std::filesystem::temp_directory_path() / name;
        auto file = std::ofstream(path);
        file << content;
        return path;
    }

} // namespace

TEST_CASE("defaultConfigDir returns a non-empty path", "[config]")
{
    auto const dir = defaultConfigDir();
    REQUIRE(!dir.empty());
}

TEST_CASE("defaultConfigPath returns a path ending with config.json", "[config]")
{
    auto const path = defaultConfigPath();
    REQUIRE(path.ends_with("config.json"));
}

TEST_CASE("defaultSessionDir lives below the data directory", "[config]")
{
    auto const dir = std::filesystem::path(defaultSessionDir());
    CHECK(dir.filename() == "sessions");
    CHECK(dir.parent_path() == std::filesystem::path(defaultDataDir()));
}

TEST_CASE("AppConfig has expected defaults", "[config]")
{
    auto const config = AppConfig {};
    CHECK(config.cli.executableName == "claude");
    CHECK(config.cli.resumeNotFoundExitCode == 1);
    CHECK(!config.cli.resumeNotFoundRequiresMarker);
    CHECK(config.tokens.maxTokens == 200000);
    CHECK(config.tokens.autoThreshold == 0.96);
    CHECK(config.tokens.forceThreshold == 0.98);
    CHECK(config.compaction.cooldown == std::chrono::seconds(300));
    CHECK(config.compaction.maxAttempts == 2);
    CHECK(config.watchdog.stallTimeout == std::chrono::minutes(5));
    CHECK(config.resume.contextReplayMessages == 10);
    CHECK(config.paths.mode == PathMode::Auto);
}

TEST_CASE("loadConfigFromFile parses valid JSON config", "[config]")
{
    auto const tempPath = writeConfig("agentlink_test_config.json", R"({
        "cli": {
            "executable": "/opt/agent/bin/claude",
            "model": "opus",
            "systemPrompt": "Be brief",
            "resumeNotFoundRequiresMarker": true,
            "extraArgs": ["--dangerously-skip-permissions"]
        },
        "paths": {
            "mode": "wsl",
            "mountRoot": "/",
            "distribution": "Ubuntu"
        },
        "tokens": {
            "maxTokens": 100000,
            "autoThreshold": 0.9,
            "forceThreshold": 0.95
        },
        "compaction": {
            "cooldownSeconds": 60,
            "maxAttempts": 3,
            "prompt": "/compact now",
            "timeoutSeconds": 120
        },
        "watchdog": {
            "stallTimeoutSeconds": 30,
            "killGraceMs": 500,
            "retryOnStall": false
        },
        "resume": {
            "contextReplayMessages": 4,
            "contextReplayChars": 80
        },
        "storage": {
            "sessionDirectory": "/var/lib/agentlink",
            "writeRetryBaseDelayMs": 10
        },
        "logging": {
            "level": "debug",
            "file": "/tmp/agentlink.log"
        }
    })");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(result.has_value());

    auto const& config = *result;

    SECTION("CLI config")
    {
        CHECK(config.cli.executable == "/opt/agent/bin/claude");
        CHECK(config.cli.executableName == "claude");
        CHECK(config.cli.flags.model == "opus");
        CHECK(config.cli.systemPrompt == "Be brief");
        REQUIRE(config.cli.flags.extraArgs.size() == 1);
        CHECK(config.cli.flags.extraArgs[0] == "--dangerously-skip-permissions");
        CHECK(config.cli.flags.outputArgs.size() == 3);
    }

    SECTION("Path config")
    {
        CHECK(config.paths.mode == PathMode::Wsl);
        CHECK(config.paths.mountRoot == "/");
        CHECK(config.paths.distribution == "Ubuntu");
    }

    SECTION("Token and compaction config")
    {
        CHECK(config.tokens.maxTokens == 100000);
        CHECK(config.tokens.autoThreshold == 0.9);
        CHECK(config.tokens.forceThreshold == 0.95);
        CHECK(config.compaction.cooldown == std::chrono::seconds(60));
        CHECK(config.compaction.maxAttempts == 3);
        CHECK(config.compaction.prompt == "/compact now");
        CHECK(config.compaction.timeout == std::chrono::seconds(120));
    }

    SECTION("Watchdog, resume and storage config")
    {
        CHECK(config.watchdog.stallTimeout == std::chrono::seconds(30));
        CHECK(config.watchdog.killGrace == std::chrono::milliseconds(500));
        CHECK(config.watchdog.retryOnStall == false);
        CHECK(config.resume.contextReplayMessages == 4);
        CHECK(config.resume.contextReplayChars == 80);
        CHECK(config.storage.sessionDirectory == "/var/lib/agentlink");
        CHECK(config.storage.writer.retryBaseDelay == std::chrono::milliseconds(10));
        CHECK(config.storage.writer.retryMaxDelay == std::chrono::milliseconds(5000));
        CHECK(config.logging.level == "debug");
        CHECK(config.logging.file == "/tmp/agentlink.log");
    }

    SECTION("Component configuration")
    {
        auto const locator = makeLocatorContext(config);
        CHECK(locator.explicitPath == "/opt/agent/bin/claude");
        CHECK(locator.wslDistribution == "Ubuntu");

        auto const supervisor = makeSupervisorConfig(config);
        CHECK(supervisor.pathMode == PathNamespace::Wsl);
        CHECK(supervisor.paths.mountRoot == "/");
        CHECK(supervisor.stallTimeout == std::chrono::seconds(30));
        CHECK(supervisor.flags.model == "opus");

        auto const manager = makeManagerConfig(config);
        CHECK(manager.tokens.maxTokens == 100000);
        CHECK(manager.compaction.maxAttempts == 3);
        CHECK(manager.resume.contextReplayMessages == 4);
        CHECK(manager.resume.systemPrompt == "Be brief");
        CHECK(manager.retryOnStall == false);
        CHECK(manager.resume.requireMarker);
        CHECK(manager.resume.resumeNotFoundExitCode == 1);

        CHECK(sessionDirectory(config) == "/var/lib/agentlink");
    }

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile keeps defaults for missing sections", "[config]")
{
    auto const tempPath = writeConfig("agentlink_test_empty_config.json", R"({})");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(result.has_value());
    CHECK(result->tokens.maxTokens == 200000);
    CHECK(result->compaction.prompt == "/compact");
    CHECK(!result->cli.systemPrompt);
    CHECK(sessionDirectory(*result) == defaultSessionDir());

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile rejects invalid values", "[config]")
{
    auto const check = [](std::string_view name, std::string_view content) {
        INFO(content);
        auto const tempPath = writeConfig(name, content);
        auto result = loadConfigFromFile(tempPath.string());
        std::filesystem::remove(tempPath);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    };

    check("agentlink_test_bad_json.json", "{ not json");
    check("agentlink_test_bad_root.json", "[1, 2]");
    check("agentlink_test_bad_mode.json", R"({"paths": {"mode": "cygwin"}})");
    check("agentlink_test_bad_thresholds.json", R"({"tokens": {"autoThreshold": 0.99, "forceThreshold": 0.9}})");
    check("agentlink_test_bad_max.json", R"({"tokens": {"maxTokens": 0}})");
    check("agentlink_test_bad_attempts.json", R"({"compaction": {"maxAttempts": 0}})");
}

TEST_CASE("saveConfigToFile round-trips through loadConfigFromFile", "[config]")
{
    auto const dir = std::filesystem::temp_directory_path() / "agentlink_test_save" / "nested";
    auto const path = dir / "config.json";
    std::filesystem::remove_all(dir.parent_path());

    auto config = AppConfig {};
    config.cli.flags.model = "sonnet";
    config.paths.mode = PathMode::Host;
    config.compaction.maxAttempts = 5;
    config.watchdog.retryOnStall = false;
    config.logging.file = "agentlink.log";

    REQUIRE(saveConfigToFile(path.string(), config).has_value());
    REQUIRE(std::filesystem::exists(path));

    auto loaded = loadConfigFromFile(path.string());
    REQUIRE(loaded.has_value());
    CHECK(loaded->cli.flags.model == "sonnet");
    CHECK(loaded->paths.mode == PathMode::Host);
    CHECK(loaded->compaction.maxAttempts == 5);
    CHECK(loaded->watchdog.retryOnStall == false);
    CHECK(configToJson(*loaded) == configToJson(config));

    std::filesystem::remove_all(dir.parent_path());
}

TEST_CASE("loadConfigFromFile returns error for non-existent file", "[config]")
{
    auto result = loadConfigFromFile("/nonexistent/path/config.json");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("pathModeFromString accepts the documented names", "[config]")
{
    CHECK(pathModeFromString("auto") == PathMode::Auto);
    CHECK(pathModeFromString("host") == PathMode::Host);
    CHECK(pathModeFromString("wsl") == PathMode::Wsl);
    CHECK(!pathModeFromString("WSL"));
}
