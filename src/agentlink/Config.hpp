// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <engine/CompactionCoordinator.hpp>
#include <engine/ConversationManager.hpp>
#include <engine/ResumptionEngine.hpp>
#include <engine/TokenAccountant.hpp>
#include <process/ExecutableLocator.hpp>
#include <process/ProcessSupervisor.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace agentlink
{

/// @brief How the path namespace of the agent is chosen.
enum class PathMode : std::uint8_t
{
    /// Follow the resolved executable (WSL launcher selects Wsl, everything else Host).
    Auto,
    Host,
    Wsl,
};

[[nodiscard]] constexpr auto pathModeToString(PathMode mode) -> std::string_view
{
    switch (mode)
    {
        case PathMode::Auto: return "auto";
        case PathMode::Host: return "host";
        case PathMode::Wsl: return "wsl";
    }
    return "auto";
}

[[nodiscard]] auto pathModeFromString(std::string_view name) -> std::optional<PathMode>;

/// @brief Agent CLI configuration section.
struct CliConfig
{
    /// @brief Explicit path of the agent executable; searched for if empty.
    std::string executable;
    std::string executableName = "claude";
    std::string wslLauncher = "wsl.exe";
    CliFlags flags;
    std::optional<std::string> systemPrompt;

    /// @brief Exit code and output text by which the agent reports an unknown resume id.
    /// Either one is enough unless resumeNotFoundRequiresMarker is set.
    int resumeNotFoundExitCode = 1;
    std::string resumeNotFoundMarker = "No conversation found";
    bool resumeNotFoundRequiresMarker = false;
};

/// @brief Path translation configuration section.
struct PathsConfig
{
    PathMode mode = PathMode::Auto;
    std::string mountRoot = "/mnt";
    std::string distribution;
};

/// @brief Watchdog configuration section.
struct WatchdogConfig
{
    std::chrono::seconds stallTimeout { 300 };
    std::chrono::milliseconds killGrace { 2000 };
    bool retryOnStall = true;
};

/// @brief Context replay configuration section.
struct ReplayConfig
{
    size_t contextReplayMessages = 10;
    size_t contextReplayChars = 200;
};

/// @brief Session storage configuration section.
struct StorageConfig
{
    /// @brief Directory of the session records; defaultSessionDir() if empty.
    std::string sessionDirectory;
    SessionWriterConfig writer;
};

/// @brief Logging configuration section.
struct LoggingConfig
{
    std::string level = "warning";
    /// @brief Log file appended to in addition to the console; none if empty.
    std::string file;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    CliConfig cli;
    PathsConfig paths;
    TokenConfig tokens;
    CompactionConfig compaction;
    WatchdogConfig watchdog;
    ReplayConfig resume;
    StorageConfig storage;
    LoggingConfig logging;

    /// @brief Working directory of new sessions (set via the -d CLI flag, not persisted).
    std::string workingDirectory;

    /// @brief Session to select on startup (set via the -s CLI flag, not persisted).
    std::string initialSession;
};

/// @brief Loads the application configuration from the default config path.
/// A missing file yields the defaults.
/// @return The loaded configuration or a ConfigError.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or a ConfigError.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Decodes a configuration document. Missing keys keep their defaults.
[[nodiscard]] auto configFromJson(const nlohmann::json& root) -> Result<AppConfig>;

[[nodiscard]] auto configToJson(const AppConfig& config) -> nlohmann::json;

/// @brief Saves the application configuration to a file, creating parent directories.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or a ConfigError.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Returns the default data directory path for the current platform.
/// On Linux: $XDG_DATA_HOME/agentlink or ~/.local/share/agentlink
/// On macOS: ~/Library/Application Support/agentlink
/// On Windows: %APPDATA%\agentlink
[[nodiscard]] auto defaultDataDir() -> std::string;

/// @brief Returns the default directory of the session records.
[[nodiscard]] auto defaultSessionDir() -> std::string;

/// @name Component configuration derived from AppConfig
/// @{
[[nodiscard]] auto makeLocatorContext(const AppConfig& config) -> LocatorContext;
[[nodiscard]] auto makeSupervisorConfig(const AppConfig& config) -> SupervisorConfig;
[[nodiscard]] auto makeManagerConfig(const AppConfig& config) -> ConversationManagerConfig;
[[nodiscard]] auto sessionDirectory(const AppConfig& config) -> std::string;
/// @}

} // namespace agentlink
