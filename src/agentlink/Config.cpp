// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace agentlink
{

namespace
{

    auto section(const nlohmann::json& root, std::string_view name) -> const nlohmann::json*
    {
        auto const key = std::string(name);
        if (!root.contains(key) || !root[key].is_object())
            return nullptr;
        return &root[key];
    }

    auto validate(const AppConfig& config) -> VoidResult
    {
        auto const& tokens = config.tokens;
        if (tokens.maxTokens == 0)
            return makeError(ErrorCode::ConfigError, "tokens.maxTokens must be positive");
        if (tokens.autoThreshold <= 0.0 || tokens.autoThreshold > tokens.forceThreshold)
            return makeError(ErrorCode::ConfigError,
                             std::format("tokens.autoThreshold ({}) must be positive and not above forceThreshold ({})",
                                         tokens.autoThreshold,
                                         tokens.forceThreshold));
        if (config.compaction.maxAttempts < 1)
            return makeError(ErrorCode::ConfigError, "compaction.maxAttempts must be at least 1");
        if (config.compaction.prompt.empty())
            return makeError(ErrorCode::ConfigError, "compaction.prompt must not be empty");
        if (config.cli.executableName.empty())
            return makeError(ErrorCode::ConfigError, "cli.executableName must not be empty");
        return {};
    }

} // namespace

auto pathModeFromString(std::string_view name) -> std::optional<PathMode>
{
    if (name == "auto")
        return PathMode::Auto;
    if (name == "host")
        return PathMode::Host;
    if (name == "wsl")
        return PathMode::Wsl;
    return std::nullopt;
}

auto defaultConfigDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\agentlink";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/agentlink";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/agentlink";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/agentlink";
    return ".";
#endif
}

auto defaultDataDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\agentlink";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/agentlink";
    return ".";
#else
    auto const* const xdgData = std::getenv("XDG_DATA_HOME");
    if (xdgData)
        return std::string(xdgData) + "/agentlink";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.local/share/agentlink";
    return ".";
#endif
}

auto defaultSessionDir() -> std::string
{
    return (std::filesystem::path(defaultDataDir()) / "sessions").string();
}

auto defaultConfigPath() -> std::string
{
    return (std::filesystem::path(defaultConfigDir()) / "config.json").string();
}

auto configFromJson(const nlohmann::json& root) -> Result<AppConfig>
{
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Configuration must be a JSON object");

    auto config = AppConfig {};

    if (auto const* cli = section(root, "cli"))
    {
        auto& out = config.cli;
        out.executable = json::getStringOr(*cli, "executable", out.executable);
        out.executableName = json::getStringOr(*cli, "executableName", out.executableName);
        out.wslLauncher = json::getStringOr(*cli, "wslLauncher", out.wslLauncher);
        out.systemPrompt = json::getOptionalString(*cli, "systemPrompt");
        out.resumeNotFoundExitCode = json::getIntOr(*cli, "resumeNotFoundExitCode", out.resumeNotFoundExitCode);
        out.resumeNotFoundMarker = json::getStringOr(*cli, "resumeNotFoundMarker", out.resumeNotFoundMarker);
        out.resumeNotFoundRequiresMarker =
            json::getBoolOr(*cli, "resumeNotFoundRequiresMarker", out.resumeNotFoundRequiresMarker);

        auto& flags = out.flags;
        flags.model = json::getStringOr(*cli, "model", flags.model);
        flags.resumeFlag = json::getStringOr(*cli, "resumeFlag", flags.resumeFlag);
        flags.promptFlag = json::getStringOr(*cli, "promptFlag", flags.promptFlag);
        flags.modelFlag = json::getStringOr(*cli, "modelFlag", flags.modelFlag);
        flags.systemPromptFlag = json::getStringOr(*cli, "systemPromptFlag", flags.systemPromptFlag);
        if (cli->contains("outputArgs"))
            flags.outputArgs = json::getStringArray(*cli, "outputArgs");
        flags.extraArgs = json::getStringArray(*cli, "extraArgs");
    }

    if (auto const* paths = section(root, "paths"))
    {
        auto const modeName = json::getStringOr(*paths, "mode", "auto");
        auto const mode = pathModeFromString(modeName);
        if (!mode)
            return makeError(ErrorCode::ConfigError,
                             std::format("Unknown paths.mode '{}' (expected auto, host or wsl)", modeName));
        config.paths.mode = *mode;
        config.paths.mountRoot = json::getStringOr(*paths, "mountRoot", config.paths.mountRoot);
        config.paths.distribution = json::getStringOr(*paths, "distribution", config.paths.distribution);
    }

    if (auto const* tokens = section(root, "tokens"))
    {
        config.tokens.maxTokens = json::getUint64Or(*tokens, "maxTokens", config.tokens.maxTokens);
        config.tokens.autoThreshold = json::getDoubleOr(*tokens, "autoThreshold", config.tokens.autoThreshold);
        config.tokens.forceThreshold = json::getDoubleOr(*tokens, "forceThreshold", config.tokens.forceThreshold);
    }

    if (auto const* compaction = section(root, "compaction"))
    {
        auto& out = config.compaction;
        out.cooldown = std::chrono::seconds(json::getInt64Or(*compaction, "cooldownSeconds", out.cooldown.count()));
        out.maxAttempts = json::getIntOr(*compaction, "maxAttempts", out.maxAttempts);
        out.prompt = json::getStringOr(*compaction, "prompt", out.prompt);
        auto const timeoutSeconds = std::chrono::duration_cast<std::chrono::seconds>(out.timeout).count();
        out.timeout = std::chrono::seconds(json::getInt64Or(*compaction, "timeoutSeconds", timeoutSeconds));
    }

    if (auto const* watchdog = section(root, "watchdog"))
    {
        auto& out = config.watchdog;
        out.stallTimeout =
            std::chrono::seconds(json::getInt64Or(*watchdog, "stallTimeoutSeconds", out.stallTimeout.count()));
        out.killGrace = std::chrono::milliseconds(json::getInt64Or(*watchdog, "killGraceMs", out.killGrace.count()));
        out.retryOnStall = json::getBoolOr(*watchdog, "retryOnStall", out.retryOnStall);
    }

    if (auto const* resume = section(root, "resume"))
    {
        auto& out = config.resume;
        out.contextReplayMessages = static_cast<size_t>(
            json::getUint64Or(*resume, "contextReplayMessages", out.contextReplayMessages));
        out.contextReplayChars =
            static_cast<size_t>(json::getUint64Or(*resume, "contextReplayChars", out.contextReplayChars));
    }

    if (auto const* storage = section(root, "storage"))
    {
        auto& out = config.storage;
        out.sessionDirectory = json::getStringOr(*storage, "sessionDirectory", out.sessionDirectory);
        out.writer.retryBaseDelay = std::chrono::milliseconds(
            json::getInt64Or(*storage, "writeRetryBaseDelayMs", out.writer.retryBaseDelay.count()));
        out.writer.retryMaxDelay = std::chrono::milliseconds(
            json::getInt64Or(*storage, "writeRetryMaxDelayMs", out.writer.retryMaxDelay.count()));
    }

    if (auto const* logging = section(root, "logging"))
    {
        config.logging.level = json::getStringOr(*logging, "level", config.logging.level);
        config.logging.file = json::getStringOr(*logging, "file", config.logging.file);
    }

    if (auto valid = validate(config); !valid)
        return std::unexpected(valid.error());
    return config;
}

auto configToJson(const AppConfig& config) -> nlohmann::json
{
    auto root = nlohmann::json::object();

    auto cli = nlohmann::json::object();
    if (!config.cli.executable.empty())
        cli["executable"] = config.cli.executable;
    cli["executableName"] = config.cli.executableName;
    cli["wslLauncher"] = config.cli.wslLauncher;
    if (config.cli.systemPrompt)
        cli["systemPrompt"] = *config.cli.systemPrompt;
    cli["resumeNotFoundExitCode"] = config.cli.resumeNotFoundExitCode;
    cli["resumeNotFoundMarker"] = config.cli.resumeNotFoundMarker;
    cli["resumeNotFoundRequiresMarker"] = config.cli.resumeNotFoundRequiresMarker;
    if (!config.cli.flags.model.empty())
        cli["model"] = config.cli.flags.model;
    cli["resumeFlag"] = config.cli.flags.resumeFlag;
    cli["promptFlag"] = config.cli.flags.promptFlag;
    cli["modelFlag"] = config.cli.flags.modelFlag;
    cli["systemPromptFlag"] = config.cli.flags.systemPromptFlag;
    cli["outputArgs"] = config.cli.flags.outputArgs;
    if (!config.cli.flags.extraArgs.empty())
        cli["extraArgs"] = config.cli.flags.extraArgs;
    root["cli"] = std::move(cli);

    auto paths = nlohmann::json::object();
    paths["mode"] = pathModeToString(config.paths.mode);
    paths["mountRoot"] = config.paths.mountRoot;
    if (!config.paths.distribution.empty())
        paths["distribution"] = config.paths.distribution;
    root["paths"] = std::move(paths);

    root["tokens"] = {
        { "maxTokens", config.tokens.maxTokens },
        { "autoThreshold", config.tokens.autoThreshold },
        { "forceThreshold", config.tokens.forceThreshold },
    };

    root["compaction"] = {
        { "cooldownSeconds", config.compaction.cooldown.count() },
        { "maxAttempts", config.compaction.maxAttempts },
        { "prompt", config.compaction.prompt },
        { "timeoutSeconds", std::chrono::duration_cast<std::chrono::seconds>(config.compaction.timeout).count() },
    };

    root["watchdog"] = {
        { "stallTimeoutSeconds", config.watchdog.stallTimeout.count() },
        { "killGraceMs", config.watchdog.killGrace.count() },
        { "retryOnStall", config.watchdog.retryOnStall },
    };

    root["resume"] = {
        { "contextReplayMessages", config.resume.contextReplayMessages },
        { "contextReplayChars", config.resume.contextReplayChars },
    };

    auto storage = nlohmann::json::object();
    if (!config.storage.sessionDirectory.empty())
        storage["sessionDirectory"] = config.storage.sessionDirectory;
    storage["writeRetryBaseDelayMs"] = config.storage.writer.retryBaseDelay.count();
    storage["writeRetryMaxDelayMs"] = config.storage.writer.retryMaxDelay.count();
    root["storage"] = std::move(storage);

    auto logging = nlohmann::json { { "level", config.logging.level } };
    if (!config.logging.file.empty())
        logging["file"] = config.logging.file;
    root["logging"] = std::move(logging);

    return root;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto parseResult = json::parse(ss.str());
    if (!parseResult)
        return makeError(ErrorCode::ConfigError,
                         std::format("Invalid config file {}: {}", path, parseResult.error().message));

    return configFromJson(*parseResult);
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << configToJson(config).dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

auto makeLocatorContext(const AppConfig& config) -> LocatorContext
{
    auto context = LocatorContext {};
    context.executableName = config.cli.executableName;
    if (!config.cli.executable.empty())
        context.explicitPath = config.cli.executable;
    context.wslLauncher = config.cli.wslLauncher;
    context.wslDistribution = config.paths.distribution;
    return context;
}

auto makeSupervisorConfig(const AppConfig& config) -> SupervisorConfig
{
    auto supervisor = SupervisorConfig {};
    supervisor.flags = config.cli.flags;
    switch (config.paths.mode)
    {
        case PathMode::Auto: break;
        case PathMode::Host: supervisor.pathMode = PathNamespace::Host; break;
        case PathMode::Wsl: supervisor.pathMode = PathNamespace::Wsl; break;
    }
    supervisor.paths.mountRoot = config.paths.mountRoot;
    supervisor.paths.distribution = config.paths.distribution;
    supervisor.killGrace = config.watchdog.killGrace;
    supervisor.stallTimeout = config.watchdog.stallTimeout;
    return supervisor;
}

auto makeManagerConfig(const AppConfig& config) -> ConversationManagerConfig
{
    auto manager = ConversationManagerConfig {};
    manager.tokens = config.tokens;
    manager.compaction = config.compaction;
    manager.resume.resumeNotFoundExitCode = config.cli.resumeNotFoundExitCode;
    manager.resume.resumeNotFoundMarker = config.cli.resumeNotFoundMarker;
    manager.resume.requireMarker = config.cli.resumeNotFoundRequiresMarker;
    manager.resume.contextReplayMessages = config.resume.contextReplayMessages;
    manager.resume.contextReplayChars = config.resume.contextReplayChars;
    manager.resume.systemPrompt = config.cli.systemPrompt;
    manager.writer = config.storage.writer;
    manager.retryOnStall = config.watchdog.retryOnStall;
    return manager;
}

auto sessionDirectory(const AppConfig& config) -> std::string
{
    return config.storage.sessionDirectory.empty() ? defaultSessionDir() : config.storage.sessionDirectory;
}

} // namespace agentlink
