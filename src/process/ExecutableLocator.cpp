// SPDX-License-Identifier: Apache-2.0
#include "ExecutableLocator.hpp"

#include <core/Log.hpp>
#include <process/Subprocess.hpp>

#include <array>
#include <cstdlib>
#include <format>

#ifndef _WIN32
    #include <unistd.h>
#endif

namespace agentlink
{

namespace
{

#ifdef _WIN32
    constexpr auto PathListSeparator = ';';
    constexpr auto ExecutableSuffixes = std::array<std::string_view, 4> { "", ".exe", ".cmd", ".bat" };
#else
    constexpr auto PathListSeparator = ':';
    constexpr auto ExecutableSuffixes = std::array<std::string_view, 1> { "" };
#endif

    auto resolvedFrom(const std::filesystem::path& path, std::string_view strategy) -> ResolvedExecutable
    {
        return ResolvedExecutable {
            .program = path.string(),
            .prefixArgs = {},
            .pathNamespace = PathNamespace::Host,
            .workingDirectoryFlag = std::nullopt,
            .strategy = std::string(strategy),
        };
    }

    auto probeWithSuffixes(const std::filesystem::path& base) -> std::optional<std::filesystem::path>
    {
        for (auto const suffix: ExecutableSuffixes)
        {
            auto candidate = base;
            candidate += std::string(suffix);
            if (isExecutableFile(candidate))
                return candidate;
        }
        return std::nullopt;
    }

} // namespace

auto processEnvironment() -> EnvironmentLookup
{
    return [](std::string_view name) -> std::optional<std::string> {
        auto const* const value = std::getenv(std::string(name).c_str());
        if (!value || !*value)
            return std::nullopt;
        return std::string(value);
    };
}

auto isExecutableFile(const std::filesystem::path& path) -> bool
{
    auto ec = std::error_code {};
    if (!std::filesystem::is_regular_file(path, ec) || ec)
        return false;
#ifdef _WIN32
    return true;
#else
    return ::access(path.c_str(), X_OK) == 0;
#endif
}

auto findInPathList(std::string_view pathList, std::string_view name) -> std::optional<std::filesystem::path>
{
    while (!pathList.empty())
    {
        auto const separator = pathList.find(PathListSeparator);
        auto const directory = pathList.substr(0, separator);
        pathList = separator == std::string_view::npos ? std::string_view {} : pathList.substr(separator + 1);

        if (directory.empty())
            continue;
        if (auto found = probeWithSuffixes(std::filesystem::path(directory) / name))
            return found;
    }
    return std::nullopt;
}

auto ExplicitPathStrategy::locate(const LocatorContext& context) const -> std::optional<ResolvedExecutable>
{
    if (!context.explicitPath || context.explicitPath->empty())
        return std::nullopt;

    if (auto found = probeWithSuffixes(*context.explicitPath))
        return resolvedFrom(*found, name());

    log::warning("Configured agent executable {} is not an executable file", *context.explicitPath);
    return std::nullopt;
}

auto EnvironmentStrategy::locate(const LocatorContext& context) const -> std::optional<ResolvedExecutable>
{
    auto const value = context.environment(context.environmentVariable);
    if (!value)
        return std::nullopt;

    if (isExecutableFile(*value))
        return resolvedFrom(*value, name());

    log::warning("{} points to {}, which is not an executable file", context.environmentVariable, *value);
    return std::nullopt;
}

auto SearchPathStrategy::locate(const LocatorContext& context) const -> std::optional<ResolvedExecutable>
{
    auto const pathList = context.environment("PATH");
    if (!pathList)
        return std::nullopt;

    if (auto found = findInPathList(*pathList, context.executableName))
        return resolvedFrom(*found, name());
    return std::nullopt;
}

auto KnownLocationsStrategy::candidates(const LocatorContext& context) -> std::vector<std::filesystem::path>
{
    auto locations = std::vector<std::filesystem::path> {};
    auto const& executable = context.executableName;

#ifdef _WIN32
    if (auto const appData = context.environment("APPDATA"))
        locations.push_back(std::filesystem::path(*appData) / "npm" / executable);
    if (auto const localAppData = context.environment("LOCALAPPDATA"))
    {
        locations.push_back(std::filesystem::path(*localAppData) / "npm" / executable);
        locations.push_back(std::filesystem::path(*localAppData) / "Programs" / executable / executable);
    }
    if (auto const userProfile = context.environment("USERPROFILE"))
        locations.push_back(std::filesystem::path(*userProfile) / ".local" / "bin" / executable);
#else
    if (auto const home = context.environment("HOME"))
    {
        auto const homeDir = std::filesystem::path(*home);
        locations.push_back(homeDir / ".npm-global" / "bin" / executable);
        locations.push_back(homeDir / ".local" / "bin" / executable);
        locations.push_back(homeDir / ".claude" / "local" / executable);
    }
    locations.push_back(std::filesystem::path("/opt/homebrew/bin") / executable);
    locations.push_back(std::filesystem::path("/usr/local/bin") / executable);
    locations.push_back(std::filesystem::path("/usr/bin") / executable);
#endif

    return locations;
}

auto KnownLocationsStrategy::locate(const LocatorContext& context) const -> std::optional<ResolvedExecutable>
{
    for (const auto& candidate: candidates(context))
    {
        if (auto found = probeWithSuffixes(candidate))
            return resolvedFrom(*found, name());
    }
    return std::nullopt;
}

auto WslLauncherStrategy::locate(const LocatorContext& context) const -> std::optional<ResolvedExecutable>
{
    auto const pathList = context.environment("PATH");
    if (!pathList)
        return std::nullopt;

    auto const launcher = findInPathList(*pathList, context.wslLauncher);
    if (!launcher)
        return std::nullopt;

    auto resolved = resolvedFrom(*launcher, name());
    resolved.pathNamespace = PathNamespace::Wsl;
    resolved.workingDirectoryFlag = "--cd";
    if (!context.wslDistribution.empty())
    {
        resolved.prefixArgs.emplace_back("-d");
        resolved.prefixArgs.push_back(context.wslDistribution);
    }
    // Run through a login shell so the user's profile puts the agent on PATH.
    resolved.prefixArgs.emplace_back("--");
    resolved.prefixArgs.emplace_back("bash");
    resolved.prefixArgs.emplace_back("-lc");
    resolved.prefixArgs.push_back(std::format("exec {} \"$@\"", context.executableName));
    resolved.prefixArgs.push_back(context.executableName);
    return resolved;
}

auto bypassBatchShim(ResolvedExecutable resolved, const LocatorContext& context) -> ResolvedExecutable
{
    if (!isBatchFile(resolved.program) || context.shimScript.empty())
        return resolved;

    auto const shimDirectory = std::filesystem::path(resolved.program).parent_path();
    auto const script = shimDirectory / context.shimScript;
    auto ec = std::error_code {};
    if (!std::filesystem::is_regular_file(script, ec))
    {
        log::debug("No script for batch shim {} at {}", resolved.program, script.string());
        return resolved;
    }

    auto node = probeWithSuffixes(shimDirectory / context.nodeExecutable);
    if (!node)
    {
        if (auto const pathList = context.environment("PATH"))
            node = findInPathList(*pathList, context.nodeExecutable);
    }
    if (!node)
    {
        log::warning("Found {} but no {} to run it with; falling back to cmd.exe",
                     script.string(),
                     context.nodeExecutable);
        return resolved;
    }

    log::debug("Running batch shim {} as {} {}", resolved.program, node->string(), script.string());
    resolved.program = node->string();
    resolved.prefixArgs.insert(resolved.prefixArgs.begin(), script.string());
    return resolved;
}

ExecutableLocator::ExecutableLocator(LocatorContext context, std::vector<std::unique_ptr<LocatorStrategy>> strategies):
    _context(std::move(context)), _strategies(std::move(strategies))
{
}

ExecutableLocator::ExecutableLocator(LocatorContext context):
    ExecutableLocator(std::move(context), defaultStrategies())
{
}

auto ExecutableLocator::defaultStrategies() -> std::vector<std::unique_ptr<LocatorStrategy>>
{
    auto strategies = std::vector<std::unique_ptr<LocatorStrategy>> {};
    strategies.push_back(std::make_unique<ExplicitPathStrategy>());
    strategies.push_back(std::make_unique<EnvironmentStrategy>());
    strategies.push_back(std::make_unique<SearchPathStrategy>());
    strategies.push_back(std::make_unique<KnownLocationsStrategy>());
    strategies.push_back(std::make_unique<WslLauncherStrategy>());
    return strategies;
}

auto ExecutableLocator::resolve() -> Result<ResolvedExecutable>
{
    auto lock = std::lock_guard(_mutex);
    if (_cached)
        return *_cached;

    for (const auto& strategy: _strategies)
    {
        auto resolved = strategy->locate(_context);
        if (!resolved)
        {
            log::trace("Locator strategy {} found nothing", strategy->name());
            continue;
        }

        _cached = bypassBatchShim(std::move(*resolved), _context);
        log::info("Using agent executable {} (via {}, {} paths)",
                  _cached->program,
                  strategy->name(),
                  pathNamespaceToString(_cached->pathNamespace));
        return *_cached;
    }

    return makeError(ErrorCode::SpawnFailure,
                     std::format("Could not find the agent executable '{}'. Install it, put it on PATH, "
                                 "or set {} or the cli.executable configuration value.",
                                 _context.executableName,
                                 _context.environmentVariable));
}

void ExecutableLocator::reset()
{
    auto lock = std::lock_guard(_mutex);
    _cached.reset();
}

} // namespace agentlink
