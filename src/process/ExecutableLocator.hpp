// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <platform/PathTranslator.hpp>

#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentlink
{

/// @brief How to launch the agent CLI once it has been found.
struct ResolvedExecutable
{
    /// @brief File passed to the OS process API.
    std::string program;

    /// @brief Arguments inserted between the program and the agent arguments.
    std::vector<std::string> prefixArgs;

    /// @brief Namespace the agent sees paths in.
    PathNamespace pathNamespace = PathNamespace::Host;

    /// @brief If set, the working directory is passed as `<flag> <dir>` (before prefixArgs)
    /// instead of changing the child's directory.
    std::optional<std::string> workingDirectoryFlag;

    /// @brief Name of the strategy that produced this result.
    std::string strategy;
};

/// @brief Environment lookup, injectable for tests.
using EnvironmentLookup = std::function<std::optional<std::string>(std::string_view name)>;

/// @brief Returns an EnvironmentLookup backed by the process environment.
[[nodiscard]] auto processEnvironment() -> EnvironmentLookup;

/// @brief Inputs shared by all locator strategies.
struct LocatorContext
{
    /// @brief Bare executable name of the agent CLI.
    std::string executableName = "claude";

    /// @brief Explicitly configured path (configuration file or command line).
    std::optional<std::string> explicitPath;

    /// @brief Environment variable that may name the executable.
    std::string environmentVariable = "AGENTLINK_CLI_PATH";

    /// @brief Launcher used to run the agent inside WSL.
    std::string wslLauncher = "wsl.exe";

    /// @brief WSL distribution passed to the launcher (`-d`), empty for the default one.
    std::string wslDistribution;

    /// @brief Script behind an npm batch shim, relative to the shim's directory. A shim with
    /// this script is run as `node <script>` instead of through cmd.exe.
    std::string shimScript = "node_modules/@anthropic-ai/claude-code/cli.js";

    /// @brief Interpreter for shimScript, searched next to the shim and on `PATH`.
    std::string nodeExecutable = "node";

    EnvironmentLookup environment = processEnvironment();
};

/// @brief One way of finding the agent CLI.
class LocatorStrategy
{
  public:
    virtual ~LocatorStrategy() = default;

    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    /// @return The resolved executable, or std::nullopt if this strategy does not apply.
    [[nodiscard]] virtual auto locate(const LocatorContext& context) const -> std::optional<ResolvedExecutable> = 0;
};

/// @brief Uses LocatorContext::explicitPath.
class ExplicitPathStrategy final: public LocatorStrategy
{
  public:
    [[nodiscard]] auto name() const -> std::string_view override { return "explicit"; }
    [[nodiscard]] auto locate(const LocatorContext& context) const -> std::optional<ResolvedExecutable> override;
};

/// @brief Uses the path named by LocatorContext::environmentVariable.
class EnvironmentStrategy final: public LocatorStrategy
{
  public:
    [[nodiscard]] auto name() const -> std::string_view override { return "environment"; }
    [[nodiscard]] auto locate(const LocatorContext& context) const -> std::optional<ResolvedExecutable> override;
};

/// @brief Searches the directories of `PATH`.
class SearchPathStrategy final: public LocatorStrategy
{
  public:
    [[nodiscard]] auto name() const -> std::string_view override { return "search-path"; }
    [[nodiscard]] auto locate(const LocatorContext& context) const -> std::optional<ResolvedExecutable> override;
};

/// @brief Probes the usual per-user and system install directories.
class KnownLocationsStrategy final: public LocatorStrategy
{
  public:
    [[nodiscard]] auto name() const -> std::string_view override { return "known-locations"; }
    [[nodiscard]] auto locate(const LocatorContext& context) const -> std::optional<ResolvedExecutable> override;

    /// @brief Candidate files probed, in order.
    [[nodiscard]] static auto candidates(const LocatorContext& context) -> std::vector<std::filesystem::path>;
};

/// @brief Runs the agent inside WSL through the launcher found on `PATH`.
class WslLauncherStrategy final: public LocatorStrategy
{
  public:
    [[nodiscard]] auto name() const -> std::string_view override { return "wsl"; }
    [[nodiscard]] auto locate(const LocatorContext& context) const -> std::optional<ResolvedExecutable> override;
};

/// @brief Resolves the agent CLI by trying an ordered list of strategies.
///
/// The first strategy that succeeds wins, after bypassBatchShim() has been applied to it. A successful resolution is cached for the
/// lifetime of the locator; failures are not cached.
class ExecutableLocator
{
  public:
    ExecutableLocator(LocatorContext context, std::vector<std::unique_ptr<LocatorStrategy>> strategies);

    /// @brief Locator with the default strategy order:
    /// explicit, environment, search path, known locations, WSL launcher.
    explicit ExecutableLocator(LocatorContext context);

    /// @return The resolved executable, or SpawnFailure if no strategy found one.
    [[nodiscard]] auto resolve() -> Result<ResolvedExecutable>;

    /// @brief Forgets a cached resolution.
    void reset();

    [[nodiscard]] static auto defaultStrategies() -> std::vector<std::unique_ptr<LocatorStrategy>>;

  private:
    LocatorContext _context;
    std::vector<std::unique_ptr<LocatorStrategy>> _strategies;
    std::mutex _mutex;
    std::optional<ResolvedExecutable> _cached;
};

/// @brief Replaces an npm batch shim (`claude.cmd`) by the interpreter running the shim's
/// script directly. Other executables, and shims whose script or interpreter cannot be
/// found, are returned unchanged.
[[nodiscard]] auto bypassBatchShim(ResolvedExecutable resolved, const LocatorContext& context) -> ResolvedExecutable;

/// @brief Whether @p path names an existing file the current user may execute.
[[nodiscard]] auto isExecutableFile(const std::filesystem::path& path) -> bool;

/// @brief Searches @p pathList (a `PATH`-style list) for @p name.
[[nodiscard]] auto findInPathList(std::string_view pathList, std::string_view name)
    -> std::optional<std::filesystem::path>;

} // namespace agentlink
