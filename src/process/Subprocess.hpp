// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentlink
{

/// @brief What to run.
struct SubprocessConfig
{
    std::string program;
    std::vector<std::string> args;

    /// @brief Directory the child starts in; the parent's directory if unset.
    std::optional<std::string> workingDirectory;

    /// @brief Variables added to (or replacing entries of) the inherited environment.
    std::map<std::string, std::string> env;
};

/// @brief How a child process ended.
struct ExitInfo
{
    /// @brief Exit code; 128 + signal number for signal terminations, -1 if unknown.
    int exitCode = -1;

    /// @brief Terminating signal (POSIX only).
    std::optional<int> signal;

    [[nodiscard]] auto success() const -> bool { return exitCode == 0 && !signal; }
};

/// @brief Output collected by one Subprocess::read() call.
struct ReadChunk
{
    std::string output;
    std::string errors;
    bool outputClosed = false;
    bool errorsClosed = false;
};

/// @brief Quotes @p arg for the MSVC runtime command-line parser. Arguments without
/// whitespace or quotes are left bare unless @p always is set.
[[nodiscard]] auto quoteWindowsArgument(std::string_view arg, bool always = false) -> std::string;

/// @brief Caret-escapes the cmd.exe metacharacters of @p text, @p levels times over.
[[nodiscard]] auto escapeForCmd(std::string_view text, int levels = 1) -> std::string;

/// @brief Whether @p program is a batch file (`.cmd`, `.bat`), which needs cmd.exe to run.
[[nodiscard]] auto isBatchFile(std::string_view program) -> bool;

/// @brief The CreateProcess command line for @p config. Batch files are run through
/// `cmd.exe /d /s /c` with every argument quoted and escaped, so no argument text is
/// interpreted by the command interpreter.
[[nodiscard]] auto buildWindowsCommandLine(const SubprocessConfig& config) -> std::string;

/// @brief A child process with piped stdout and stderr and stdin bound to the null device.
///
/// The child runs in its own process group (POSIX) or console process group (Windows),
/// so termination signals reach the agent's own children as well. read() is meant to be
/// called from a single reader thread; the waiting and signalling functions may be
/// called from any thread.
class Subprocess
{
    struct PrivateTag
    {
        explicit PrivateTag() = default;
    };

  public:
    explicit Subprocess(PrivateTag);
    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    /// @brief Starts a child process.
    /// @return The running process, or SpawnFailure.
    [[nodiscard]] static auto spawn(const SubprocessConfig& config) -> Result<std::unique_ptr<Subprocess>>;

    [[nodiscard]] auto pid() const -> int64_t;

    /// @brief Waits up to @p timeout for output on either pipe and returns what is available.
    /// @return The chunk (possibly empty on timeout), or IoError.
    [[nodiscard]] auto read(std::chrono::milliseconds timeout) -> Result<ReadChunk>;

    /// @brief Reaps the child if it has exited, without blocking.
    [[nodiscard]] auto tryWait() -> std::optional<ExitInfo>;

    /// @brief Waits up to @p timeout for the child to exit.
    [[nodiscard]] auto waitFor(std::chrono::milliseconds timeout) -> std::optional<ExitInfo>;

    /// @brief Asks the process group to terminate (SIGTERM / CTRL_BREAK_EVENT).
    void terminate();

    /// @brief Forcefully kills the process group (SIGKILL / TerminateProcess).
    void forceKill();

    /// @brief Graceful termination, escalating to a forceful kill after @p grace.
    ///
    /// Always returns within roughly grace + one second.
    auto stop(std::chrono::milliseconds grace) -> ExitInfo;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace agentlink
