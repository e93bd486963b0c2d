// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Channel.hpp>
#include <core/Error.hpp>
#include <core/Time.hpp>
#include <platform/PathTranslator.hpp>
#include <process/ExecutableLocator.hpp>
#include <process/Subprocess.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace agentlink
{

/// @brief What one agent round should do.
struct SpawnPlan
{
    std::string prompt;

    /// @brief Conversation to resume; a fresh conversation is started if unset.
    std::optional<std::string> resumeId;

    std::optional<std::string> systemPrompt;

    /// @brief Host path the agent works in.
    std::string workingDirectory;

    /// @brief Whether this is a compaction round.
    bool compaction = false;

    /// @brief Upper bound for the whole round; the round is killed when it is exceeded.
    std::optional<std::chrono::milliseconds> timeout;
};

/// @brief Command-line surface of the agent CLI.
struct CliFlags
{
    std::string resumeFlag = "--resume";
    std::string promptFlag = "-p";
    std::string modelFlag = "--model";
    std::string systemPromptFlag = "--append-system-prompt";
    std::vector<std::string> outputArgs { "--output-format", "stream-json", "--verbose" };

    /// @brief Model to request; omitted from the command line if empty.
    std::string model;

    std::vector<std::string> extraArgs;
};

/// @brief Builds the agent arguments for @p plan:
/// `[resume id] [prompt text] [model m] output args [system prompt text] extra args`.
[[nodiscard]] auto buildArguments(const SpawnPlan& plan, const CliFlags& flags) -> std::vector<std::string>;

/// @brief Configuration for ProcessSupervisor.
struct SupervisorConfig
{
    CliFlags flags;

    /// @brief Path namespace of the agent; follows the resolved executable if unset.
    std::optional<PathNamespace> pathMode;
    PathTranslatorConfig paths;

    /// @brief Time between the graceful termination request and the forceful kill.
    std::chrono::milliseconds killGrace { 2000 };

    /// @brief A running process without output for this long is reported as stalled.
    std::chrono::milliseconds stallTimeout { std::chrono::minutes(5) };

    /// @brief Granularity of the read loop.
    std::chrono::milliseconds pollInterval { 100 };

    /// @brief How long to keep reading after the child exited while descendants keep the pipes open.
    std::chrono::milliseconds exitDrainTimeout { 1000 };

    size_t stderrTailBytes = 16 * 1024;

    /// @brief Extra environment variables for the agent.
    std::map<std::string, std::string> env;
};

/// @brief How an agent process ended.
struct ExitStatus
{
    int exitCode = -1;
    std::optional<int> signal;

    /// @brief The supervisor killed the process (stop request, stall or timeout).
    bool killed = false;

    /// @brief The watchdog reported the process as stalled.
    bool stalled = false;

    /// @brief The round exceeded its timeout.
    bool timedOut = false;

    /// @brief The round was started with a resume id.
    bool resumed = false;

    /// @brief Last bytes the process wrote to stderr.
    std::string stderrTail;

    [[nodiscard]] auto success() const -> bool { return exitCode == 0 && !signal && !killed; }
};

enum class ProcessEventKind : std::uint8_t
{
    /// A chunk of stdout, in emission order.
    Output,
    /// No output arrived within the watchdog window.
    Stalled,
    /// The process ended. Always the last event.
    Exited,
};

struct ProcessEvent
{
    ProcessEventKind kind = ProcessEventKind::Output;
    std::string data;
    ExitStatus exit;
};

/// @brief A live agent process owned by one session.
class ProcessHandle
{
    struct PrivateTag
    {
        explicit PrivateTag() = default;
    };

  public:
    using ExitCallback = std::function<void(const ExitStatus&)>;

    ProcessHandle(PrivateTag,
                  uint64_t id,
                  std::string sessionId,
                  std::unique_ptr<Subprocess> process,
                  PathTranslator translator,
                  bool resumed);

    [[nodiscard]] auto id() const -> uint64_t { return _id; }
    [[nodiscard]] auto sessionId() const -> const std::string& { return _sessionId; }
    [[nodiscard]] auto spawnedAt() const -> TimePoint { return _spawnedAt; }
    [[nodiscard]] auto pid() const -> int64_t { return _process->pid(); }
    [[nodiscard]] auto translator() const -> const PathTranslator& { return _translator; }

    /// @brief Output, stall and exit notifications of this process, in order.
    [[nodiscard]] auto events() -> Channel<ProcessEvent>& { return _events; }

    [[nodiscard]] auto hasExited() const -> bool { return _finished.load(); }

  private:
    friend class ProcessSupervisor;

    uint64_t _id;
    std::string _sessionId;
    TimePoint _spawnedAt;
    std::unique_ptr<Subprocess> _process;
    PathTranslator _translator;
    bool _resumed;
    Channel<ProcessEvent> _events;
    std::atomic<bool> _killRequested = false;
    std::atomic<bool> _stalled = false;
    std::atomic<bool> _finished = false;

    std::mutex _exitMutex;
    std::optional<ExitStatus> _exitStatus;
    std::vector<ExitCallback> _exitCallbacks;
};

using ProcessHandlePtr = std::shared_ptr<ProcessHandle>;

/// @brief Spawns, monitors and terminates agent processes, at most one per session.
///
/// Each spawned process gets a dedicated read loop that forwards its stdout through the
/// handle's event channel, keeps a bounded stderr tail, reports stalls and finally
/// reports the exit.
class ProcessSupervisor
{
  public:
    ProcessSupervisor(ExecutableLocator& locator, SupervisorConfig config);
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    /// @brief Starts the agent for @p sessionId.
    /// @return The handle, SpawnFailure, or SessionBusy if the session already owns a process.
    [[nodiscard]] auto spawn(const std::string& sessionId, const SpawnPlan& plan) -> Result<ProcessHandlePtr>;

    /// @brief Terminates the process: graceful request, bounded wait, then forceful kill.
    void kill(const ProcessHandlePtr& handle);

    /// @brief Registers @p callback to run once the process has exited (immediately if it already has).
    void onExit(const ProcessHandlePtr& handle, ProcessHandle::ExitCallback callback);

    /// @brief The live process owned by @p sessionId, if any.
    [[nodiscard]] auto find(std::string_view sessionId) const -> ProcessHandlePtr;

    /// @brief Kills every live process.
    void killAll();

    [[nodiscard]] auto liveCount() const -> size_t;

    /// @brief The path translator for the resolved agent executable.
    [[nodiscard]] auto translator() -> Result<PathTranslator>;

    [[nodiscard]] auto config() const -> const SupervisorConfig& { return _config; }

  private:
    void readLoop(const ProcessHandlePtr& handle);
    void finish(const ProcessHandlePtr& handle, ExitStatus status);
    void reapReaders();

    ExecutableLocator& _locator;
    SupervisorConfig _config;

    mutable std::mutex _mutex;
    std::map<std::string, ProcessHandlePtr, std::less<>> _live;
    std::vector<std::pair<ProcessHandlePtr, std::jthread>> _readers;
    uint64_t _nextHandleId = 1;
};

} // namespace agentlink
