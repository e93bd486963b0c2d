// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <process/ProcessSupervisor.hpp>
#include <protocol/StreamMessage.hpp>
#include <protocol/StreamParser.hpp>

#include <functional>
#include <optional>
#include <stop_token>
#include <string>

namespace agentlink
{

/// @brief Everything a finished agent round reported.
struct RoundResult
{
    ExitStatus exit;

    /// @brief The last `result` message of the round, if any.
    std::optional<StreamMessage> finalResult;

    /// @brief Resume token reported by the round (the result's session_id, else the last one seen).
    std::optional<std::string> resumeId;

    /// @brief Stdout lines that were not stream messages, newline-separated and bounded like the stderr tail.
    std::string unparsedOutput;

    size_t messageCount = 0;
    size_t droppedLines = 0;
};

/// @brief Progress callbacks of one round, invoked on the thread that called AgentRunner::run().
struct RoundObserver
{
    /// @brief The agent process is running.
    std::function<void()> onSpawned;

    /// @brief One decoded message, in emission order.
    std::function<void(StreamMessage message)> onMessage;

    /// @brief A stop request ends the round: before the spawn it is not started, afterwards
    /// the process is killed.
    std::stop_token stopToken;
};

/// @brief Runs one agent round to completion.
class AgentRunner
{
  public:
    virtual ~AgentRunner() = default;

    /// @brief Runs @p plan for @p sessionId and blocks until the round has ended.
    /// @return The round result (also for non-zero exits), or SpawnFailure / SessionBusy.
    [[nodiscard]] virtual auto run(const std::string& sessionId, const SpawnPlan& plan, const RoundObserver& observer)
        -> Result<RoundResult> = 0;

    /// @brief Stops the round currently running for @p sessionId, if any.
    virtual void cancel(const std::string& sessionId) = 0;

    /// @brief Stops every running round.
    virtual void cancelAll() = 0;
};

/// @brief AgentRunner backed by real processes from a ProcessSupervisor.
///
/// Output is decoded incrementally; `cwd` fields of system messages are translated back
/// into host paths. A stalled or timed-out round is killed and reported as such.
class ProcessAgentRunner final: public AgentRunner
{
  public:
    explicit ProcessAgentRunner(ProcessSupervisor& supervisor, StreamParserConfig parserConfig = {});

    [[nodiscard]] auto run(const std::string& sessionId, const SpawnPlan& plan, const RoundObserver& observer)
        -> Result<RoundResult> override;

    void cancel(const std::string& sessionId) override;
    void cancelAll() override;

  private:
    ProcessSupervisor& _supervisor;
    StreamParserConfig _parserConfig;
};

} // namespace agentlink
