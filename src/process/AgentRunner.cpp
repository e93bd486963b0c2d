// SPDX-License-Identifier: Apache-2.0
#include "AgentRunner.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

namespace agentlink
{

namespace
{

    using SteadyClock = std::chrono::steady_clock;

    /// Rewrites the agent's view of its working directory into a host path.
    void translateWorkingDirectory(StreamMessage& message, const PathTranslator& translator)
    {
        if (message.type != MessageType::System || translator.mode() == PathNamespace::Host)
            return;
        if (auto cwd = json::getOptionalString(message.raw, "cwd"))
            message.raw["cwd"] = translator.toHostPath(*cwd);
    }

} // namespace

ProcessAgentRunner::ProcessAgentRunner(ProcessSupervisor& supervisor, StreamParserConfig parserConfig):
    _supervisor(supervisor), _parserConfig(parserConfig)
{
}

auto ProcessAgentRunner::run(const std::string& sessionId, const SpawnPlan& plan, const RoundObserver& observer)
    -> Result<RoundResult>
{
    if (observer.stopToken.stop_requested())
    {
        log::info("Round for session {} was stopped before it started", sessionId);
        auto result = RoundResult {};
        result.exit.killed = true;
        result.exit.resumed = plan.resumeId.has_value();
        return result;
    }

    auto handle = _supervisor.spawn(sessionId, plan);
    if (!handle)
        return std::unexpected(handle.error());

    // Also fires right away when the stop arrived while spawning.
    auto const killOnStop =
        std::stop_callback(observer.stopToken, [this, process = *handle] { _supervisor.kill(process); });

    if (observer.onSpawned)
        observer.onSpawned();

    auto result = RoundResult {};
    auto const& translator = (*handle)->translator();
    auto parser = StreamParser(
        [&](StreamMessage message) {
            translateWorkingDirectory(message, translator);
            if (message.resumeId && (message.type == MessageType::Result || !result.finalResult))
                result.resumeId = message.resumeId;
            if (message.type == MessageType::Result)
                result.finalResult = message;
            ++result.messageCount;
            if (observer.onMessage)
                observer.onMessage(std::move(message));
        },
        _parserConfig);
    parser.setUnparsedLineHandler([&, limit = _supervisor.config().stderrTailBytes](std::string_view line) {
        result.unparsedOutput.append(line);
        result.unparsedOutput += '\n';
        if (result.unparsedOutput.size() > limit)
            result.unparsedOutput.erase(0, result.unparsedOutput.size() - limit);
    });

    auto const deadline = plan.timeout ? std::optional(SteadyClock::now() + *plan.timeout) : std::nullopt;
    auto timedOut = false;
    auto& events = (*handle)->events();

    while (true)
    {
        auto event = std::optional<ProcessEvent> {};
        if (deadline)
        {
            auto const now = SteadyClock::now();
            if (now >= *deadline && !timedOut)
            {
                timedOut = true;
                log::warning("Round for session {} exceeded its timeout of {}", sessionId, *plan.timeout);
                _supervisor.kill(*handle);
            }
            event = timedOut ? events.pop() : events.popFor(*deadline - now);
            if (!event && !events.isClosed())
                continue;
        }
        else
        {
            event = events.pop();
        }

        if (!event)
        {
            log::error("Event stream of session {} ended without an exit notification", sessionId);
            result.exit.exitCode = -1;
            break;
        }

        if (event->kind == ProcessEventKind::Output)
        {
            parser.feed(event->data);
        }
        else if (event->kind == ProcessEventKind::Stalled)
        {
            log::warning("Killing stalled agent for session {}", sessionId);
            _supervisor.kill(*handle);
        }
        else
        {
            parser.finish();
            result.exit = std::move(event->exit);
            break;
        }
    }

    result.exit.timedOut = timedOut;
    result.droppedLines = parser.droppedLines();
    return result;
}

void ProcessAgentRunner::cancel(const std::string& sessionId)
{
    if (auto handle = _supervisor.find(sessionId))
        _supervisor.kill(handle);
}

void ProcessAgentRunner::cancelAll()
{
    _supervisor.killAll();
}

} // namespace agentlink
