// SPDX-License-Identifier: Apache-2.0
#include "ResumptionEngine.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <format>

namespace agentlink
{

namespace
{

    /// Truncates @p text to at most @p maxChars bytes without splitting a UTF-8 sequence.
    auto truncateUtf8(std::string text, size_t maxChars) -> std::string
    {
        if (text.size() <= maxChars)
            return text;
        auto cut = maxChars;
        while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80)
            --cut;
        text.resize(cut);
        text += "...";
        return text;
    }

    auto collapseWhitespace(std::string_view text) -> std::string
    {
        auto out = std::string {};
        out.reserve(text.size());
        auto pendingSpace = false;
        for (char const c: text)
        {
            if (c == '\n' || c == '\r' || c == '\t' || c == ' ')
            {
                pendingSpace = !out.empty();
                continue;
            }
            if (pendingSpace)
                out += ' ';
            pendingSpace = false;
            out += c;
        }
        return out;
    }

    auto makeUserMessage(const std::string& prompt) -> StreamMessage
    {
        auto raw = nlohmann::json {
            { "type", "user" },
            { "origin", "local" },
            { "message", { { "role", "user" }, { "content", prompt } } },
        };
        auto message = decodeStreamMessage(std::move(raw));
        // A locally built user object always decodes.
        return std::move(*message);
    }

    auto lastStderrLine(std::string_view tail) -> std::string_view
    {
        while (!tail.empty() && (tail.back() == '\n' || tail.back() == '\r'))
            tail.remove_suffix(1);
        auto const newline = tail.rfind('\n');
        return newline == std::string_view::npos ? tail : tail.substr(newline + 1);
    }

} // namespace

auto describeRoundFailure(const RoundResult& round) -> Error
{
    auto const& exit = round.exit;
    if (exit.timedOut)
        return Error { ErrorCode::TimeoutError, "The agent round exceeded its time limit and was stopped" };
    if (exit.stalled)
        return Error { ErrorCode::ProcessFailure, "The agent stopped producing output and was stopped" };

    auto detail = std::string {};
    if (round.finalResult && round.finalResult->isError)
        detail = round.finalResult->errorText();
    if (detail.empty())
        detail = std::string(lastStderrLine(exit.stderrTail));

    auto message = exit.signal ? std::format("The agent was terminated by signal {}", *exit.signal)
                               : std::format("The agent exited with code {}", exit.exitCode);
    if (!detail.empty())
        message += std::format(": {}", detail);
    return Error { ErrorCode::ProcessFailure, std::move(message) };
}

ResumptionEngine::ResumptionEngine(ResumeConfig config): _config(std::move(config))
{
}

auto ResumptionEngine::prepareSend(const Session& session, std::string prompt) const -> SpawnPlan
{
    auto plan = SpawnPlan {};
    plan.prompt = std::move(prompt);
    plan.systemPrompt = _config.systemPrompt;
    plan.workingDirectory = session.workingDirectory;
    if (session.externalResumeId && !session.invalidatedResumeIds.contains(*session.externalResumeId))
        plan.resumeId = session.externalResumeId;
    return plan;
}

auto ResumptionEngine::classify(const SpawnPlan& plan, const RoundResult& round) const -> ExitClassification
{
    auto const& exit = round.exit;
    if (exit.killed && !exit.stalled && !exit.timedOut)
        return ExitClassification::Cancelled;

    if (plan.resumeId)
    {
        auto const& marker = _config.resumeNotFoundMarker;
        auto const markerSeen =
            !marker.empty()
            && (exit.stderrTail.contains(marker) || round.unparsedOutput.contains(marker)
                || (round.finalResult && round.finalResult->isError
                    && round.finalResult->errorText().contains(marker)));
        if (markerSeen)
            return ExitClassification::ResumeNotFound;

        auto const exitCodeSuffices = !_config.requireMarker || marker.empty();
        if (exitCodeSuffices && !exit.signal && exit.exitCode == _config.resumeNotFoundExitCode)
            return ExitClassification::ResumeNotFound;
    }

    if (exit.success() && !(round.finalResult && round.finalResult->isError))
        return ExitClassification::Success;
    return ExitClassification::Failure;
}

auto ResumptionEngine::invalidate(Session& session) const -> std::string
{
    if (!session.externalResumeId)
        return {};

    auto invalidated = std::move(*session.externalResumeId);
    session.externalResumeId.reset();
    session.invalidatedResumeIds.insert(invalidated);
    log::info("Session {}: resume id {} is no longer valid", session.id, invalidated);
    return invalidated;
}

auto ResumptionEngine::installResumeId(Session& session, const std::string& resumeId) const -> bool
{
    if (resumeId.empty())
        return false;
    if (session.invalidatedResumeIds.contains(resumeId))
    {
        log::warning("Session {}: ignoring invalidated resume id {}", session.id, resumeId);
        return false;
    }
    if (session.externalResumeId == resumeId)
        return false;

    log::debug("Session {}: resume id {}", session.id, resumeId);
    session.externalResumeId = resumeId;
    return true;
}

auto ResumptionEngine::buildFreshPrompt(std::span<const MessageRecord> history, std::string_view prompt) const
    -> std::string
{
    if (_config.contextReplayMessages == 0)
        return std::string(prompt);

    auto lines = std::vector<std::string> {};
    for (auto it = history.rbegin(); it != history.rend() && lines.size() < _config.contextReplayMessages; ++it)
    {
        auto const& message = it->message;
        if (message.type != MessageType::User && message.type != MessageType::Assistant)
            continue;
        auto text = collapseWhitespace(message.text());
        if (text.empty())
            continue;
        lines.push_back(std::format("{}: {}",
                                    message.type == MessageType::User ? "User" : "Assistant",
                                    truncateUtf8(std::move(text), _config.contextReplayChars)));
    }

    if (lines.empty())
        return std::string(prompt);

    auto result = std::string { "[Context from the previous conversation, which could not be resumed]\n" };
    for (auto it = lines.rbegin(); it != lines.rend(); ++it)
    {
        result += *it;
        result += '\n';
    }
    result += "[End of context]\n\n";
    result += prompt;
    return result;
}

auto ResumptionEngine::send(Session& session,
                            const std::string& prompt,
                            AgentRunner& runner,
                            const SendHooks& hooks,
                            bool recordPrompt) const -> SendOutcome
{
    auto outcome = SendOutcome {};
    auto const transition = [&](SendState state) {
        outcome.state = state;
        log::debug("Session {}: send {}", session.id, sendStateToString(state));
        if (hooks.onStateChange)
            hooks.onStateChange(state);
    };
    auto const append = [&](StreamMessage message) {
        session.appendMessage(std::move(message));
        if (hooks.onMessage)
            hooks.onMessage(session, session.messages.back());
    };
    auto const commit = [&] {
        if (hooks.onCommit)
            hooks.onCommit(session);
    };

    auto const historyEnd = session.messages.size();
    if (recordPrompt)
        append(makeUserMessage(prompt));

    auto plan = prepareSend(session, prompt);
    auto freshStartUsed = false;

    while (true)
    {
        if (hooks.stopToken.stop_requested())
        {
            log::info("Session {}: send stopped before the next round", session.id);
            outcome.cancelled = true;
            transition(SendState::Failed);
            return outcome;
        }

        transition(SendState::Spawning);
        auto const observer = RoundObserver {
            .onSpawned = [&] { transition(SendState::Streaming); },
            .onMessage = append,
            .stopToken = hooks.stopToken,
        };

        auto round = runner.run(session.id, plan, observer);
        if (!round)
        {
            outcome.error = round.error();
            transition(SendState::Failed);
            return outcome;
        }
        outcome.round = *round;

        auto classification = classify(plan, *round);
        if (classification == ExitClassification::ResumeNotFound && freshStartUsed)
            classification = ExitClassification::Failure;

        switch (classification)
        {
            case ExitClassification::Success:
                if (round->resumeId && installResumeId(session, *round->resumeId))
                    commit();
                transition(SendState::Completed);
                return outcome;

            case ExitClassification::ResumeNotFound: {
                transition(SendState::ResumeInvalidated);
                outcome.resumeInvalidated = true;
                auto const invalidated = invalidate(session);
                commit();
                if (hooks.onResumeInvalidated)
                    hooks.onResumeInvalidated(session, invalidated);

                auto const history = std::span<const MessageRecord>(session.messages).first(historyEnd);
                plan = prepareSend(session, buildFreshPrompt(history, prompt));
                freshStartUsed = true;
                break;
            }

            case ExitClassification::Cancelled:
                log::info("Session {}: send stopped", session.id);
                outcome.cancelled = true;
                transition(SendState::Failed);
                return outcome;

            case ExitClassification::Failure:
                outcome.stalled = round->exit.stalled;
                outcome.error = describeRoundFailure(*round);
                log::warning("Session {}: send failed: {}", session.id, *outcome.error);
                transition(SendState::Failed);
                return outcome;
        }
    }
}

} // namespace agentlink
