// SPDX-License-Identifier: Apache-2.0
#include "ProcessSupervisor.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <format>
#include <iterator>

namespace agentlink
{

namespace
{

    using SteadyClock = std::chrono::steady_clock;

    /// Last line of a stderr chunk, for log output.
    auto lastLine(std::string_view text) -> std::string_view
    {
        while (!text.empty() && (text.back() == '\n' || text.back() == '\r'))
            text.remove_suffix(1);
        auto const newline = text.rfind('\n');
        return newline == std::string_view::npos ? text : text.substr(newline + 1);
    }

} // namespace

auto buildArguments(const SpawnPlan& plan, const CliFlags& flags) -> std::vector<std::string>
{
    auto args = std::vector<std::string> {};
    if (plan.resumeId)
    {
        args.push_back(flags.resumeFlag);
        args.push_back(*plan.resumeId);
    }
    args.push_back(flags.promptFlag);
    args.push_back(plan.prompt);
    if (!flags.model.empty())
    {
        args.push_back(flags.modelFlag);
        args.push_back(flags.model);
    }
    args.insert(args.end(), flags.outputArgs.begin(), flags.outputArgs.end());
    if (plan.systemPrompt && !plan.systemPrompt->empty() && !flags.systemPromptFlag.empty())
    {
        args.push_back(flags.systemPromptFlag);
        args.push_back(*plan.systemPrompt);
    }
    args.insert(args.end(), flags.extraArgs.begin(), flags.extraArgs.end());
    return args;
}

ProcessHandle::ProcessHandle(PrivateTag,
                             uint64_t id,
                             std::string sessionId,
                             std::unique_ptr<Subprocess> process,
                             PathTranslator translator,
                             bool resumed):
    _id(id),
    _sessionId(std::move(sessionId)),
    _spawnedAt(Clock::now()),
    _process(std::move(process)),
    _translator(std::move(translator)),
    _resumed(resumed)
{
}

ProcessSupervisor::ProcessSupervisor(ExecutableLocator& locator, SupervisorConfig config):
    _locator(locator), _config(std::move(config))
{
}

ProcessSupervisor::~ProcessSupervisor()
{
    killAll();

    auto readers = std::vector<std::pair<ProcessHandlePtr, std::jthread>> {};
    {
        auto lock = std::lock_guard(_mutex);
        readers.swap(_readers);
    }
    for (auto& [handle, thread]: readers)
    {
        if (thread.joinable())
            thread.join();
    }
}

auto ProcessSupervisor::translator() -> Result<PathTranslator>
{
    auto resolved = _locator.resolve();
    if (!resolved)
        return std::unexpected(resolved.error());

    auto pathConfig = _config.paths;
    pathConfig.mode = _config.pathMode.value_or(resolved->pathNamespace);
    return PathTranslator(std::move(pathConfig));
}

auto ProcessSupervisor::spawn(const std::string& sessionId, const SpawnPlan& plan) -> Result<ProcessHandlePtr>
{
    reapReaders();

    {
        auto lock = std::lock_guard(_mutex);
        if (_live.contains(sessionId))
            return makeError(ErrorCode::SessionBusy,
                             std::format("Session {} already owns a running agent process", sessionId));
        // Reserve the slot while spawning.
        _live.emplace(sessionId, nullptr);
    }

    auto const releaseSlot = [this, &sessionId] {
        auto lock = std::lock_guard(_mutex);
        _live.erase(sessionId);
    };

    auto resolved = _locator.resolve();
    if (!resolved)
    {
        releaseSlot();
        return std::unexpected(resolved.error());
    }

    auto pathConfig = _config.paths;
    pathConfig.mode = _config.pathMode.value_or(resolved->pathNamespace);
    auto translator = PathTranslator(std::move(pathConfig));

    auto subprocessConfig = SubprocessConfig {
        .program = resolved->program,
        .args = {},
        .workingDirectory = std::nullopt,
        .env = _config.env,
    };
    if (!plan.workingDirectory.empty())
    {
        auto const directory = translator.toSubprocessPath(plan.workingDirectory);
        if (resolved->workingDirectoryFlag)
        {
            subprocessConfig.args.push_back(*resolved->workingDirectoryFlag);
            subprocessConfig.args.push_back(directory);
        }
        else
        {
            subprocessConfig.workingDirectory = directory;
        }
    }
    auto& args = subprocessConfig.args;
    args.insert(args.end(), resolved->prefixArgs.begin(), resolved->prefixArgs.end());
    auto agentArgs = buildArguments(plan, _config.flags);
    args.insert(args.end(), agentArgs.begin(), agentArgs.end());

    auto process = Subprocess::spawn(subprocessConfig);
    if (!process)
    {
        releaseSlot();
        log::error("Failed to start agent for session {}: {}", sessionId, process.error());
        return std::unexpected(process.error());
    }

    auto lock = std::lock_guard(_mutex);
    auto handle = std::make_shared<ProcessHandle>(ProcessHandle::PrivateTag {},
                                                  _nextHandleId++,
                                                  sessionId,
                                                  std::move(*process),
                                                  std::move(translator),
                                                  plan.resumeId.has_value());
    _live[sessionId] = handle;
    _readers.emplace_back(handle, std::jthread([this, handle] { readLoop(handle); }));

    log::info("Started agent for session {} (pid {}, {}{})",
              sessionId,
              handle->pid(),
              plan.resumeId ? "resuming " : "fresh",
              plan.resumeId.value_or(""));
    return handle;
}

void ProcessSupervisor::readLoop(const ProcessHandlePtr& handle)
{
    auto& process = *handle->_process;
    auto stderrTail = std::string {};
    auto lastActivity = SteadyClock::now();
    auto exitInfo = std::optional<ExitInfo> {};
    auto drainDeadline = SteadyClock::time_point {};

    while (true)
    {
        auto chunk = process.read(_config.pollInterval);
        if (!chunk)
        {
            log::error("Reading output of session {} failed: {}", handle->sessionId(), chunk.error());
            break;
        }

        auto const now = SteadyClock::now();
        if (!chunk->output.empty())
        {
            lastActivity = now;
            handle->_events.push(ProcessEvent { .kind = ProcessEventKind::Output,
                                                .data = std::move(chunk->output),
                                                .exit = {} });
        }
        if (!chunk->errors.empty())
        {
            lastActivity = now;
            log::debug("[{}] stderr: {}", handle->sessionId(), lastLine(chunk->errors));
            stderrTail += chunk->errors;
            if (stderrTail.size() > _config.stderrTailBytes)
                stderrTail.erase(0, stderrTail.size() - _config.stderrTailBytes);
        }
        if (chunk->outputClosed && chunk->errorsClosed)
            break;

        if (!exitInfo)
        {
            exitInfo = process.tryWait();
            if (exitInfo)
                drainDeadline = now + _config.exitDrainTimeout;
        }
        else if (now >= drainDeadline)
        {
            log::debug("Descendants of session {} keep its pipes open, killing them", handle->sessionId());
            process.forceKill();
            break;
        }

        if (!exitInfo && !handle->_stalled && now - lastActivity >= _config.stallTimeout)
        {
            handle->_stalled = true;
            log::warning("Agent for session {} produced no output for {}, marking it stalled",
                         handle->sessionId(),
                         std::chrono::duration_cast<std::chrono::seconds>(now - lastActivity));
            handle->_events.push(ProcessEvent { .kind = ProcessEventKind::Stalled, .data = {}, .exit = {} });
        }
    }

    if (!exitInfo)
        exitInfo = process.waitFor(_config.killGrace);
    if (!exitInfo)
        exitInfo = process.stop(_config.killGrace);

    finish(handle,
           ExitStatus {
               .exitCode = exitInfo->exitCode,
               .signal = exitInfo->signal,
               .killed = handle->_killRequested.load(),
               .stalled = handle->_stalled.load(),
               .timedOut = false,
               .resumed = handle->_resumed,
               .stderrTail = std::move(stderrTail),
           });
}

void ProcessSupervisor::finish(const ProcessHandlePtr& handle, ExitStatus status)
{
    {
        auto lock = std::lock_guard(_mutex);
        auto const it = _live.find(handle->sessionId());
        if (it != _live.end() && it->second == handle)
            _live.erase(it);
    }

    log::info("Agent for session {} exited with code {}{}{}",
              handle->sessionId(),
              status.exitCode,
              status.killed ? " (killed)" : "",
              status.stalled ? " (stalled)" : "");

    auto callbacks = std::vector<ProcessHandle::ExitCallback> {};
    {
        auto lock = std::lock_guard(handle->_exitMutex);
        handle->_exitStatus = status;
        handle->_finished = true;
        callbacks.swap(handle->_exitCallbacks);
    }

    handle->_events.push(ProcessEvent { .kind = ProcessEventKind::Exited, .data = {}, .exit = status });
    handle->_events.close();

    for (const auto& callback: callbacks)
        callback(status);
}

void ProcessSupervisor::kill(const ProcessHandlePtr& handle)
{
    if (!handle || handle->hasExited())
        return;
    if (handle->_killRequested.exchange(true))
        return;

    log::info("Stopping agent for session {} (pid {})", handle->sessionId(), handle->pid());
    auto const exit = handle->_process->stop(_config.killGrace);
    log::debug("Agent for session {} stopped with code {}", handle->sessionId(), exit.exitCode);
}

void ProcessSupervisor::onExit(const ProcessHandlePtr& handle, ProcessHandle::ExitCallback callback)
{
    auto status = std::optional<ExitStatus> {};
    {
        auto lock = std::lock_guard(handle->_exitMutex);
        if (!handle->_exitStatus)
        {
            handle->_exitCallbacks.push_back(std::move(callback));
            return;
        }
        status = handle->_exitStatus;
    }
    callback(*status);
}

auto ProcessSupervisor::find(std::string_view sessionId) const -> ProcessHandlePtr
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _live.find(sessionId);
    if (it == _live.end())
        return nullptr;
    return it->second;
}

void ProcessSupervisor::killAll()
{
    auto handles = std::vector<ProcessHandlePtr> {};
    {
        auto lock = std::lock_guard(_mutex);
        for (const auto& [sessionId, handle]: _live)
        {
            if (handle)
                handles.push_back(handle);
        }
    }
    for (const auto& handle: handles)
        kill(handle);
}

auto ProcessSupervisor::liveCount() const -> size_t
{
    auto lock = std::lock_guard(_mutex);
    return static_cast<size_t>(
        std::ranges::count_if(_live, [](const auto& entry) { return entry.second != nullptr; }));
}

void ProcessSupervisor::reapReaders()
{
    auto finished = std::vector<std::pair<ProcessHandlePtr, std::jthread>> {};
    {
        auto lock = std::lock_guard(_mutex);
        auto const split =
            std::ranges::partition(_readers, [](const auto& entry) { return !entry.first->hasExited(); });
        std::move(split.begin(), split.end(), std::back_inserter(finished));
        _readers.erase(split.begin(), split.end());
    }
    for (auto& [handle, thread]: finished)
    {
        if (thread.joinable())
            thread.join();
    }
}

} // namespace agentlink
