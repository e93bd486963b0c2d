// SPDX-License-Identifier: Apache-2.0
#include "ConversationManager.hpp"

#include <core/Log.hpp>
#include <session/SessionRegistry.hpp>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <format>
#include <map>
#include <mutex>
#include <stop_token>
#include <thread>

namespace agentlink
{

namespace
{

    constexpr auto SendOperation = "send";
    constexpr auto CompactionOperation = "compaction";

    struct Operation
    {
        std::atomic<bool> finished = false;
        std::jthread thread;
    };

} // namespace

struct ConversationManager::Impl
{
    Impl(const SessionStore& store, AgentRunner& runner, ConversationManagerConfig config, NowFunction now):
        store(store),
        runner(runner),
        config(std::move(config)),
        accountant(this->config.tokens),
        resumption(this->config.resume),
        compaction(runner, accountant, resumption, this->config.compaction, std::move(now)),
        writer(store, this->config.writer)
    {
    }

    const SessionStore& store;
    AgentRunner& runner;
    ConversationManagerConfig config;
    TokenAccountant accountant;
    ResumptionEngine resumption;
    CompactionCoordinator compaction;
    SessionWriter writer;
    SessionRegistry registry;
    Channel<CoreEvent> events;

    // Orders stop() against the start of a compaction round and guards sendStops.
    std::mutex controlMutex;
    std::map<std::string, std::stop_source, std::less<>> sendStops;
    std::atomic<size_t> queuedWrites = 0;

    std::mutex operationMutex;
    std::condition_variable_any operationsIdle;
    std::vector<std::unique_ptr<Operation>> operations;
    size_t activeOperations = 0;
    std::atomic<bool> shuttingDown = false;

    std::jthread maintenanceThread;

    void startMaintenance()
    {
        if (config.maintenanceInterval <= std::chrono::milliseconds::zero())
            return;

        maintenanceThread = std::jthread([this](std::stop_token stopToken) {
            auto mutex = std::mutex {};
            auto cv = std::condition_variable_any {};
            auto lock = std::unique_lock(mutex);
            while (!stopToken.stop_requested())
            {
                cv.wait_for(lock, stopToken, config.maintenanceInterval, [] { return false; });
                if (stopToken.stop_requested())
                    break;
                runMaintenance();
            }
        });
    }

    void emit(CoreEvent event)
    {
        log::trace("Session {}: event {}", event.sessionId, coreEventKindToString(event.kind));
        events.push(std::move(event));
    }

    void emitTokenUpdate(const Session& session)
    {
        emit(CoreEvent {
            .kind = CoreEventKind::TokenUpdate,
            .sessionId = session.id,
            .tokenUsage = session.tokenUsage,
            .percentage = accountant.percentage(session),
        });
    }

    void commit(SessionLease& lease)
    {
        lease.publish();
        writer.enqueue(lease.session());
        ++queuedWrites;
    }

    void setStatus(SessionLease& lease, SessionStatus status)
    {
        auto& session = lease.session();
        if (session.status == status)
            return;
        log::debug("Session {}: {} -> {}",
                   session.id,
                   sessionStatusToString(session.status),
                   sessionStatusToString(status));
        session.status = status;
        lease.publish();
        emit(CoreEvent { .kind = CoreEventKind::StatusChanged, .sessionId = session.id, .status = status });
    }

    auto ensureLoaded(std::string_view id) -> VoidResult
    {
        if (registry.contains(id))
            return {};

        auto session = store.load(id);
        if (!session)
            return makeError(ErrorCode::SessionNotFound, std::format("Session {} not found", id));

        log::info("Loaded session {} ({} messages, {} tokens)",
                  session->id,
                  session->messages.size(),
                  session->tokenUsage.total());
        if (auto inserted = registry.insert(std::move(*session)); !inserted && !registry.contains(id))
            return inserted;
        return {};
    }

    /// Runs @p body on an operation thread. The body must release its lease before returning.
    template <typename Body>
    auto launch(Body body) -> bool
    {
        reapOperations();

        auto lock = std::lock_guard(operationMutex);
        if (shuttingDown)
            return false;

        auto operation = std::make_unique<Operation>();
        auto* raw = operation.get();
        ++activeOperations;
        raw->thread = std::jthread([this, raw, body = std::move(body)]() mutable {
            body();
            {
                auto guard = std::lock_guard(operationMutex);
                --activeOperations;
                raw->finished = true;
            }
            operationsIdle.notify_all();
        });
        operations.push_back(std::move(operation));
        return true;
    }

    void reapOperations()
    {
        auto finished = std::vector<std::unique_ptr<Operation>> {};
        {
            auto lock = std::lock_guard(operationMutex);
            auto const split = std::ranges::partition(operations, [](const auto& op) { return !op->finished; });
            std::move(split.begin(), split.end(), std::back_inserter(finished));
            operations.erase(split.begin(), split.end());
        }
        // Joined on destruction.
    }

    void runCompaction(SessionLease& lease, bool force)
    {
        auto& session = lease.session();
        if (shuttingDown)
            return;

        auto const wasExhausted = compaction.isExhausted(session);
        auto const hooks = CompactionHooks {
            .onStart =
                [&](Session& current) {
                    {
                        auto lock = std::lock_guard(controlMutex);
                        setStatus(lease, SessionStatus::Compacting);
                    }
                    emit(CoreEvent {
                        .kind = CoreEventKind::CompactionStart,
                        .sessionId = current.id,
                        .tokenUsage = current.tokenUsage,
                        .percentage = accountant.percentage(current),
                    });
                },
            .onResumeInvalidated =
                [&](Session& current, const std::string& invalidated) {
                    emit(CoreEvent {
                        .kind = CoreEventKind::ResumeInvalidated, .sessionId = current.id, .detail = invalidated });
                },
        };

        auto const outcome = compaction.requestCompaction(session, force, hooks);
        switch (outcome.kind)
        {
            case CompactionOutcomeKind::Completed:
                emit(CoreEvent {
                    .kind = CoreEventKind::CompactionComplete,
                    .sessionId = session.id,
                    .tokenUsage = session.tokenUsage,
                    .percentage = accountant.percentage(session),
                });
                emitTokenUpdate(session);
                break;
            case CompactionOutcomeKind::Exhausted:
                if (!wasExhausted)
                {
                    emit(CoreEvent {
                        .kind = CoreEventKind::CompactionExhausted,
                        .sessionId = session.id,
                        .tokenUsage = session.tokenUsage,
                        .percentage = accountant.percentage(session),
                        .error = outcome.error,
                        .detail = "Compaction is disabled for this session; the context may overflow",
                    });
                }
                break;
            case CompactionOutcomeKind::Failed:
            case CompactionOutcomeKind::Deferred:
            case CompactionOutcomeKind::NotNeeded: break;
        }

        if (outcome.ran)
            setStatus(lease, SessionStatus::Idle);
        commit(lease);
    }

    /// @p resend marks a repeated send of a prompt that is already in the history.
    void runSend(SessionLease& lease, const std::string& text, std::stop_token stopToken, bool resend)
    {
        auto& session = lease.session();
        if (session.compaction.required && !compaction.isExhausted(session))
        {
            log::info("Session {}: compacting before the next send", session.id);
            runCompaction(lease, true);
        }

        setStatus(lease, SessionStatus::Streaming);

        auto lastPublish = std::chrono::steady_clock::now();
        auto const hooks = SendHooks {
            .onMessage =
                [&](Session& current, const MessageRecord& record) {
                    emit(CoreEvent { .kind = CoreEventKind::Message, .sessionId = current.id, .message = record });
                    auto const now = std::chrono::steady_clock::now();
                    if (record.message.type == MessageType::Result)
                    {
                        if (record.message.usage)
                        {
                            accountant.onResult(current, *record.message.usage);
                            emitTokenUpdate(current);
                        }
                        commit(lease);
                        lastPublish = now;
                    }
                    else if (now - lastPublish >= config.publishInterval)
                    {
                        lease.publish();
                        lastPublish = now;
                    }
                },
            .onResumeInvalidated =
                [&](Session& current, const std::string& invalidated) {
                    emit(CoreEvent {
                        .kind = CoreEventKind::ResumeInvalidated, .sessionId = current.id, .detail = invalidated });
                },
            .onCommit = [&](Session&) { commit(lease); },
            .stopToken = stopToken,
        };

        auto const outcome = resumption.send(session, text, runner, hooks, !resend);
        if (outcome.succeeded() || outcome.cancelled)
        {
            setStatus(lease, SessionStatus::Idle);
        }
        else
        {
            auto error =
                outcome.error.value_or(Error { ErrorCode::ProcessFailure, "The agent round failed" });
            emit(CoreEvent { .kind = CoreEventKind::ProcessError, .sessionId = session.id, .error = error });
            setStatus(lease, SessionStatus::Error);
        }
        commit(lease);

        if (shuttingDown)
            return;

        if (outcome.stalled && config.retryOnStall && !resend && !stopToken.stop_requested())
        {
            log::info("Session {}: sending the prompt again after a stall", session.id);
            runSend(lease, text, stopToken, true);
            return;
        }

        if (compaction.dueForCompaction(session))
            runCompaction(lease, false);
    }

    void runMaintenance()
    {
        for (const auto& id: registry.ids())
        {
            if (shuttingDown)
                return;

            auto const current = registry.snapshot(id);
            if (!current || !compaction.dueForCompaction(*current))
                continue;

            auto lease = registry.acquire(id, CompactionOperation);
            if (!lease)
                continue;
            if (!compaction.dueForCompaction(lease->session()))
                continue;

            log::debug("Session {}: running deferred compaction", id);
            launch([this, lease = std::move(*lease)]() mutable {
                runCompaction(lease, false);
                lease.release();
            });
        }
    }

    void waitForOperations()
    {
        auto lock = std::unique_lock(operationMutex);
        operationsIdle.wait(lock, [&] { return activeOperations == 0; });
    }

    void shutdown()
    {
        if (shuttingDown.exchange(true))
            return;

        log::debug("Shutting down conversation manager");
        if (maintenanceThread.joinable())
        {
            maintenanceThread.request_stop();
            maintenanceThread.join();
        }

        // An operation may spawn a new round between kills, so keep killing until all are gone.
        auto lock = std::unique_lock(operationMutex);
        while (activeOperations > 0)
        {
            lock.unlock();
            runner.cancelAll();
            lock.lock();
            operationsIdle.wait_for(lock, std::chrono::milliseconds(100), [&] { return activeOperations == 0; });
        }
        auto finished = std::move(operations);
        lock.unlock();
        finished.clear();

        writer.flush();
        writer.shutdown();
        events.close();
    }
};

ConversationManager::ConversationManager(const SessionStore& store,
                                         AgentRunner& runner,
                                         ConversationManagerConfig config,
                                         NowFunction now):
    _impl(std::make_unique<Impl>(store, runner, std::move(config), std::move(now)))
{
    _impl->startMaintenance();
}

ConversationManager::~ConversationManager()
{
    _impl->shutdown();
}

auto ConversationManager::createSession(std::string workingDirectory) -> Result<std::string>
{
    if (workingDirectory.empty())
        return makeError(ErrorCode::InvalidArgument, "A session needs a working directory");

    auto session = makeSession(std::move(workingDirectory));
    auto id = session.id;
    _impl->writer.enqueue(session);
    ++_impl->queuedWrites;
    if (auto inserted = _impl->registry.insert(std::move(session)); !inserted)
        return std::unexpected(inserted.error());

    log::info("Created session {}", id);
    return id;
}

auto ConversationManager::selectSession(std::string_view id) -> Result<Session>
{
    if (auto loaded = _impl->ensureLoaded(id); !loaded)
        return std::unexpected(loaded.error());

    auto session = _impl->registry.snapshot(id);
    if (!session)
        return makeError(ErrorCode::SessionNotFound, std::format("Session {} not found", id));
    return std::move(*session);
}

auto ConversationManager::send(std::string_view id, std::string text) -> VoidResult
{
    if (text.empty())
        return makeError(ErrorCode::InvalidArgument, "Cannot send an empty message");
    if (_impl->shuttingDown)
        return makeError(ErrorCode::InvalidArgument, "The conversation manager is shutting down");
    if (auto loaded = _impl->ensureLoaded(id); !loaded)
        return loaded;

    auto lease = _impl->registry.acquire(id, SendOperation);
    if (!lease)
        return std::unexpected(lease.error());

    auto stopSource = std::stop_source {};
    {
        auto lock = std::lock_guard(_impl->controlMutex);
        _impl->sendStops.insert_or_assign(std::string(id), stopSource);
    }

    auto const started = _impl->launch([impl = _impl.get(),
                                        lease = std::move(*lease),
                                        text = std::move(text),
                                        stopToken = stopSource.get_token()]() mutable {
        impl->runSend(lease, text, stopToken, false);
        {
            auto lock = std::lock_guard(impl->controlMutex);
            impl->sendStops.erase(lease.session().id);
        }
        lease.release();
    });
    if (!started)
    {
        auto lock = std::lock_guard(_impl->controlMutex);
        _impl->sendStops.erase(id);
        return makeError(ErrorCode::InvalidArgument, "The conversation manager is shutting down");
    }
    return {};
}

auto ConversationManager::stop(std::string_view id) -> VoidResult
{
    auto lock = std::lock_guard(_impl->controlMutex);
    auto const current = _impl->registry.snapshot(id);
    if (!current)
        return makeError(ErrorCode::SessionNotFound, std::format("Session {} not found", id));

    if (current->status == SessionStatus::Compacting)
    {
        log::info("Session {}: ignoring stop while compaction is running", id);
        return {};
    }
    if (!_impl->registry.owner(id))
    {
        log::debug("Session {}: nothing to stop", id);
        return {};
    }

    log::info("Session {}: stopping the agent", id);
    if (auto const it = _impl->sendStops.find(id); it != _impl->sendStops.end())
        it->second.request_stop();
    _impl->runner.cancel(std::string(id));
    return {};
}

auto ConversationManager::listSessions() const -> std::vector<std::string>
{
    auto ids = _impl->store.list();
    std::ranges::copy(_impl->registry.ids(), std::back_inserter(ids));
    std::ranges::sort(ids);
    auto const duplicates = std::ranges::unique(ids);
    ids.erase(duplicates.begin(), duplicates.end());
    return ids;
}

auto ConversationManager::snapshot(std::string_view id) const -> std::optional<Session>
{
    return _impl->registry.snapshot(id);
}

auto ConversationManager::percentage(const Session& session) const -> double
{
    return _impl->accountant.percentage(session);
}

auto ConversationManager::events() -> Channel<CoreEvent>&
{
    return _impl->events;
}

auto ConversationManager::queuedWrites() const -> size_t
{
    return _impl->queuedWrites.load();
}

void ConversationManager::runMaintenance()
{
    _impl->runMaintenance();
}

void ConversationManager::waitForOperations()
{
    _impl->waitForOperations();
}

void ConversationManager::shutdown()
{
    _impl->shutdown();
}

} // namespace agentlink
