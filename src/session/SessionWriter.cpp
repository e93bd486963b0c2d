// SPDX-License-Identifier: Apache-2.0
#include "SessionWriter.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace agentlink
{

namespace
{

    using SteadyClock = std::chrono::steady_clock;

    struct PendingWrite
    {
        Session snapshot;
        int failures = 0;
        SteadyClock::time_point notBefore {};

        /// Flush epoch in which this snapshot was last attempted (0 = never).
        uint64_t attemptedEpoch = 0;
    };

} // namespace

struct SessionWriter::Impl
{
    const SessionStore& store;
    SessionWriterConfig config;

    mutable std::mutex mutex;
    std::condition_variable_any cv;
    std::map<std::string, PendingWrite, std::less<>> pending;
    std::optional<std::string> writing;
    uint64_t flushEpoch = 0;
    size_t failedWrites = 0;
    bool shutdownRequested = false;
    std::jthread worker;

    Impl(const SessionStore& store, SessionWriterConfig config): store(store), config(config) {}

    [[nodiscard]] auto backoff(int failures) const -> std::chrono::milliseconds
    {
        auto delay = config.retryBaseDelay;
        for (int i = 1; i < failures && delay < config.retryMaxDelay; ++i)
            delay *= 2;
        return std::min(delay, config.retryMaxDelay);
    }

    [[nodiscard]] auto isDue(const PendingWrite& entry, SteadyClock::time_point now) const -> bool
    {
        return entry.attemptedEpoch < flushEpoch || entry.notBefore <= now;
    }

    /// Picks the next due entry. Must be called with the mutex held.
    [[nodiscard]] auto nextDue(SteadyClock::time_point now) -> decltype(pending)::iterator
    {
        auto best = pending.end();
        for (auto it = pending.begin(); it != pending.end(); ++it)
        {
            if (!isDue(it->second, now))
                continue;
            if (best == pending.end() || it->second.notBefore < best->second.notBefore)
                best = it;
        }
        return best;
    }

    [[nodiscard]] auto earliestRetry() const -> std::optional<SteadyClock::time_point>
    {
        auto earliest = std::optional<SteadyClock::time_point> {};
        for (const auto& [id, entry]: pending)
        {
            if (!earliest || entry.notBefore < *earliest)
                earliest = entry.notBefore;
        }
        return earliest;
    }

    void run(const std::stop_token& stopToken)
    {
        auto lock = std::unique_lock(mutex);
        while (true)
        {
            if (shutdownRequested || stopToken.stop_requested())
                break;

            auto const now = SteadyClock::now();
            auto it = nextDue(now);
            if (it == pending.end())
            {
                auto const wakeAt = earliestRetry();
                auto const wake = [this] {
                    return shutdownRequested || std::ranges::any_of(pending, [this](const auto& entry) {
                               return isDue(entry.second, SteadyClock::now());
                           });
                };
                if (wakeAt)
                    cv.wait_until(lock, stopToken, *wakeAt, wake);
                else
                    cv.wait(lock, stopToken, wake);
                continue;
            }

            writeOne(lock, it);
        }

        // Final attempt for whatever is still pending.
        while (!pending.empty())
            writeOne(lock, pending.begin(), /*final=*/true);
        cv.notify_all();
    }

    /// Writes one pending entry with the mutex released during I/O.
    void writeOne(std::unique_lock<std::mutex>& lock, decltype(pending)::iterator it, bool final = false)
    {
        auto const id = it->first;
        auto entry = std::move(it->second);
        pending.erase(it);
        entry.attemptedEpoch = flushEpoch;
        writing = id;

        lock.unlock();
        auto const result = store.save(entry.snapshot);
        lock.lock();

        writing.reset();
        if (!result)
        {
            ++failedWrites;
            ++entry.failures;
            if (pending.contains(id))
            {
                log::debug("Write of session {} failed but a newer snapshot is queued: {}", id, result.error());
            }
            else if (final)
            {
                log::error("Giving up writing session {}: {}", id, result.error());
            }
            else
            {
                auto const delay = backoff(entry.failures);
                log::warning("Write of session {} failed (attempt {}), retrying in {}: {}",
                             id,
                             entry.failures,
                             delay,
                             result.error());
                entry.notBefore = SteadyClock::now() + delay;
                pending.emplace(id, std::move(entry));
            }
        }
        else if (entry.failures > 0)
        {
            log::info("Session {} written after {} failed attempt(s)", id, entry.failures);
        }
        cv.notify_all();
    }

    [[nodiscard]] auto flushDone(uint64_t epoch) const -> bool
    {
        if (writing)
            return false;
        return std::ranges::all_of(pending,
                                   [epoch](const auto& entry) { return entry.second.attemptedEpoch >= epoch; });
    }
};

SessionWriter::SessionWriter(const SessionStore& store, SessionWriterConfig config):
    _impl(std::make_unique<Impl>(store, config))
{
    _impl->worker = std::jthread([this](const std::stop_token& token) { _impl->run(token); });
}

SessionWriter::~SessionWriter()
{
    shutdown();
}

void SessionWriter::enqueue(Session snapshot)
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        if (_impl->shutdownRequested)
        {
            log::warning("Session writer stopped, dropping snapshot of session {}", snapshot.id);
            return;
        }
        auto id = snapshot.id;
        _impl->pending.insert_or_assign(std::move(id), PendingWrite { .snapshot = std::move(snapshot) });
    }
    _impl->cv.notify_all();
}

void SessionWriter::flush()
{
    auto lock = std::unique_lock(_impl->mutex);
    if (_impl->pending.empty() && !_impl->writing)
        return;
    auto const epoch = ++_impl->flushEpoch;
    _impl->cv.notify_all();
    _impl->cv.wait(lock, [this, epoch] { return _impl->flushDone(epoch); });
}

auto SessionWriter::isDirty(std::string_view id) const -> bool
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->pending.contains(id) || (_impl->writing && *_impl->writing == id);
}

auto SessionWriter::failedWrites() const -> size_t
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->failedWrites;
}

void SessionWriter::shutdown()
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        if (_impl->shutdownRequested)
            return;
        _impl->shutdownRequested = true;
    }
    _impl->cv.notify_all();
    if (_impl->worker.joinable())
        _impl->worker.join();
}

} // namespace agentlink
