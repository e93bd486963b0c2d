// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <session/Session.hpp>
#include <session/SessionStore.hpp>

#include <chrono>
#include <memory>
#include <string_view>

namespace agentlink
{

/// @brief Retry policy for SessionWriter.
struct SessionWriterConfig
{
    /// @brief Delay before the first retry of a failed write; doubled per consecutive failure.
    std::chrono::milliseconds retryBaseDelay { 250 };

    /// @brief Upper bound for the retry delay.
    std::chrono::milliseconds retryMaxDelay { 5000 };
};

/// @brief Asynchronous, per-session "latest snapshot wins" writer in front of a SessionStore.
///
/// enqueue() never blocks on disk I/O. Each session has a single pending slot: a newer
/// snapshot replaces an older one that has not been written yet, and a single worker
/// thread performs all writes, so an earlier snapshot can never land after a later one.
/// Failed writes are retried with bounded exponential backoff unless superseded.
class SessionWriter
{
  public:
    explicit SessionWriter(const SessionStore& store, SessionWriterConfig config = {});
    ~SessionWriter();

    SessionWriter(const SessionWriter&) = delete;
    SessionWriter& operator=(const SessionWriter&) = delete;

    /// @brief Schedules @p snapshot to be written.
    void enqueue(Session snapshot);

    /// @brief Blocks until every snapshot pending at call time has been written or has
    /// failed at least once since the call. Retry backoff is skipped for these attempts.
    void flush();

    /// @brief Whether session @p id has a snapshot that has not reached disk yet.
    [[nodiscard]] auto isDirty(std::string_view id) const -> bool;

    /// @brief Number of write attempts that failed since construction.
    [[nodiscard]] auto failedWrites() const -> size_t;

    /// @brief Makes a final attempt for every pending snapshot and stops the worker.
    void shutdown();

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace agentlink
