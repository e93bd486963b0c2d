// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <session/Session.hpp>

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentlink
{

class SessionRegistry;

/// @brief Exclusive write access to one registered session.
///
/// The lease owns a working copy of the session. Changes become visible to
/// SessionRegistry::snapshot() readers only through publish(). Destroying the lease
/// releases ownership without publishing.
class SessionLease
{
  public:
    SessionLease(SessionLease&& other) noexcept;
    SessionLease& operator=(SessionLease&& other) noexcept;
    SessionLease(const SessionLease&) = delete;
    SessionLease& operator=(const SessionLease&) = delete;
    ~SessionLease();

    [[nodiscard]] auto session() -> Session& { return _working; }
    [[nodiscard]] auto session() const -> const Session& { return _working; }
    [[nodiscard]] auto operation() const -> const std::string& { return _operation; }

    /// @brief Makes the working copy the published state of the session.
    void publish();

    /// @brief Releases ownership early. The lease is empty afterwards.
    void release();

  private:
    friend class SessionRegistry;
    SessionLease(SessionRegistry* registry, Session working, std::string operation);

    SessionRegistry* _registry = nullptr;
    Session _working;
    std::string _operation;
};

/// @brief In-memory registry of sessions keyed by id, with single-writer-per-key access.
class SessionRegistry
{
  public:
    /// @brief Registers a session.
    /// @return InvalidArgument if a session with the same id is already registered.
    [[nodiscard]] auto insert(Session session) -> VoidResult;

    [[nodiscard]] auto contains(std::string_view id) const -> bool;

    /// @brief Takes exclusive ownership of session @p id for @p operation.
    /// @return The lease, SessionNotFound, or SessionBusy if another operation owns it.
    [[nodiscard]] auto acquire(std::string_view id, std::string operation) -> Result<SessionLease>;

    /// @brief Returns a copy of the last published state of session @p id.
    [[nodiscard]] auto snapshot(std::string_view id) const -> std::optional<Session>;

    /// @brief Name of the operation currently owning session @p id, if any.
    [[nodiscard]] auto owner(std::string_view id) const -> std::optional<std::string>;

    /// @brief Ids of all registered sessions, sorted.
    [[nodiscard]] auto ids() const -> std::vector<std::string>;

  private:
    friend class SessionLease;

    struct Slot
    {
        Session published;
        std::optional<std::string> owner;
    };

    void publish(const Session& session);
    void release(std::string_view id);

    mutable std::mutex _mutex;
    std::map<std::string, Slot, std::less<>> _slots;
};

} // namespace agentlink
