// SPDX-License-Identifier: Apache-2.0
#include "SessionRegistry.hpp"

#include <core/Log.hpp>

#include <format>
#include <utility>

namespace agentlink
{

SessionLease::SessionLease(SessionRegistry* registry, Session working, std::string operation):
    _registry(registry), _working(std::move(working)), _operation(std::move(operation))
{
}

SessionLease::SessionLease(SessionLease&& other) noexcept:
    _registry(std::exchange(other._registry, nullptr)),
    _working(std::move(other._working)),
    _operation(std::move(other._operation))
{
}

SessionLease& SessionLease::operator=(SessionLease&& other) noexcept
{
    if (this != &other)
    {
        release();
        _registry = std::exchange(other._registry, nullptr);
        _working = std::move(other._working);
        _operation = std::move(other._operation);
    }
    return *this;
}

SessionLease::~SessionLease()
{
    release();
}

void SessionLease::publish()
{
    if (_registry)
        _registry->publish(_working);
}

void SessionLease::release()
{
    if (!_registry)
        return;
    _registry->release(_working.id);
    _registry = nullptr;
}

auto SessionRegistry::insert(Session session) -> VoidResult
{
    auto lock = std::lock_guard(_mutex);
    if (_slots.contains(session.id))
        return makeError(ErrorCode::InvalidArgument, std::format("Session {} is already registered", session.id));
    auto id = session.id;
    _slots.emplace(std::move(id), Slot { .published = std::move(session), .owner = std::nullopt });
    return {};
}

auto SessionRegistry::contains(std::string_view id) const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return _slots.contains(id);
}

auto SessionRegistry::acquire(std::string_view id, std::string operation) -> Result<SessionLease>
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _slots.find(id);
    if (it == _slots.end())
        return makeError(ErrorCode::SessionNotFound, std::format("Unknown session {}", id));

    auto& slot = it->second;
    if (slot.owner)
        return makeError(ErrorCode::SessionBusy, std::format("Session {} is busy ({})", id, *slot.owner));

    slot.owner = operation;
    log::trace("Session {} acquired by {}", id, operation);
    return SessionLease(this, slot.published, std::move(operation));
}

auto SessionRegistry::snapshot(std::string_view id) const -> std::optional<Session>
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _slots.find(id);
    if (it == _slots.end())
        return std::nullopt;
    return it->second.published;
}

auto SessionRegistry::owner(std::string_view id) const -> std::optional<std::string>
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _slots.find(id);
    if (it == _slots.end())
        return std::nullopt;
    return it->second.owner;
}

auto SessionRegistry::ids() const -> std::vector<std::string>
{
    auto lock = std::lock_guard(_mutex);
    auto result = std::vector<std::string> {};
    result.reserve(_slots.size());
    for (const auto& [id, slot]: _slots)
        result.push_back(id);
    return result;
}

void SessionRegistry::publish(const Session& session)
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _slots.find(session.id);
    if (it != _slots.end())
        it->second.published = session;
}

void SessionRegistry::release(std::string_view id)
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _slots.find(id);
    if (it == _slots.end())
        return;
    log::trace("Session {} released by {}", id, it->second.owner.value_or("?"));
    it->second.owner.reset();
}

} // namespace agentlink
