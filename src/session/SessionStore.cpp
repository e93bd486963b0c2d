// SPDX-License-Identifier: Apache-2.0
#include "SessionStore.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <atomic>
#include <format>
#include <fstream>
#include <sstream>

namespace agentlink
{

namespace
{

    constexpr auto RecordExtension = std::string_view { ".json" };

    /// Maps a session id onto a safe file name stem.
    auto sanitizeFileStem(std::string_view id) -> std::string
    {
        auto out = std::string {};
        out.reserve(id.size());
        for (char const ch: id)
        {
            if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') || ch == '-'
                || ch == '_')
                out.push_back(ch);
            else
                out.push_back('_');
        }
        if (out.empty())
            out = "_";
        return out;
    }

    auto nextTempSuffix() -> uint64_t
    {
        static auto counter = std::atomic<uint64_t> { 0 };
        return ++counter;
    }

} // namespace

SessionStore::SessionStore(std::filesystem::path directory, NowFunction now):
    _directory(std::move(directory)), _now(std::move(now))
{
}

auto SessionStore::recordPath(std::string_view id) const -> std::filesystem::path
{
    return _directory / (sanitizeFileStem(id) + std::string(RecordExtension));
}

auto SessionStore::load(std::string_view id) const -> std::optional<Session>
{
    auto const path = recordPath(id);
    auto file = std::ifstream(path, std::ios::binary);
    if (!file)
    {
        log::debug("No stored record for session {}", id);
        return std::nullopt;
    }

    auto buffer = std::stringstream {};
    buffer << file.rdbuf();

    auto parsed = json::parse(buffer.str());
    if (!parsed)
    {
        log::warning("Ignoring corrupt session record {}: {}", path.string(), parsed.error().message);
        return std::nullopt;
    }

    auto session = sessionFromJson(*parsed);
    if (!session)
    {
        log::warning("Ignoring invalid session record {}: {}", path.string(), session.error().message);
        return std::nullopt;
    }

    if (session->id != id)
    {
        log::warning("Session record {} belongs to session {}, expected {}", path.string(), session->id, id);
        return std::nullopt;
    }

    return std::move(*session);
}

auto SessionStore::save(const Session& session) const -> VoidResult
{
    if (session.id.empty())
        return makeError(ErrorCode::PersistenceFailure, "Cannot save a session without an id");

    auto ec = std::error_code {};
    std::filesystem::create_directories(_directory, ec);
    if (ec)
        return makeError(ErrorCode::PersistenceFailure,
                         std::format("Failed to create session directory {}: {}", _directory.string(), ec.message()));

    auto record = sessionToJson(session);
    record["savedAt"] = toEpochMillis(_now());

    auto const target = recordPath(session.id);
    auto tmp = target;
    tmp += std::format(".tmp{}", nextTempSuffix());

    {
        auto file = std::ofstream(tmp, std::ios::binary | std::ios::trunc);
        if (!file)
            return makeError(ErrorCode::PersistenceFailure,
                             std::format("Failed to open {} for writing", tmp.string()));
        file << record.dump(2) << '\n';
        file.close();
        if (!file)
        {
            std::filesystem::remove(tmp, ec);
            return makeError(ErrorCode::PersistenceFailure, std::format("Failed writing {}", tmp.string()));
        }
    }

    std::filesystem::rename(tmp, target, ec);
    if (ec)
    {
        auto removeEc = std::error_code {};
        std::filesystem::remove(tmp, removeEc);
        return makeError(ErrorCode::PersistenceFailure,
                         std::format("Failed replacing {}: {}", target.string(), ec.message()));
    }

    log::trace("Saved session {} to {}", session.id, target.string());
    return {};
}

auto SessionStore::list() const -> std::vector<std::string>
{
    auto ids = std::vector<std::string> {};
    auto ec = std::error_code {};
    auto it = std::filesystem::directory_iterator(_directory, ec);
    if (ec)
        return ids;

    for (const auto& entry: it)
    {
        if (!entry.is_regular_file(ec))
            continue;
        auto const& path = entry.path();
        if (path.extension() != RecordExtension)
            continue;
        ids.push_back(path.stem().string());
    }

    std::ranges::sort(ids);
    return ids;
}

} // namespace agentlink
