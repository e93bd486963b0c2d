// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Time.hpp>
#include <session/Session.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentlink
{

/// @brief Durable session persistence, one JSON record file per session.
///
/// Records are written to a temporary file beside the target and renamed into place,
/// so a concurrent load() observes either the previous record or the new one, never
/// a partially written file.
class SessionStore
{
  public:
    /// @brief Creates a store rooted at @p directory (created on first save if missing).
    explicit SessionStore(std::filesystem::path directory, NowFunction now = systemNow());

    /// @brief Loads a session record.
    /// @return The session, or std::nullopt if the record is missing or cannot be decoded.
    [[nodiscard]] auto load(std::string_view id) const -> std::optional<Session>;

    /// @brief Writes the session record atomically. The record's savedAt is set to the write time.
    /// @return Success, or PersistenceFailure.
    [[nodiscard]] auto save(const Session& session) const -> VoidResult;

    /// @brief Lists the ids of all stored sessions, sorted.
    [[nodiscard]] auto list() const -> std::vector<std::string>;

    /// @brief Returns the file a session with @p id is stored in.
    [[nodiscard]] auto recordPath(std::string_view id) const -> std::filesystem::path;

    [[nodiscard]] auto directory() const -> const std::filesystem::path& { return _directory; }

  private:
    std::filesystem::path _directory;
    NowFunction _now;
};

} // namespace agentlink
