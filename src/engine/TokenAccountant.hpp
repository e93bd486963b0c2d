// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <protocol/StreamMessage.hpp>
#include <session/Session.hpp>

#include <cstdint>
#include <string_view>

namespace agentlink
{

/// @brief Context window budget and compaction thresholds.
struct TokenConfig
{
    uint64_t maxTokens = 200000;

    /// @brief Usage ratio at which compaction is requested (may be deferred by cooldown).
    double autoThreshold = 0.96;

    /// @brief Usage ratio at which compaction must run before the next user send.
    double forceThreshold = 0.98;
};

/// @brief Where a session's usage stands relative to the thresholds.
enum class ThresholdLevel : std::uint8_t
{
    Below,
    Auto,
    Force,
};

[[nodiscard]] constexpr auto thresholdLevelToString(ThresholdLevel level) -> std::string_view
{
    switch (level)
    {
        case ThresholdLevel::Below: return "below";
        case ThresholdLevel::Auto: return "auto";
        case ThresholdLevel::Force: return "force";
    }
    return "below";
}

/// @brief Accumulates reported token usage and evaluates the compaction thresholds.
class TokenAccountant
{
  public:
    explicit TokenAccountant(TokenConfig config = {});

    /// @brief Applies one reported usage record to @p session.
    ///
    /// Usage is added field-wise, except when the session expects the baseline of a
    /// compaction round (CompactionState::replaceUsageOnNextResult), in which case it
    /// replaces the total and the flag is cleared. Crossing the auto threshold sets
    /// CompactionState::requested; crossing the force threshold also sets
    /// CompactionState::required.
    /// @return The threshold level after applying the usage.
    auto onResult(Session& session, const TokenUsage& usage) const -> ThresholdLevel;

    /// @brief Fraction of the context window in use (may exceed 1).
    [[nodiscard]] auto percentage(const Session& session) const -> double;

    [[nodiscard]] auto evaluate(const Session& session) const -> ThresholdLevel;

    [[nodiscard]] auto config() const -> const TokenConfig& { return _config; }

  private:
    TokenConfig _config;
};

} // namespace agentlink
