// SPDX-License-Identifier: Apache-2.0
#include "TokenAccountant.hpp"

#include <core/Log.hpp>

namespace agentlink
{

TokenAccountant::TokenAccountant(TokenConfig config): _config(config)
{
}

auto TokenAccountant::onResult(Session& session, const TokenUsage& usage) const -> ThresholdLevel
{
    if (session.compaction.replaceUsageOnNextResult)
    {
        log::debug("Session {}: usage baseline reset to {} tokens", session.id, usage.total());
        session.tokenUsage = usage;
        session.compaction.replaceUsageOnNextResult = false;
    }
    else
    {
        session.tokenUsage += usage;
    }

    auto const level = evaluate(session);
    if (level != ThresholdLevel::Below && !session.compaction.requested)
    {
        log::info("Session {} uses {:.1f}% of its context, requesting compaction",
                  session.id,
                  percentage(session) * 100.0);
        session.compaction.requested = true;
    }
    if (level == ThresholdLevel::Force && !session.compaction.required)
    {
        log::warning("Session {} crossed the force threshold, compaction required before the next send", session.id);
        session.compaction.required = true;
    }
    return level;
}

auto TokenAccountant::percentage(const Session& session) const -> double
{
    if (_config.maxTokens == 0)
        return 0.0;
    return static_cast<double>(session.tokenUsage.total()) / static_cast<double>(_config.maxTokens);
}

auto TokenAccountant::evaluate(const Session& session) const -> ThresholdLevel
{
    auto const ratio = percentage(session);
    if (ratio >= _config.forceThreshold)
        return ThresholdLevel::Force;
    if (ratio >= _config.autoThreshold)
        return ThresholdLevel::Auto;
    return ThresholdLevel::Below;
}

} // namespace agentlink
