// SPDX-License-Identifier: Apache-2.0
#include "StreamParser.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>

namespace agentlink
{

namespace
{

    auto isBlank(std::string_view line) -> bool
    {
        return std::ranges::all_of(line, [](char c) { return c == ' ' || c == '\t' || c == '\r'; });
    }

    /// Shortened copy of a line for diagnostics.
    auto preview(std::string_view line) -> std::string_view
    {
        constexpr auto maxPreview = size_t { 120 };
        return line.substr(0, std::min(line.size(), maxPreview));
    }

} // namespace

StreamParser::StreamParser(MessageCallback callback, StreamParserConfig config):
    _callback(std::move(callback)), _config(config)
{
}

void StreamParser::feed(std::string_view chunk)
{
    while (!chunk.empty())
    {
        auto const newline = chunk.find('\n');
        auto const segment = chunk.substr(0, newline);

        if (_discardingLine)
        {
            if (newline == std::string_view::npos)
                return;
            _discardingLine = false;
            chunk.remove_prefix(newline + 1);
            continue;
        }

        if (_buffer.size() + segment.size() > _config.maxLineBytes)
        {
            log::warning("Dropping stream line exceeding {} bytes", _config.maxLineBytes);
            ++_droppedLines;
            _buffer.clear();
            if (newline == std::string_view::npos)
            {
                _discardingLine = true;
                return;
            }
            chunk.remove_prefix(newline + 1);
            continue;
        }

        _buffer.append(segment);
        if (newline == std::string_view::npos)
            return;

        chunk.remove_prefix(newline + 1);
        auto line = std::string {};
        line.swap(_buffer);
        processLine(line);
    }
}

void StreamParser::finish()
{
    _discardingLine = false;
    if (_buffer.empty())
        return;

    auto line = std::string {};
    line.swap(_buffer);
    processLine(line);
}

void StreamParser::reset()
{
    _buffer.clear();
    _discardingLine = false;
}

void StreamParser::processLine(std::string_view line)
{
    if (line.ends_with('\r'))
        line.remove_suffix(1);

    if (isBlank(line))
        return;

    if (line == "$")
    {
        log::trace("Ignoring legacy end-of-stream marker");
        return;
    }

    auto parsed = json::parse(line);
    if (!parsed)
    {
        log::warning("Dropping malformed stream line ({}): {}", parsed.error().message, preview(line));
        dropLine(line);
        return;
    }

    auto message = decodeStreamMessage(std::move(*parsed));
    if (!message)
    {
        log::warning("Dropping undecodable stream line ({}): {}", message.error().message, preview(line));
        dropLine(line);
        return;
    }

    ++_decodedMessages;
    if (_callback)
        _callback(std::move(*message));
}

void StreamParser::dropLine(std::string_view line)
{
    ++_droppedLines;
    if (_unparsedLineHandler)
        _unparsedLineHandler(line);
}

} // namespace agentlink
