// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <protocol/StreamMessage.hpp>

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace agentlink
{

/// @brief Configuration for StreamParser.
struct StreamParserConfig
{
    /// @brief Lines longer than this are discarded instead of buffered.
    size_t maxLineBytes = 16 * 1024 * 1024;
};

/// @brief Receives each decoded message, in input order.
using MessageCallback = std::function<void(StreamMessage message)>;

/// @brief Receives the text of each line that was dropped because it is not a stream message.
using UnparsedLineCallback = std::function<void(std::string_view line)>;

/// @brief Incremental newline-delimited JSON decoder.
///
/// Bytes are appended with feed(); every complete line is decoded independently and
/// handed to the callback exactly once, in input order. The trailing incomplete segment
/// stays buffered until its newline arrives, so chunks may split a JSON object or a
/// UTF-8 sequence anywhere (a newline byte never occurs inside a multi-byte sequence).
/// Lines that fail to decode are dropped with a diagnostic and do not affect later lines.
class StreamParser
{
  public:
    explicit StreamParser(MessageCallback callback, StreamParserConfig config = {});

    /// @brief Installs a handler for non-empty lines that do not decode (plain-text diagnostics
    /// some agent versions print to stdout). Over-long lines are not passed on.
    void setUnparsedLineHandler(UnparsedLineCallback handler) { _unparsedLineHandler = std::move(handler); }

    /// @brief Appends a chunk of output to the parser.
    void feed(std::string_view chunk);

    /// @brief Decodes a final line that was not newline-terminated (end of stream).
    void finish();

    /// @brief Discards any buffered partial line.
    void reset();

    /// @brief Number of bytes buffered for the current incomplete line.
    [[nodiscard]] auto pendingBytes() const -> size_t { return _buffer.size(); }

    /// @brief Number of lines dropped because they could not be decoded.
    [[nodiscard]] auto droppedLines() const -> size_t { return _droppedLines; }

    /// @brief Number of messages delivered to the callback.
    [[nodiscard]] auto decodedMessages() const -> size_t { return _decodedMessages; }

  private:
    void processLine(std::string_view line);

    void dropLine(std::string_view line);

    MessageCallback _callback;
    UnparsedLineCallback _unparsedLineHandler;
    StreamParserConfig _config;
    std::string _buffer;
    bool _discardingLine = false;
    size_t _droppedLines = 0;
    size_t _decodedMessages = 0;
};

} // namespace agentlink
