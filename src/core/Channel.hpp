// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace agentlink
{

/// @brief Multi-producer, multi-consumer FIFO channel.
///
/// Values are delivered in the order they were pushed. After close(), pushes are
/// rejected and consumers drain the remaining values before receiving std::nullopt.
template <typename T>
class Channel
{
  public:
    Channel() = default;

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /// @brief Appends a value to the channel.
    /// @return false if the channel is already closed (the value is discarded).
    auto push(T value) -> bool
    {
        {
            auto lock = std::lock_guard(_mutex);
            if (_closed)
                return false;
            _queue.push_back(std::move(value));
        }
        _cv.notify_one();
        return true;
    }

    /// @brief Blocks until a value is available or the channel is closed and drained.
    [[nodiscard]] auto pop() -> std::optional<T>
    {
        auto lock = std::unique_lock(_mutex);
        _cv.wait(lock, [this] { return !_queue.empty() || _closed; });
        return takeFront();
    }

    /// @brief Like pop(), but gives up after @p timeout.
    template <typename Rep, typename Period>
    [[nodiscard]] auto popFor(std::chrono::duration<Rep, Period> timeout) -> std::optional<T>
    {
        auto lock = std::unique_lock(_mutex);
        _cv.wait_for(lock, timeout, [this] { return !_queue.empty() || _closed; });
        return takeFront();
    }

    /// @brief Returns the next value without blocking, if any.
    [[nodiscard]] auto tryPop() -> std::optional<T>
    {
        auto lock = std::lock_guard(_mutex);
        return takeFront();
    }

    /// @brief Closes the channel and wakes all waiting consumers.
    void close()
    {
        {
            auto lock = std::lock_guard(_mutex);
            _closed = true;
        }
        _cv.notify_all();
    }

    [[nodiscard]] auto isClosed() const -> bool
    {
        auto lock = std::lock_guard(_mutex);
        return _closed;
    }

    [[nodiscard]] auto size() const -> size_t
    {
        auto lock = std::lock_guard(_mutex);
        return _queue.size();
    }

  private:
    auto takeFront() -> std::optional<T>
    {
        if (_queue.empty())
            return std::nullopt;
        auto value = std::move(_queue.front());
        _queue.pop_front();
        return value;
    }

    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::deque<T> _queue;
    bool _closed = false;
};

} // namespace agentlink
