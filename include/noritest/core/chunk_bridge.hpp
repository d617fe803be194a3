/**
 * @file chunk_bridge.hpp
 * @brief Push-to-pull adapter for asynchronously produced output
 *
 * Producers push items from any thread at any time; a single consumer pulls
 * them one at a time in FIFO order. Next() blocks only while the queue is
 * empty and the bridge is still open. Once Close() has been called and the
 * queue is drained, Next() returns std::nullopt forever.
 *
 * **Usage Example**:
 * @code
 * ChunkBridge<OutputChunk> bridge;
 *
 * std::thread producer([&] {
 *     bridge.Push({OutputOrigin::STDOUT, "hello\n"});
 *     bridge.Close();
 * });
 *
 * while (auto chunk = bridge.Next()) {
 *     std::cout << chunk->data;
 * }
 * producer.join();
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace noritest {
namespace core {

/**
 * @class ChunkBridge
 * @brief Unbounded single-consumer channel with an explicit closed state
 *
 * **Thread Safety**: Push() and Close() may be called from any number of
 * threads. Next() supports exactly one consumer; a second concurrent caller
 * gets std::logic_error.
 */
template <typename T>
class ChunkBridge {
public:
    ChunkBridge() = default;
    ChunkBridge(const ChunkBridge&) = delete;
    ChunkBridge& operator=(const ChunkBridge&) = delete;

    /**
     * @brief Append an item and wake the waiting consumer
     * @return false if the bridge is already closed (item dropped)
     */
    bool Push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            queue_.push_back(std::move(item));
        }
        available_.notify_one();
        return true;
    }

    /**
     * @brief Signal that the source has completed
     *
     * Items already queued remain available to Next().
     */
    void Close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        available_.notify_all();
    }

    /**
     * @brief Retrieve the next item, blocking while none is available
     * @return Next item, or std::nullopt once closed and drained
     */
    std::optional<T> Next() {
        std::unique_lock<std::mutex> lock(mutex_);
        if (waiting_) {
            throw std::logic_error("ChunkBridge supports a single consumer");
        }
        waiting_ = true;
        available_.wait(lock, [this] { return !queue_.empty() || closed_; });
        waiting_ = false;

        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop_front();
        return item;
    }

    bool IsClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    /// Items pushed but not yet consumed
    std::size_t Pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::deque<T> queue_;
    bool closed_{false};
    bool waiting_{false};
};

} // namespace core
} // namespace noritest
