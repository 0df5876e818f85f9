#pragma once

#include <queue>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <chrono>

/// @brief Closable producer/consumer queue
/// The producer pushes items and finally calls close(); consumers drain the
/// remaining items and then observe the close as an empty optional.
template<typename T>
class ThreadQueue {
public:
    /// @return false if the queue was already closed (item dropped)
    bool push(T item) {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed) {
            return false;
        }
        queue.push(std::move(item));
        cv.notify_one();
        return true;
    }

    std::optional<T> pop() {
        std::lock_guard<std::mutex> lock(mutex);
        if (queue.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue.front());
        queue.pop();
        return item;
    }

    /// @brief Block until an item arrives or the queue is closed and drained
    std::optional<T> wait_and_pop() {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [this] { return !queue.empty() || closed; });
        if (queue.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue.front());
        queue.pop();
        return item;
    }

    template<typename Rep, typename Period>
    std::optional<T> wait_for_and_pop(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex);
        if (!cv.wait_for(lock, timeout, [this] { return !queue.empty() || closed; })) {
            return std::nullopt;
        }
        if (queue.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue.front());
        queue.pop();
        return item;
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex);
        closed = true;
        cv.notify_all();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex);
        return closed;
    }

    /// @brief Closed and nothing left to consume
    bool drained() const {
        std::lock_guard<std::mutex> lock(mutex);
        return closed && queue.empty();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex);
        return queue.empty();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex);
        return queue.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex);
        while (!queue.empty()) {
            queue.pop();
        }
    }

private:
    std::queue<T> queue;
    mutable std::mutex mutex;
    std::condition_variable cv;
    bool closed = false;
};
