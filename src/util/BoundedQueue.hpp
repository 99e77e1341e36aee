#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <utility>

namespace hashflow {

/**
 * @brief Blocking FIFO with a fixed capacity and a close signal
 *
 * Producers block while the queue is full, consumers block while it is
 * empty. close() wakes everyone: further pushes fail immediately, pops keep
 * draining what is left and then report end of stream.
 *
 * Used both as the reader -> hasher chunk hand-off and as the scheduler's
 * multiplexed event stream. A failed push is how a producer learns that
 * nobody is listening any more.
 */
template <typename T>
class BoundedQueue {
public:
    /// Predicate polled while a push is blocked; returning true abandons the push
    using AbandonFn = std::function<bool()>;

    explicit BoundedQueue(size_t capacity) : cap(capacity == 0 ? 1 : capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /// Block until there is room; false if the queue is (or becomes) closed
    bool push(T item) {
        std::unique_lock<std::mutex> lock(mtx);
        notFull.wait(lock, [this] { return closed || items.size() < cap; });
        if (closed) return false;
        items.push_back(std::move(item));
        notEmpty.notify_one();
        return true;
    }

    /**
     * @brief Blocking push that also gives up when abandon() turns true
     *
     * abandon() is re-checked every pollInterval, so a producer parked on a
     * full queue notices cancellation within that bound.
     */
    bool push(T item, const AbandonFn& abandon,
              std::chrono::milliseconds pollInterval = std::chrono::milliseconds(20)) {
        std::unique_lock<std::mutex> lock(mtx);
        while (!closed && items.size() >= cap) {
            if (abandon && abandon()) return false;
            notFull.wait_for(lock, pollInterval);
        }
        if (closed || (abandon && abandon())) return false;
        items.push_back(std::move(item));
        notEmpty.notify_one();
        return true;
    }

    /// Block until an item arrives; nullopt once closed and drained
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mtx);
        notEmpty.wait(lock, [this] { return closed || !items.empty(); });
        return takeFront();
    }

    /// Like pop() but gives up after timeout (nullopt on timeout too)
    std::optional<T> popFor(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mtx);
        notEmpty.wait_for(lock, timeout, [this] { return closed || !items.empty(); });
        return takeFront();
    }

    void close() {
        {
            std::scoped_lock lock(mtx);
            closed = true;
        }
        notFull.notify_all();
        notEmpty.notify_all();
    }

    size_t capacity() const { return cap; }

private:
    // Caller holds the lock
    std::optional<T> takeFront() {
        if (items.empty()) return std::nullopt;
        std::optional<T> out(std::move(items.front()));
        items.pop_front();
        notFull.notify_one();
        return out;
    }

    const size_t cap;
    std::deque<T> items;
    bool closed{false};
    std::mutex mtx;
    std::condition_variable notFull;
    std::condition_variable notEmpty;
};

}
