#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace scanning
{

// Bounded FIFO between any number of producer threads and one consumer.
// send() blocks while the buffer is full, so nothing is ever dropped.
// After close() further sends fail, blocked senders wake up and fail, and
// the consumer can still drain whatever was queued before the close.
template <typename T>
class EventChannel {
public:
    explicit EventChannel(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    bool send(T item) {
        std::unique_lock<std::mutex> lock(m_);
        not_full_.wait(lock, [&] { return closed_ || q_.size() < capacity_; });
        if (closed_)
            return false;
        q_.push_back(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    // Blocks until an item arrives or the channel is closed and empty.
    std::optional<T> receive() {
        std::unique_lock<std::mutex> lock(m_);
        not_empty_.wait(lock, [&] { return closed_ || !q_.empty(); });
        return popLocked();
    }

    template <typename Rep, typename Period>
    std::optional<T> receive_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(m_);
        not_empty_.wait_for(lock, timeout, [&] { return closed_ || !q_.empty(); });
        return popLocked();
    }

    std::optional<T> try_receive() {
        std::lock_guard<std::mutex> lock(m_);
        return popLocked();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(m_);
            closed_ = true;
        }
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    // Closed and fully drained: no item will ever be received again.
    bool finished() const {
        std::lock_guard<std::mutex> lock(m_);
        return closed_ && q_.empty();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(m_);
        return closed_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(m_);
        return q_.size();
    }

    std::size_t capacity() const { return capacity_; }

private:
    std::optional<T> popLocked() {
        if (q_.empty())
            return std::nullopt;
        std::optional<T> item(std::move(q_.front()));
        q_.pop_front();
        not_full_.notify_one();
        return item;
    }

    const std::size_t capacity_;
    mutable std::mutex m_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::deque<T> q_;
    bool closed_ = false;
};

} // namespace scanning
